#ifndef FLOW_TABLE_HPP
#define FLOW_TABLE_HPP

#include "flow_key.hpp"
#include <memory>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <sys/time.h>

constexpr double DEFAULT_FLOW_TIMEOUT_SECONDS = 600.0;
constexpr size_t DEFAULT_EVICTION_THRESHOLD = 1000;
constexpr size_t DEFAULT_SHARD_COUNT = 16;

// per-packet input to the table, built by the extractor from parsed headers
struct PacketInfo {
    uint32_t src_ip;
    uint32_t dst_ip;
    uint16_t src_port;
    uint16_t dst_port;
    uint8_t protocol;
    uint32_t packet_length;
    uint8_t tcp_flags;
    bool has_tcp_flags;   // false when the TCP header did not parse

    PacketInfo() : src_ip(0), dst_ip(0), src_port(0), dst_port(0),
                   protocol(0), packet_length(0), tcp_flags(0), has_tcp_flags(false) {}
};

// Online mean/variance (Welford) plus min, max and sum. Replaces the
// per-flow sample history with O(1) state and yields the same results.
class RunningStats {
private:
    uint64_t count_;
    double mean_;
    double m2_;
    double min_;
    double max_;
    double sum_;

public:
    RunningStats() : count_(0), mean_(0.0), m2_(0.0), min_(0.0), max_(0.0), sum_(0.0) {}

    void add(double value);

    uint64_t count() const { return count_; }
    bool empty() const { return count_ == 0; }
    double mean() const { return mean_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double sum() const { return sum_; }

    // sample variance (n - 1 divisor), 0 for fewer than two samples
    double variance() const;
    double std_dev() const;
};

struct FlowState {
    // identity, fixed by the first packet of the flow
    uint32_t src_ip;
    uint32_t dst_ip;
    uint16_t src_port;
    uint16_t dst_port;
    uint8_t protocol;

    struct timeval start_time;
    struct timeval last_packet_time;

    uint64_t packet_count;
    uint64_t byte_count;

    RunningStats packet_lengths;        // count() == packet_count
    RunningStats inter_arrival_times;   // seconds, count() == packet_count - 1

    uint8_t tcp_flags_union;

    FlowState() : src_ip(0), dst_ip(0), src_port(0), dst_port(0), protocol(0),
                  start_time{}, last_packet_time{}, packet_count(0), byte_count(0),
                  tcp_flags_union(0) {}
};

// Owns every FlowState. Flows are spread over shards by the top bits of their
// key and each shard is guarded by its own mutex, so updates to one flow are
// serialized while unrelated flows proceed in parallel.
class FlowTable {
private:
    struct Shard {
        std::mutex mutex;
        std::unordered_map<FlowKey, FlowState, FlowKeyHash> flows;
    };

    std::vector<std::unique_ptr<Shard>> shards_;
    unsigned shard_bits_;
    std::atomic<size_t> flow_count_{0};

    std::atomic<uint64_t> flows_created_{0};
    std::atomic<uint64_t> flows_evicted_{0};
    std::atomic<uint64_t> updates_{0};

public:
    explicit FlowTable(size_t shard_count = DEFAULT_SHARD_COUNT);
    ~FlowTable() = default;

    FlowTable(const FlowTable&) = delete;
    FlowTable& operator=(const FlowTable&) = delete;

    // Attributes one packet to its flow, creating the flow on first sight.
    // Returns a copy of the state as it stands right after this update; the
    // copy is consistent even while other threads keep updating the table.
    FlowState upsert(const FlowKey& key, const PacketInfo& packet, const struct timeval& arrival_time);

    // removes flows with now - last_packet_time > timeout_seconds
    size_t evict_idle(const struct timeval& now, double timeout_seconds);

    // removes every flow, returns how many were held
    size_t drain();

    bool lookup(const FlowKey& key, FlowState& state_out) const;
    bool contains(const FlowKey& key) const;

    size_t size() const { return flow_count_.load(); }
    size_t get_shard_count() const { return shards_.size(); }
    uint64_t get_flows_created() const { return flows_created_.load(); }
    uint64_t get_flows_evicted() const { return flows_evicted_.load(); }
    uint64_t get_updates() const { return updates_.load(); }

    void print_stats() const;

private:
    Shard& shard_for(const FlowKey& key) const;
};

// utility functions
double calculate_time_diff_seconds(const struct timeval& start, const struct timeval& end);
bool timeval_less(const struct timeval& a, const struct timeval& b);
struct timeval seconds_to_timeval(double seconds);

#endif // FLOW_TABLE_HPP
