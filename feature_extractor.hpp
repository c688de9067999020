#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "packet_parser.hpp"
#include "flow_table.hpp"
#include "feature_calculator.hpp"
#include "config.hpp"
#include <memory>
#include <atomic>

// Per-packet pipeline: parse -> key -> update table -> compute features.
// extract() may be called from several capture threads at once; the flow
// table serializes updates that belong to the same flow.
class FeatureExtractor {
private:
    ExtractorConfig config_;
    std::unique_ptr<FlowTable> flow_table_;

    // statistics
    std::atomic<uint64_t> packets_seen_{0};
    std::atomic<uint64_t> records_emitted_{0};
    std::atomic<uint64_t> non_ipv4_packets_{0};
    std::atomic<uint64_t> malformed_packets_{0};
    std::atomic<uint64_t> transport_fallbacks_{0};
    std::atomic<uint64_t> processing_errors_{0};
    std::atomic<uint64_t> eviction_sweeps_{0};

public:
    explicit FeatureExtractor(const ExtractorConfig& config = ExtractorConfig());
    ~FeatureExtractor() = default;

    // disable copy constructor and assignment
    FeatureExtractor(const FeatureExtractor&) = delete;
    FeatureExtractor& operator=(const FeatureExtractor&) = delete;

    // Returns true and fills record_out when the packet was attributed to a
    // flow. Non-IPv4, truncated or otherwise unusable packets return false;
    // no failure ever escapes this call.
    bool extract(const RawPacket& packet, FeatureRecord& record_out);

    // Header decoding only, no table access. Safe to run in parallel.
    bool decode_packet(const RawPacket& packet, PacketInfo& info_out);

    // sweeps flows idle for longer than the configured timeout
    size_t evict_idle(const struct timeval& now);

    // explicit shutdown step, drops every tracked flow
    size_t drain();

    const FlowTable& get_flow_table() const { return *flow_table_; }

    uint64_t get_packets_seen() const { return packets_seen_.load(); }
    uint64_t get_records_emitted() const { return records_emitted_.load(); }
    uint64_t get_non_ipv4_packets() const { return non_ipv4_packets_.load(); }
    uint64_t get_malformed_packets() const { return malformed_packets_.load(); }
    uint64_t get_transport_fallbacks() const { return transport_fallbacks_.load(); }
    uint64_t get_processing_errors() const { return processing_errors_.load(); }

    void print_stats() const;
};

#endif // FEATURE_EXTRACTOR_HPP
