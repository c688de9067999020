#include "flow_table.hpp"
#include "packet_parser.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

double calculate_time_diff_seconds(const struct timeval& start, const struct timeval& end) {
    return (end.tv_sec - start.tv_sec) + (end.tv_usec - start.tv_usec) / 1000000.0;
}

bool timeval_less(const struct timeval& a, const struct timeval& b) {
    return a.tv_sec < b.tv_sec || (a.tv_sec == b.tv_sec && a.tv_usec < b.tv_usec);
}

struct timeval seconds_to_timeval(double seconds) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(std::floor(seconds));
    tv.tv_usec = static_cast<suseconds_t>(std::llround((seconds - std::floor(seconds)) * 1000000.0));
    if(tv.tv_usec >= 1000000) {
        tv.tv_sec += 1;
        tv.tv_usec -= 1000000;
    }
    return tv;
}

void RunningStats::add(double value) {
    count_++;
    if(count_ == 1) {
        min_ = value;
        max_ = value;
    } else {
        if(value < min_) min_ = value;
        if(value > max_) max_ = value;
    }

    double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (value - mean_);
    sum_ += value;
}

double RunningStats::variance() const {
    if(count_ < 2) return 0.0;
    return m2_ / static_cast<double>(count_ - 1);
}

double RunningStats::std_dev() const {
    return std::sqrt(variance());
}

FlowTable::FlowTable(size_t shard_count) : shard_bits_(0) {
    if(shard_count == 0 || (shard_count & (shard_count - 1)) != 0) {
        throw std::invalid_argument("FlowTable shard count must be a power of two, got " +
                                    std::to_string(shard_count));
    }

    while((static_cast<size_t>(1) << shard_bits_) < shard_count) {
        shard_bits_++;
    }

    shards_.reserve(shard_count);
    for(size_t i = 0; i < shard_count; i++) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

FlowTable::Shard& FlowTable::shard_for(const FlowKey& key) const {
    if(shard_bits_ == 0) {
        return *shards_[0];
    }
    size_t index = static_cast<size_t>(key.value >> (64 - shard_bits_));
    return *shards_[index];
}

FlowState FlowTable::upsert(const FlowKey& key, const PacketInfo& packet, const struct timeval& arrival_time) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.flows.find(key);
    if(it == shard.flows.end()) {
        FlowState fresh;
        fresh.src_ip = packet.src_ip;
        fresh.dst_ip = packet.dst_ip;
        fresh.src_port = packet.src_port;
        fresh.dst_port = packet.dst_port;
        fresh.protocol = packet.protocol;
        fresh.start_time = arrival_time;
        fresh.last_packet_time = arrival_time;

        it = shard.flows.emplace(key, fresh).first;
        flow_count_++;
        flows_created_++;
    }

    FlowState& flow = it->second;

    // a timestamp behind the flow's clock counts as simultaneous
    struct timeval effective_time = arrival_time;
    if(timeval_less(effective_time, flow.last_packet_time)) {
        effective_time = flow.last_packet_time;
    }

    flow.packet_count++;
    flow.byte_count += packet.packet_length;
    flow.packet_lengths.add(static_cast<double>(packet.packet_length));

    if(flow.packet_count > 1) {
        flow.inter_arrival_times.add(calculate_time_diff_seconds(flow.last_packet_time, effective_time));
    }
    flow.last_packet_time = effective_time;

    if(flow.protocol == PROTO_TCP && packet.has_tcp_flags) {
        flow.tcp_flags_union |= packet.tcp_flags;
    }

    updates_++;
    return flow;
}

size_t FlowTable::evict_idle(const struct timeval& now, double timeout_seconds) {
    size_t removed = 0;

    for(auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for(auto it = shard->flows.begin(); it != shard->flows.end(); ) {
            if(calculate_time_diff_seconds(it->second.last_packet_time, now) > timeout_seconds) {
                it = shard->flows.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    flow_count_ -= removed;
    flows_evicted_ += removed;
    return removed;
}

size_t FlowTable::drain() {
    size_t removed = 0;

    for(auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += shard->flows.size();
        shard->flows.clear();
    }

    flow_count_ -= removed;
    return removed;
}

bool FlowTable::lookup(const FlowKey& key, FlowState& state_out) const {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.flows.find(key);
    if(it == shard.flows.end()) {
        return false;
    }
    state_out = it->second;
    return true;
}

bool FlowTable::contains(const FlowKey& key) const {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.flows.find(key) != shard.flows.end();
}

void FlowTable::print_stats() const {
    std::cout << "\n=== Flow Table Statistics ===\n";
    std::cout << "Shards: " << shards_.size() << "\n";
    std::cout << "Active Flows: " << flow_count_.load() << "\n";
    std::cout << "Flows Created: " << flows_created_.load() << "\n";
    std::cout << "Flows Evicted: " << flows_evicted_.load() << "\n";
    std::cout << "Packet Updates: " << updates_.load() << "\n";
    std::cout << "=============================\n";
}
