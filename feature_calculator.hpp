#ifndef FEATURE_CALCULATOR_HPP
#define FEATURE_CALCULATOR_HPP

#include "flow_table.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

constexpr double MIN_FLOW_DURATION_SECONDS = 1e-6;
constexpr const char* DEFAULT_FLOW_LABEL = "BENIGN";

// Flat feature record emitted once per analyzed packet. Field names match
// the keys of the JSON encoding.
struct FeatureRecord {
    std::string src_ip;
    std::string dst_ip;
    uint16_t src_port;
    uint16_t dst_port;
    uint8_t protocol;

    double flow_duration;             // seconds, floored at 1e-6

    uint64_t total_fwd_packets;
    uint64_t total_bwd_packets;       // no directional attribution, always 0
    uint64_t total_length_fwd_packets;
    uint64_t total_length_bwd_packets;

    double packet_length_max;
    double packet_length_min;
    double packet_length_mean;
    double packet_length_std;
    double packet_length_variance;

    double flow_bytes_per_second;
    double flow_packets_per_second;

    double flow_iat_mean;
    double flow_iat_std;
    double flow_iat_max;
    double flow_iat_min;

    uint8_t tcp_flags;                // cumulative union, 0 for non-TCP
    uint32_t fin_flag_count;
    uint32_t syn_flag_count;
    uint32_t rst_flag_count;
    uint32_t psh_flag_count;
    uint32_t ack_flag_count;
    uint32_t urg_flag_count;

    double avg_packet_size;

    int64_t timestamp;                // wall clock, microseconds
    std::string label;

    FeatureRecord() : src_port(0), dst_port(0), protocol(0), flow_duration(0.0),
                      total_fwd_packets(0), total_bwd_packets(0),
                      total_length_fwd_packets(0), total_length_bwd_packets(0),
                      packet_length_max(0.0), packet_length_min(0.0),
                      packet_length_mean(0.0), packet_length_std(0.0),
                      packet_length_variance(0.0), flow_bytes_per_second(0.0),
                      flow_packets_per_second(0.0), flow_iat_mean(0.0), flow_iat_std(0.0),
                      flow_iat_max(0.0), flow_iat_min(0.0), tcp_flags(0),
                      fin_flag_count(0), syn_flag_count(0), rst_flag_count(0),
                      psh_flag_count(0), ack_flag_count(0), urg_flag_count(0),
                      avg_packet_size(0.0), timestamp(0), label(DEFAULT_FLOW_LABEL) {}

    nlohmann::ordered_json to_json() const;

    // "{src_ip}:{src_port}-{dst_ip}:{dst_port}", used to partition the sink
    std::string message_key() const;
};

// Derives the feature record of a flow. The caller guarantees
// state.packet_count >= 1.
FeatureRecord compute_flow_features(const FlowState& state);

int64_t current_time_microseconds();
void print_feature_record(const FeatureRecord& record);

#endif // FEATURE_CALCULATOR_HPP
