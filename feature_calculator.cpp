#include "feature_calculator.hpp"
#include "packet_parser.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sys/time.h>

int64_t current_time_microseconds() {
    struct timeval now;
    gettimeofday(&now, nullptr);
    return static_cast<int64_t>(now.tv_sec) * 1000000 + now.tv_usec;
}

static uint32_t flag_indicator(uint8_t flags_union, uint8_t flag) {
    return (flags_union & flag) ? 1 : 0;
}

FeatureRecord compute_flow_features(const FlowState& state) {
    FeatureRecord record;

    record.src_ip = ipv4_to_string(state.src_ip);
    record.dst_ip = ipv4_to_string(state.dst_ip);
    record.src_port = state.src_port;
    record.dst_port = state.dst_port;
    record.protocol = state.protocol;

    // timing
    double duration = calculate_time_diff_seconds(state.start_time, state.last_packet_time);
    record.flow_duration = std::max(duration, MIN_FLOW_DURATION_SECONDS);

    // totals
    record.total_fwd_packets = state.packet_count;
    record.total_bwd_packets = 0;
    record.total_length_fwd_packets = state.byte_count;
    record.total_length_bwd_packets = 0;

    // packet length statistics
    if(!state.packet_lengths.empty()) {
        record.packet_length_max = state.packet_lengths.max();
        record.packet_length_min = state.packet_lengths.min();
        record.packet_length_mean = state.packet_lengths.mean();
        record.packet_length_std = state.packet_lengths.std_dev();
    }
    record.packet_length_variance = record.packet_length_std * record.packet_length_std;
    record.avg_packet_size = record.packet_length_mean;

    // rates
    record.flow_bytes_per_second = static_cast<double>(state.byte_count) / record.flow_duration;
    record.flow_packets_per_second = static_cast<double>(state.packet_count) / record.flow_duration;

    // inter-arrival times
    if(!state.inter_arrival_times.empty()) {
        record.flow_iat_mean = state.inter_arrival_times.mean();
        record.flow_iat_std = state.inter_arrival_times.std_dev();
        record.flow_iat_max = state.inter_arrival_times.max();
        record.flow_iat_min = state.inter_arrival_times.min();
    }

    // tcp flags
    if(state.protocol == PROTO_TCP) {
        uint8_t flags = state.tcp_flags_union;
        record.tcp_flags = flags;
        record.fin_flag_count = flag_indicator(flags, TCP_FLAG_FIN);
        record.syn_flag_count = flag_indicator(flags, TCP_FLAG_SYN);
        record.rst_flag_count = flag_indicator(flags, TCP_FLAG_RST);
        record.psh_flag_count = flag_indicator(flags, TCP_FLAG_PSH);
        record.ack_flag_count = flag_indicator(flags, TCP_FLAG_ACK);
        record.urg_flag_count = flag_indicator(flags, TCP_FLAG_URG);
    }

    record.timestamp = current_time_microseconds();
    record.label = DEFAULT_FLOW_LABEL;

    return record;
}

nlohmann::ordered_json FeatureRecord::to_json() const {
    nlohmann::ordered_json j;

    j["src_ip"] = src_ip;
    j["dst_ip"] = dst_ip;
    j["src_port"] = src_port;
    j["dst_port"] = dst_port;
    j["protocol"] = protocol;
    j["flow_duration"] = flow_duration;
    j["total_fwd_packets"] = total_fwd_packets;
    j["total_bwd_packets"] = total_bwd_packets;
    j["total_length_fwd_packets"] = total_length_fwd_packets;
    j["total_length_bwd_packets"] = total_length_bwd_packets;
    j["packet_length_max"] = packet_length_max;
    j["packet_length_min"] = packet_length_min;
    j["packet_length_mean"] = packet_length_mean;
    j["packet_length_std"] = packet_length_std;
    j["flow_bytes_per_second"] = flow_bytes_per_second;
    j["flow_packets_per_second"] = flow_packets_per_second;
    j["flow_iat_mean"] = flow_iat_mean;
    j["flow_iat_std"] = flow_iat_std;
    j["flow_iat_max"] = flow_iat_max;
    j["flow_iat_min"] = flow_iat_min;
    j["tcp_flags"] = tcp_flags;
    j["fin_flag_count"] = fin_flag_count;
    j["syn_flag_count"] = syn_flag_count;
    j["rst_flag_count"] = rst_flag_count;
    j["psh_flag_count"] = psh_flag_count;
    j["ack_flag_count"] = ack_flag_count;
    j["urg_flag_count"] = urg_flag_count;
    j["avg_packet_size"] = avg_packet_size;
    j["packet_length_variance"] = packet_length_variance;
    j["timestamp"] = timestamp;
    j["label"] = label;

    return j;
}

std::string FeatureRecord::message_key() const {
    return src_ip + ":" + std::to_string(src_port) + "-" + dst_ip + ":" + std::to_string(dst_port);
}

void print_feature_record(const FeatureRecord& record) {
    std::cout << "\n=== Flow Features ===" << std::endl;
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Flow: " << record.message_key() << " ("
              << protocol_number_to_string(record.protocol) << ")" << std::endl;
    std::cout << "Flow Duration: " << record.flow_duration << " seconds" << std::endl;
    std::cout << "Total Packets: " << record.total_fwd_packets
              << ", Total Bytes: " << record.total_length_fwd_packets << std::endl;

    std::cout << "\nPacket Length Statistics:" << std::endl;
    std::cout << "  Min: " << record.packet_length_min
              << ", Max: " << record.packet_length_max
              << ", Mean: " << record.packet_length_mean
              << ", Std: " << record.packet_length_std << std::endl;

    std::cout << "\nFlow Rates:" << std::endl;
    std::cout << "  Flow Bytes/sec: " << record.flow_bytes_per_second << std::endl;
    std::cout << "  Flow Packets/sec: " << record.flow_packets_per_second << std::endl;

    std::cout << "\nInter-Arrival Times:" << std::endl;
    std::cout << "  Min: " << record.flow_iat_min
              << ", Max: " << record.flow_iat_max
              << ", Mean: " << record.flow_iat_mean
              << ", Std: " << record.flow_iat_std << std::endl;

    std::cout << "\nTCP Flags:" << std::endl;
    std::cout << "  SYN: " << record.syn_flag_count
              << ", ACK: " << record.ack_flag_count
              << ", FIN: " << record.fin_flag_count
              << ", RST: " << record.rst_flag_count
              << ", PSH: " << record.psh_flag_count
              << ", URG: " << record.urg_flag_count << std::endl;
    std::cout << std::defaultfloat;
}
