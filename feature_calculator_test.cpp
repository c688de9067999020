#include "feature_calculator.hpp"
#include "packet_parser.hpp"
#include "test_packets.hpp"
#include <iostream>
#include <cmath>
#include <string>

static PacketInfo make_info(uint8_t protocol, uint32_t length, uint8_t flags) {
    PacketInfo info;
    info.src_ip = 0x0A000001;
    info.dst_ip = 0x0A000002;
    info.src_port = 1234;
    info.dst_port = 80;
    info.protocol = protocol;
    info.packet_length = length;
    info.tcp_flags = flags;
    info.has_tcp_flags = (protocol == PROTO_TCP);
    return info;
}

// feeds (length, arrival) pairs through a table and returns the final state
static FlowState build_flow(uint8_t protocol, const uint32_t* lengths, const double* arrivals,
                            const uint8_t* flags, int n) {
    FlowTable table(1);
    FlowKey key = make_flow_key(0x0A000001, 0x0A000002, 1234, 80, protocol);
    FlowState state;
    for(int i = 0; i < n; i++) {
        state = table.upsert(key, make_info(protocol, lengths[i], flags ? flags[i] : 0),
                             seconds_to_timeval(arrivals[i]));
    }
    return state;
}

void test_two_packet_flow() {
    std::cout << "\n=== Test: Two Packet Flow ===" << std::endl;

    uint32_t lengths[] = {40, 60};
    double arrivals[] = {10.0, 12.0};
    uint8_t flags[] = {TCP_FLAG_SYN, TCP_FLAG_ACK};
    FeatureRecord r = compute_flow_features(build_flow(PROTO_TCP, lengths, arrivals, flags, 2));

    TEST_ASSERT(r.src_ip == "10.0.0.1" && r.dst_ip == "10.0.0.2", "Dotted-quad addresses");
    TEST_ASSERT(r.src_port == 1234 && r.dst_port == 80 && r.protocol == PROTO_TCP, "Identity fields");
    TEST_ASSERT(TEST_NEAR(r.flow_duration, 2.0, 1e-9), "Duration 2 s");
    TEST_ASSERT(r.total_fwd_packets == 2 && r.total_length_fwd_packets == 100, "Totals");
    TEST_ASSERT(r.total_bwd_packets == 0 && r.total_length_bwd_packets == 0, "Backward totals stay 0");
    TEST_ASSERT(r.packet_length_min == 40.0 && r.packet_length_max == 60.0, "Length min/max");
    TEST_ASSERT(TEST_NEAR(r.packet_length_mean, 50.0, 1e-9), "Length mean 50");
    TEST_ASSERT(TEST_NEAR(r.packet_length_std, std::sqrt(200.0), 1e-9), "Length std sqrt(200)");
    TEST_ASSERT(TEST_NEAR(r.packet_length_variance, 200.0, 1e-6), "Length variance 200");
    TEST_ASSERT(TEST_NEAR(r.flow_bytes_per_second, 50.0, 1e-9), "100 bytes over 2 s");
    TEST_ASSERT(TEST_NEAR(r.flow_packets_per_second, 1.0, 1e-9), "2 packets over 2 s");
    TEST_ASSERT(TEST_NEAR(r.flow_iat_mean, 2.0, 1e-9) && r.flow_iat_std == 0.0, "Single gap: mean 2, std 0");
    TEST_ASSERT(TEST_NEAR(r.flow_iat_min, 2.0, 1e-9) && TEST_NEAR(r.flow_iat_max, 2.0, 1e-9), "Gap min/max");
    TEST_ASSERT(r.avg_packet_size == r.packet_length_mean, "Average size equals mean length");
    TEST_ASSERT(r.tcp_flags == (TCP_FLAG_SYN | TCP_FLAG_ACK), "Cumulative flags byte");
    TEST_ASSERT(r.syn_flag_count == 1 && r.ack_flag_count == 1, "SYN and ACK indicators");
    TEST_ASSERT(r.fin_flag_count == 0 && r.rst_flag_count == 0 && r.psh_flag_count == 0 && r.urg_flag_count == 0,
                "Unset flag indicators are 0");
    TEST_ASSERT(r.label == "BENIGN", "Default label");
}

void test_single_packet_flow() {
    std::cout << "\n=== Test: Single Packet Flow ===" << std::endl;

    uint32_t lengths[] = {54};
    double arrivals[] = {500.25};
    uint8_t flags[] = {TCP_FLAG_FIN | TCP_FLAG_PSH | TCP_FLAG_URG};
    FeatureRecord r = compute_flow_features(build_flow(PROTO_TCP, lengths, arrivals, flags, 1));

    TEST_ASSERT(r.flow_duration == MIN_FLOW_DURATION_SECONDS, "Zero duration floored to 1e-6");
    TEST_ASSERT(r.packet_length_std == 0.0 && r.packet_length_variance == 0.0, "Length std 0");
    TEST_ASSERT(r.flow_iat_mean == 0.0 && r.flow_iat_std == 0.0 &&
                r.flow_iat_min == 0.0 && r.flow_iat_max == 0.0, "No inter-arrival samples gives 0");
    TEST_ASSERT(TEST_NEAR(r.flow_bytes_per_second, 54.0 / 1e-6, 1e-3), "Byte rate uses floored duration");
    TEST_ASSERT(r.fin_flag_count == 1 && r.psh_flag_count == 1 && r.urg_flag_count == 1, "FIN PSH URG set");
    TEST_ASSERT(r.syn_flag_count == 0 && r.ack_flag_count == 0, "SYN ACK clear");
}

void test_udp_flow_has_no_flags() {
    std::cout << "\n=== Test: UDP Flow ===" << std::endl;

    uint32_t lengths[] = {100, 200, 300};
    double arrivals[] = {1.0, 1.5, 3.0};
    FeatureRecord r = compute_flow_features(build_flow(PROTO_UDP, lengths, arrivals, nullptr, 3));

    TEST_ASSERT(r.protocol == PROTO_UDP, "Protocol 17");
    TEST_ASSERT(r.tcp_flags == 0, "Flags byte 0");
    TEST_ASSERT(r.fin_flag_count + r.syn_flag_count + r.rst_flag_count +
                r.psh_flag_count + r.ack_flag_count + r.urg_flag_count == 0, "Every indicator 0");
    TEST_ASSERT(TEST_NEAR(r.flow_iat_mean, 1.0, 1e-9), "Gaps 0.5 and 1.5 average 1.0");
    TEST_ASSERT(TEST_NEAR(r.flow_iat_min, 0.5, 1e-9) && TEST_NEAR(r.flow_iat_max, 1.5, 1e-9), "Gap min/max");
    TEST_ASSERT(TEST_NEAR(r.packet_length_std, 100.0, 1e-9), "Std of [100, 200, 300] is 100");
}

void test_record_encoding() {
    std::cout << "\n=== Test: Record Encoding ===" << std::endl;

    uint32_t lengths[] = {54};
    double arrivals[] = {1.0};
    uint8_t flags[] = {TCP_FLAG_SYN};
    FeatureRecord r = compute_flow_features(build_flow(PROTO_TCP, lengths, arrivals, flags, 1));

    TEST_ASSERT(r.message_key() == "10.0.0.1:1234-10.0.0.2:80", "Message key layout");

    nlohmann::ordered_json j = r.to_json();
    const char* keys[] = {
        "src_ip", "dst_ip", "src_port", "dst_port", "protocol", "flow_duration",
        "total_fwd_packets", "total_bwd_packets", "total_length_fwd_packets", "total_length_bwd_packets",
        "packet_length_max", "packet_length_min", "packet_length_mean", "packet_length_std",
        "flow_bytes_per_second", "flow_packets_per_second",
        "flow_iat_mean", "flow_iat_std", "flow_iat_max", "flow_iat_min", "tcp_flags",
        "fin_flag_count", "syn_flag_count", "rst_flag_count", "psh_flag_count", "ack_flag_count",
        "urg_flag_count", "avg_packet_size", "packet_length_variance", "timestamp", "label"
    };

    bool all_present = true;
    for(const char* key : keys) {
        if(!j.contains(key)) {
            std::cout << "  missing key: " << key << std::endl;
            all_present = false;
        }
    }
    TEST_ASSERT(all_present, "Every feature key present");
    TEST_ASSERT(j.size() == sizeof(keys) / sizeof(keys[0]), "No extra keys");
    TEST_ASSERT(j.begin().key() == "src_ip", "Insertion order kept");
    TEST_ASSERT(j["src_ip"] == "10.0.0.1" && j["syn_flag_count"] == 1, "Values carried over");
    TEST_ASSERT(j["timestamp"].get<int64_t>() > 1500000000000000LL, "Timestamp in microseconds");
}

int main() {
    std::cout << "=== Feature Calculator Tests ===" << std::endl;

    test_two_packet_flow();
    test_single_packet_flow();
    test_udp_flow_has_no_flags();
    test_record_encoding();

    return report_results("Feature Calculator");
}
