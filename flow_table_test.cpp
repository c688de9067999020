#include "flow_table.hpp"
#include "packet_parser.hpp"
#include "test_packets.hpp"
#include <iostream>
#include <thread>
#include <vector>
#include <stdexcept>

PacketInfo create_packet_info(uint32_t src_ip, uint32_t dst_ip, uint16_t src_port, uint16_t dst_port,
                              uint8_t protocol, uint32_t length, uint8_t flags = 0) {
    PacketInfo info;
    info.src_ip = src_ip;
    info.dst_ip = dst_ip;
    info.src_port = src_port;
    info.dst_port = dst_port;
    info.protocol = protocol;
    info.packet_length = length;
    info.tcp_flags = flags;
    info.has_tcp_flags = (protocol == PROTO_TCP);
    return info;
}

void test_running_stats() {
    std::cout << "\n=== Test: Running Statistics ===" << std::endl;

    RunningStats empty;
    TEST_ASSERT(empty.empty() && empty.variance() == 0.0 && empty.std_dev() == 0.0, "Empty accumulator is all zero");

    RunningStats one;
    one.add(42.0);
    TEST_ASSERT(one.count() == 1 && one.mean() == 42.0, "Single sample mean");
    TEST_ASSERT(one.std_dev() == 0.0, "Single sample std is 0");
    TEST_ASSERT(one.min() == 42.0 && one.max() == 42.0, "Single sample min/max");

    RunningStats two;
    two.add(40.0);
    two.add(60.0);
    TEST_ASSERT(TEST_NEAR(two.variance(), 200.0, 1e-9), "Sample variance of [40, 60] is 200");
    TEST_ASSERT(TEST_NEAR(two.std_dev(), 14.142135623730951, 1e-9), "Sample std of [40, 60] is sqrt(200)");

    RunningStats series;
    double values[] = {2, 4, 4, 4, 5, 5, 7, 9};
    for(double v : values) series.add(v);
    TEST_ASSERT(TEST_NEAR(series.mean(), 5.0, 1e-12), "Mean of 8 samples");
    TEST_ASSERT(TEST_NEAR(series.variance(), 32.0 / 7.0, 1e-12), "n-1 divisor");
    TEST_ASSERT(series.min() == 2.0 && series.max() == 9.0 && series.sum() == 40.0, "Min, max, sum");
}

void test_flow_accumulation() {
    std::cout << "\n=== Test: Flow Accumulation ===" << std::endl;

    FlowTable table(4);
    FlowKey key = make_flow_key(0x0A000001, 0x0A000002, 1234, 80, PROTO_TCP);

    const int n = 5;
    uint32_t lengths[n] = {60, 1500, 40, 576, 1200};
    uint64_t total = 0;
    FlowState state;

    for(int i = 0; i < n; i++) {
        // packets alternate direction but belong to one flow
        PacketInfo info = (i % 2 == 0)
            ? create_packet_info(0x0A000001, 0x0A000002, 1234, 80, PROTO_TCP, lengths[i], TCP_FLAG_ACK)
            : create_packet_info(0x0A000002, 0x0A000001, 80, 1234, PROTO_TCP, lengths[i], TCP_FLAG_ACK | TCP_FLAG_PSH);
        state = table.upsert(key, info, seconds_to_timeval(100.0 + i * 0.5));
        total += lengths[i];
    }

    TEST_ASSERT(table.size() == 1, "One flow for both directions");
    TEST_ASSERT(state.packet_count == n, "packet_count == N");
    TEST_ASSERT(state.packet_lengths.count() == state.packet_count, "One length sample per packet");
    TEST_ASSERT(state.inter_arrival_times.count() == n - 1, "N-1 inter-arrival samples");
    TEST_ASSERT(state.byte_count == total, "byte_count is the sum of lengths");
    TEST_ASSERT(TEST_NEAR(state.inter_arrival_times.mean(), 0.5, 1e-9), "Inter-arrival mean 0.5 s");
    TEST_ASSERT(state.tcp_flags_union == (TCP_FLAG_ACK | TCP_FLAG_PSH), "Flag union accumulates");
    TEST_ASSERT(!timeval_less(state.last_packet_time, state.start_time), "last_packet_time >= start_time");
    TEST_ASSERT(state.start_time.tv_sec == 100 && state.start_time.tv_usec == 0, "start_time is the first arrival");
    TEST_ASSERT(state.last_packet_time.tv_sec == 102 && state.last_packet_time.tv_usec == 0, "last_packet_time is the last arrival");

    // identity is fixed by the first packet
    TEST_ASSERT(state.src_ip == 0x0A000001 && state.src_port == 1234, "Identity from first packet");

    FlowState looked_up;
    TEST_ASSERT(table.lookup(key, looked_up) && looked_up.packet_count == n, "Lookup returns stored state");
}

void test_identity_from_first_packet() {
    std::cout << "\n=== Test: Identity Not Re-normalized ===" << std::endl;

    FlowTable table(1);
    FlowKey key = make_flow_key(0x0A000002, 0x0A000001, 80, 1234, PROTO_TCP);

    // the larger address speaks first
    FlowState state = table.upsert(key,
        create_packet_info(0x0A000002, 0x0A000001, 80, 1234, PROTO_TCP, 60, TCP_FLAG_SYN | TCP_FLAG_ACK),
        seconds_to_timeval(10.0));
    state = table.upsert(key,
        create_packet_info(0x0A000001, 0x0A000002, 1234, 80, PROTO_TCP, 60, TCP_FLAG_ACK),
        seconds_to_timeval(10.1));

    TEST_ASSERT(state.src_ip == 0x0A000002 && state.dst_ip == 0x0A000001, "Addresses kept as first seen");
    TEST_ASSERT(state.src_port == 80 && state.dst_port == 1234, "Ports kept as first seen");
}

void test_non_tcp_flags_ignored() {
    std::cout << "\n=== Test: Non-TCP Flags ===" << std::endl;

    FlowTable table;
    FlowKey key = make_flow_key(0x0A000001, 0x0A000002, 5000, 53, PROTO_UDP);
    PacketInfo info = create_packet_info(0x0A000001, 0x0A000002, 5000, 53, PROTO_UDP, 80);
    info.tcp_flags = 0xFF;
    info.has_tcp_flags = true;

    FlowState state = table.upsert(key, info, seconds_to_timeval(1.0));
    TEST_ASSERT(state.tcp_flags_union == 0, "UDP flow never accumulates flags");
}

void test_out_of_order_timestamp() {
    std::cout << "\n=== Test: Out-of-order Timestamp ===" << std::endl;

    FlowTable table;
    FlowKey key = make_flow_key(0x0A000001, 0x0A000002, 1, 2, PROTO_UDP);
    PacketInfo info = create_packet_info(0x0A000001, 0x0A000002, 1, 2, PROTO_UDP, 100);

    table.upsert(key, info, seconds_to_timeval(50.0));
    FlowState state = table.upsert(key, info, seconds_to_timeval(49.0));

    TEST_ASSERT(state.inter_arrival_times.count() == 1, "Late packet still counted");
    TEST_ASSERT(state.inter_arrival_times.min() == 0.0, "Negative gap clamped to 0");
    TEST_ASSERT(state.last_packet_time.tv_sec == 50, "Flow clock never moves backwards");
}

void test_eviction() {
    std::cout << "\n=== Test: Idle Eviction ===" << std::endl;

    FlowTable table(8);
    FlowKey idle = make_flow_key(0x0A000001, 0x0A000002, 1000, 80, PROTO_TCP);
    FlowKey active = make_flow_key(0x0A000003, 0x0A000004, 2000, 443, PROTO_TCP);
    FlowKey boundary = make_flow_key(0x0A000005, 0x0A000006, 3000, 22, PROTO_TCP);

    table.upsert(idle, create_packet_info(0x0A000001, 0x0A000002, 1000, 80, PROTO_TCP, 60), seconds_to_timeval(0.0));
    table.upsert(boundary, create_packet_info(0x0A000005, 0x0A000006, 3000, 22, PROTO_TCP, 60), seconds_to_timeval(100.0));
    table.upsert(active, create_packet_info(0x0A000003, 0x0A000004, 2000, 443, PROTO_TCP, 60), seconds_to_timeval(650.0));

    TEST_ASSERT(table.size() == 3, "Three flows before sweep");

    size_t removed = table.evict_idle(seconds_to_timeval(700.0), 600.0);

    TEST_ASSERT(removed == 1, "One flow evicted");
    TEST_ASSERT(!table.contains(idle), "Flow idle for 700 s is gone");
    TEST_ASSERT(table.contains(boundary), "Flow idle for exactly 600 s is kept");
    TEST_ASSERT(table.contains(active), "Recently active flow retained");
    TEST_ASSERT(table.size() == 2, "Size reflects eviction");
    TEST_ASSERT(table.get_flows_evicted() == 1, "Eviction counter");

    // an evicted flow starts over
    FlowState fresh = table.upsert(idle, create_packet_info(0x0A000001, 0x0A000002, 1000, 80, PROTO_TCP, 60),
                                   seconds_to_timeval(701.0));
    TEST_ASSERT(fresh.packet_count == 1, "Re-created flow starts at one packet");

    TEST_ASSERT(table.drain() == 3, "Drain reports every held flow");
    TEST_ASSERT(table.size() == 0, "Table empty after drain");
}

void test_concurrent_upserts() {
    std::cout << "\n=== Test: Concurrent Upserts ===" << std::endl;

    FlowTable table(16);
    const int threads = 4;
    const int packets_per_thread = 2000;
    const int flows = 50;

    std::vector<std::thread> workers;
    for(int t = 0; t < threads; t++) {
        workers.emplace_back([&table, t]() {
            for(int i = 0; i < packets_per_thread; i++) {
                uint16_t port = static_cast<uint16_t>(10000 + (i % flows));
                FlowKey key = make_flow_key(0x0A000001, 0x0A000002, port, 80, PROTO_TCP);
                PacketInfo info = create_packet_info(0x0A000001, 0x0A000002, port, 80, PROTO_TCP, 100);
                table.upsert(key, info, seconds_to_timeval(1000.0 + t + i * 0.001));
            }
        });
    }
    for(auto& w : workers) w.join();

    TEST_ASSERT(table.size() == flows, "All threads share the same flows");

    uint64_t packets = 0;
    bool consistent = true;
    for(int f = 0; f < flows; f++) {
        FlowState state;
        FlowKey key = make_flow_key(0x0A000001, 0x0A000002, static_cast<uint16_t>(10000 + f), 80, PROTO_TCP);
        if(!table.lookup(key, state)) {
            consistent = false;
            continue;
        }
        packets += state.packet_count;
        consistent = consistent && state.packet_lengths.count() == state.packet_count &&
                     state.inter_arrival_times.count() == state.packet_count - 1 &&
                     state.byte_count == state.packet_count * 100;
    }
    TEST_ASSERT(packets == static_cast<uint64_t>(threads) * packets_per_thread, "No update lost");
    TEST_ASSERT(consistent, "Every flow keeps consistent counters");
}

void test_shard_count_validation() {
    std::cout << "\n=== Test: Shard Count Validation ===" << std::endl;

    bool threw = false;
    try {
        FlowTable bad(3);
    } catch(const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Non power-of-two shard count rejected");

    FlowTable single(1);
    TEST_ASSERT(single.get_shard_count() == 1, "Single shard table");
}

int main() {
    std::cout << "=== Flow Table Tests ===" << std::endl;

    test_running_stats();
    test_flow_accumulation();
    test_identity_from_first_packet();
    test_non_tcp_flags_ignored();
    test_out_of_order_timestamp();
    test_eviction();
    test_concurrent_upserts();
    test_shard_count_validation();

    return report_results("Flow Table");
}
