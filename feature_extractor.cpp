#include "feature_extractor.hpp"
#include <iostream>
#include <exception>

FeatureExtractor::FeatureExtractor(const ExtractorConfig& config)
    : config_(config)
    , flow_table_(std::make_unique<FlowTable>(config.shard_count)) {

    std::cout << "[Extractor] Created (timeout " << config_.flow_timeout_seconds
              << " s, eviction threshold " << config_.eviction_threshold
              << " flows, " << config_.shard_count << " shards)\n";
}

bool FeatureExtractor::decode_packet(const RawPacket& packet, PacketInfo& info_out) {
    EthernetHeader eth;
    if(!parse_ethernet_header(packet.data, packet.caplen, eth)) {
        malformed_packets_++;
        return false;
    }

    // only IPv4 is analyzed
    if(eth.ethertype != ETHERTYPE_IPV4) {
        non_ipv4_packets_++;
        return false;
    }

    Ipv4Header ip;
    if(!parse_ipv4_header(eth.payload, eth.payload_length, ip)) {
        malformed_packets_++;
        return false;
    }

    PacketInfo info;
    info.src_ip = ip.src_ip;
    info.dst_ip = ip.dst_ip;
    info.protocol = ip.protocol;
    info.packet_length = packet.length;

    // transport layer, ports stay 0 when the header does not parse
    if(ip.protocol == PROTO_TCP) {
        TcpHeader tcp;
        if(parse_tcp_header(ip.payload, ip.payload_length, tcp)) {
            info.src_port = tcp.src_port;
            info.dst_port = tcp.dst_port;
            info.tcp_flags = tcp.flags;
            info.has_tcp_flags = true;
        } else {
            transport_fallbacks_++;
        }
    } else if(ip.protocol == PROTO_UDP) {
        UdpHeader udp;
        if(parse_udp_header(ip.payload, ip.payload_length, udp)) {
            info.src_port = udp.src_port;
            info.dst_port = udp.dst_port;
        } else {
            transport_fallbacks_++;
        }
    }

    info_out = info;
    return true;
}

bool FeatureExtractor::extract(const RawPacket& packet, FeatureRecord& record_out) {
    packets_seen_++;

    try {
        // clean up old flows once the table grows past the threshold
        if(flow_table_->size() > config_.eviction_threshold) {
            evict_idle(packet.timestamp);
        }

        PacketInfo info;
        if(!decode_packet(packet, info)) {
            return false;
        }

        FlowKey key = make_flow_key(info.src_ip, info.dst_ip, info.src_port, info.dst_port, info.protocol);
        FlowState state = flow_table_->upsert(key, info, packet.timestamp);

        record_out = compute_flow_features(state);
        records_emitted_++;

        if(config_.verbose) {
            std::cout << "[Extractor] " << key.to_hex() << " " << record_out.message_key()
                      << " " << protocol_number_to_string(info.protocol)
                      << " packets=" << state.packet_count
                      << " bytes=" << state.byte_count << "\n";
        }

        return true;

    } catch(const std::exception& e) {
        processing_errors_++;
        std::cerr << "[Extractor] Error extracting features: " << e.what() << std::endl;
        return false;
    }
}

size_t FeatureExtractor::evict_idle(const struct timeval& now) {
    size_t removed = flow_table_->evict_idle(now, config_.flow_timeout_seconds);
    eviction_sweeps_++;

    if(removed > 0 && config_.verbose) {
        std::cout << "[FlowTable] Cleaned up " << removed << " expired flows, "
                  << flow_table_->size() << " remain\n";
    }
    return removed;
}

size_t FeatureExtractor::drain() {
    size_t drained = flow_table_->drain();
    std::cout << "[Extractor] Drained " << drained << " active flows\n";
    return drained;
}

void FeatureExtractor::print_stats() const {
    std::cout << "\n=== Feature Extractor Statistics ===\n";
    std::cout << "Packets Seen: " << packets_seen_.load() << "\n";
    std::cout << "Records Emitted: " << records_emitted_.load() << "\n";
    std::cout << "Non-IPv4 Packets: " << non_ipv4_packets_.load() << "\n";
    std::cout << "Malformed Packets: " << malformed_packets_.load() << "\n";
    std::cout << "Transport Header Fallbacks: " << transport_fallbacks_.load() << "\n";
    std::cout << "Processing Errors: " << processing_errors_.load() << "\n";
    std::cout << "Eviction Sweeps: " << eviction_sweeps_.load() << "\n";
    std::cout << "====================================\n";
    flow_table_->print_stats();
}
