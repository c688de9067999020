#include "packet_parser.hpp"
#include <cstring>
#include <arpa/inet.h>

uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

bool parse_ethernet_header(const uint8_t* data, size_t length, EthernetHeader& out) {
    if(data == nullptr || length < ETHERNET_HEADER_LEN) {
        return false;
    }

    // dst_mac(6) + src_mac(6) + ethertype(2)
    std::memcpy(out.dst_mac, data, 6);
    std::memcpy(out.src_mac, data + 6, 6);
    out.ethertype = read_be16(data + 12);
    out.payload = data + ETHERNET_HEADER_LEN;
    out.payload_length = length - ETHERNET_HEADER_LEN;

    return true;
}

bool parse_ipv4_header(const uint8_t* data, size_t length, Ipv4Header& out) {
    if(data == nullptr || length < IPV4_MIN_HEADER_LEN) {
        return false;
    }

    uint8_t version = (data[0] >> 4) & 0x0F;
    uint8_t ihl = data[0] & 0x0F;
    uint16_t header_length = static_cast<uint16_t>(ihl) * 4;

    // ihl below 5 cannot describe the fixed part of the header
    if(version != 4 || header_length < IPV4_MIN_HEADER_LEN || length < header_length) {
        return false;
    }

    uint16_t flags_fragment = read_be16(data + 6);

    out.version = version;
    out.ihl = ihl;
    out.tos = data[1];
    out.total_length = read_be16(data + 2);
    out.identification = read_be16(data + 4);
    out.flags = static_cast<uint8_t>(flags_fragment >> 13);
    out.fragment_offset = flags_fragment & 0x1FFF;
    out.ttl = data[8];
    out.protocol = data[9];
    out.checksum = read_be16(data + 10);
    out.src_ip = read_be32(data + 12);
    out.dst_ip = read_be32(data + 16);
    out.header_length = header_length;
    out.payload = data + header_length;
    out.payload_length = length - header_length;

    return true;
}

bool parse_tcp_header(const uint8_t* data, size_t length, TcpHeader& out) {
    if(data == nullptr || length < TCP_MIN_HEADER_LEN) {
        return false;
    }

    uint8_t data_offset = (data[12] >> 4) & 0x0F;
    uint16_t header_length = static_cast<uint16_t>(data_offset) * 4;

    if(header_length < TCP_MIN_HEADER_LEN || length < header_length) {
        return false;
    }

    out.src_port = read_be16(data);
    out.dst_port = read_be16(data + 2);
    out.seq_num = read_be32(data + 4);
    out.ack_num = read_be32(data + 8);
    out.data_offset = data_offset;
    out.flags = data[13];
    out.window = read_be16(data + 14);
    out.checksum = read_be16(data + 16);
    out.urgent_ptr = read_be16(data + 18);
    out.header_length = header_length;
    out.payload = data + header_length;
    out.payload_length = length - header_length;

    return true;
}

bool parse_udp_header(const uint8_t* data, size_t length, UdpHeader& out) {
    if(data == nullptr || length < UDP_HEADER_LEN) {
        return false;
    }

    out.src_port = read_be16(data);
    out.dst_port = read_be16(data + 2);
    out.length = read_be16(data + 4);
    out.checksum = read_be16(data + 6);
    out.payload = data + UDP_HEADER_LEN;
    out.payload_length = length - UDP_HEADER_LEN;

    return true;
}

std::string ipv4_to_string(uint32_t ip) {
    struct in_addr addr;
    addr.s_addr = htonl(ip);

    char buf[INET_ADDRSTRLEN];
    if(inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return "0.0.0.0";
    }
    return std::string(buf);
}

std::string protocol_number_to_string(uint8_t protocol) {
    switch(protocol) {
        case 1: return "icmp";
        case PROTO_TCP: return "tcp";
        case PROTO_UDP: return "udp";
        default: return std::to_string(protocol);
    }
}
