#ifndef PACKET_PARSER_HPP
#define PACKET_PARSER_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <sys/time.h>

constexpr size_t ETHERNET_HEADER_LEN = 14;
constexpr size_t IPV4_MIN_HEADER_LEN = 20;
constexpr size_t TCP_MIN_HEADER_LEN = 20;
constexpr size_t UDP_HEADER_LEN = 8;

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint8_t PROTO_TCP = 6;
constexpr uint8_t PROTO_UDP = 17;

constexpr uint8_t TCP_FLAG_FIN = 0x01;
constexpr uint8_t TCP_FLAG_SYN = 0x02;
constexpr uint8_t TCP_FLAG_RST = 0x04;
constexpr uint8_t TCP_FLAG_PSH = 0x08;
constexpr uint8_t TCP_FLAG_ACK = 0x10;
constexpr uint8_t TCP_FLAG_URG = 0x20;

// Raw frame handed over by the capture side. The bytes are borrowed for the
// duration of one extract() call.
struct RawPacket {
    const uint8_t* data;
    uint32_t caplen;            // bytes available at data
    uint32_t length;            // original length on the wire
    uint16_t port;              // ingress port id
    struct timeval timestamp;   // arrival time

    RawPacket() : data(nullptr), caplen(0), length(0), port(0), timestamp{} {}
};

// Each header keeps a view of the bytes that follow it. The views borrow
// from the caller's buffer and are only valid while that buffer is.
struct EthernetHeader {
    uint8_t dst_mac[6];
    uint8_t src_mac[6];
    uint16_t ethertype;
    const uint8_t* payload;
    size_t payload_length;
};

struct Ipv4Header {
    uint8_t version;
    uint8_t ihl;
    uint8_t tos;
    uint16_t total_length;
    uint16_t identification;
    uint8_t flags;              // 3 bits
    uint16_t fragment_offset;   // 13 bits
    uint8_t ttl;
    uint8_t protocol;
    uint16_t checksum;
    uint32_t src_ip;            // host order, numerically comparable
    uint32_t dst_ip;
    uint16_t header_length;     // ihl * 4, options skipped
    const uint8_t* payload;
    size_t payload_length;
};

struct TcpHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint32_t seq_num;
    uint32_t ack_num;
    uint8_t data_offset;
    uint8_t flags;
    uint16_t window;
    uint16_t checksum;
    uint16_t urgent_ptr;
    uint16_t header_length;
    const uint8_t* payload;
    size_t payload_length;
};

struct UdpHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint16_t length;
    uint16_t checksum;
    const uint8_t* payload;
    size_t payload_length;
};

// All parsers return false when the bytes cannot hold a valid header.
// They never throw and never read past data + length.
bool parse_ethernet_header(const uint8_t* data, size_t length, EthernetHeader& out);
bool parse_ipv4_header(const uint8_t* data, size_t length, Ipv4Header& out);
bool parse_tcp_header(const uint8_t* data, size_t length, TcpHeader& out);
bool parse_udp_header(const uint8_t* data, size_t length, UdpHeader& out);

// Big-endian readers, callers guarantee the bytes are in range.
uint16_t read_be16(const uint8_t* p);
uint32_t read_be32(const uint8_t* p);

std::string ipv4_to_string(uint32_t ip);
std::string protocol_number_to_string(uint8_t protocol);

#endif // PACKET_PARSER_HPP
