#ifndef FLOW_KEY_HPP
#define FLOW_KEY_HPP

#include <cstdint>
#include <cstddef>
#include <string>

// 5-tuple as seen on the wire, addresses in host order
struct FlowTuple {
    uint32_t src_ip;
    uint32_t dst_ip;
    uint16_t src_port;
    uint16_t dst_port;
    uint8_t protocol;

    FlowTuple() : src_ip(0), dst_ip(0), src_port(0), dst_port(0), protocol(0) {}
    FlowTuple(uint32_t sip, uint32_t dip, uint16_t sp, uint16_t dp, uint8_t proto)
        : src_ip(sip), dst_ip(dip), src_port(sp), dst_port(dp), protocol(proto) {}

    // bidirectional tuple - smaller (ip, port) endpoint first
    FlowTuple get_canonical() const {
        if(src_ip < dst_ip || (src_ip == dst_ip && src_port < dst_port)) {
            return *this;
        } else {
            return FlowTuple(dst_ip, src_ip, dst_port, src_port, protocol);
        }
    }

    // "firstIP:firstPort-secondIP:secondPort:protocol" of the canonical tuple
    std::string canonical_string() const;

    bool operator==(const FlowTuple& other) const {
        return src_ip == other.src_ip && dst_ip == other.dst_ip &&
               src_port == other.src_port && dst_port == other.dst_port &&
               protocol == other.protocol;
    }
};

// First 64 bits of the MD5 digest of the canonical tuple string. The key is a
// deduplication handle, not a security boundary: with n live flows the chance
// of any collision is about n^2 / 2^65 (below 1e-9 for 100k flows).
struct FlowKey {
    uint64_t value;

    FlowKey() : value(0) {}
    explicit FlowKey(uint64_t v) : value(v) {}

    // 16 lowercase hex characters
    std::string to_hex() const;

    bool operator==(const FlowKey& other) const { return value == other.value; }
    bool operator!=(const FlowKey& other) const { return value != other.value; }
};

struct FlowKeyHash {
    size_t operator()(const FlowKey& key) const {
        // digest bits are already uniform
        return static_cast<size_t>(key.value);
    }
};

FlowKey make_flow_key(const FlowTuple& tuple);
FlowKey make_flow_key(uint32_t src_ip, uint32_t dst_ip, uint16_t src_port,
                      uint16_t dst_port, uint8_t protocol);

#endif // FLOW_KEY_HPP
