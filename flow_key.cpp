#include "flow_key.hpp"
#include "packet_parser.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <cstdio>

std::string FlowTuple::canonical_string() const {
    FlowTuple c = get_canonical();
    return ipv4_to_string(c.src_ip) + ":" + std::to_string(c.src_port) + "-" +
           ipv4_to_string(c.dst_ip) + ":" + std::to_string(c.dst_port) + ":" +
           std::to_string(c.protocol);
}

std::string FlowKey::to_hex() const {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return std::string(buf);
}

FlowKey make_flow_key(const FlowTuple& tuple) {
    std::string canonical = tuple.canonical_string();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if(EVP_Digest(canonical.data(), canonical.size(), digest, &digest_len, EVP_md5(), nullptr) != 1 ||
       digest_len < 8) {
        throw std::runtime_error("MD5 digest failed for flow " + canonical);
    }

    // big-endian fold keeps to_hex() equal to the digest's leading 16 hex chars
    uint64_t value = 0;
    for(int i = 0; i < 8; i++) {
        value = (value << 8) | digest[i];
    }
    return FlowKey(value);
}

FlowKey make_flow_key(uint32_t src_ip, uint32_t dst_ip, uint16_t src_port,
                      uint16_t dst_port, uint8_t protocol) {
    return make_flow_key(FlowTuple(src_ip, dst_ip, src_port, dst_port, protocol));
}
