#ifndef PACKET_SOURCE_HPP
#define PACKET_SOURCE_HPP

#include "packet_parser.hpp"
#include "config.hpp"
#include <pcap/pcap.h>
#include <functional>
#include <string>
#include <cstdint>

struct CaptureStats {
    uint64_t packets_read = 0;
    uint64_t bytes_read = 0;
    uint64_t batches = 0;
    // live captures only, from pcap_stats()
    uint64_t kernel_received = 0;
    uint64_t kernel_dropped = 0;
    uint64_t interface_dropped = 0;
};

// packet callback, the RawPacket data is only valid during the call
using PacketCallback = std::function<void(const RawPacket& packet)>;

// libpcap-backed capture: a live interface or an offline capture file
class PacketSource {
private:
    CaptureConfig config_;
    pcap_t* handle_;
    struct bpf_program filter_program_;
    bool filter_installed_;
    bool offline_;
    bool exhausted_;
    std::string source_name_;
    CaptureStats stats_;

public:
    explicit PacketSource(const CaptureConfig& config);
    ~PacketSource();

    // disable copy constructor and assignment
    PacketSource(const PacketSource&) = delete;
    PacketSource& operator=(const PacketSource&) = delete;

    bool open();
    void close();

    // Delivers up to batch_size packets. Returns the number delivered, 0 when
    // a live capture timed out, -1 at end of file or on a capture error.
    int capture_batch(const PacketCallback& callback);

    bool is_open() const { return handle_ != nullptr; }
    bool is_offline() const { return offline_; }
    bool is_exhausted() const { return exhausted_; }

    CaptureStats stats();
    void print_stats();

private:
    bool install_filter();
};

#endif // PACKET_SOURCE_HPP
