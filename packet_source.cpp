#include "packet_source.hpp"
#include <iostream>

PacketSource::PacketSource(const CaptureConfig& config)
    : config_(config)
    , handle_(nullptr)
    , filter_program_{}
    , filter_installed_(false)
    , offline_(!config.pcap_file.empty())
    , exhausted_(false) {
}

PacketSource::~PacketSource() {
    close();
}

bool PacketSource::open() {
    if(handle_) return true;

    char errbuf[PCAP_ERRBUF_SIZE];
    errbuf[0] = '\0';

    if(offline_) {
        source_name_ = config_.pcap_file;
        handle_ = pcap_open_offline(config_.pcap_file.c_str(), errbuf);
        if(!handle_) {
            std::cerr << "[Capture] Failed to open PCAP file: " << config_.pcap_file << " - " << errbuf << std::endl;
            return false;
        }
    } else {
        source_name_ = config_.interface;

        // no interface given: take the first device pcap reports
        if(source_name_.empty()) {
            pcap_if_t* devices = nullptr;
            if(pcap_findalldevs(&devices, errbuf) != 0 || devices == nullptr) {
                std::cerr << "[Capture] No capture device available: " << errbuf << std::endl;
                return false;
            }
            source_name_ = devices->name;
            pcap_freealldevs(devices);
        }

        handle_ = pcap_open_live(source_name_.c_str(), config_.snaplen,
                                 config_.promiscuous ? 1 : 0, config_.timeout_ms, errbuf);
        if(!handle_) {
            std::cerr << "[Capture] Failed to open interface " << source_name_ << ": " << errbuf << std::endl;
            return false;
        }
    }

    if(pcap_datalink(handle_) != DLT_EN10MB) {
        std::cerr << "[Capture] Warning: " << source_name_ << " link type is "
                  << pcap_datalink_val_to_name(pcap_datalink(handle_))
                  << ", only Ethernet frames will be analyzed" << std::endl;
    }

    if(!config_.bpf_filter.empty() && !install_filter()) {
        close();
        return false;
    }

    exhausted_ = false;
    std::cout << "[Capture] Opened " << (offline_ ? "file " : "interface ") << source_name_
              << " (batch size " << config_.batch_size << ", port " << config_.port << ")\n";
    return true;
}

bool PacketSource::install_filter() {
    if(pcap_compile(handle_, &filter_program_, config_.bpf_filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
        std::cerr << "[Capture] pcap_compile '" << config_.bpf_filter << "': " << pcap_geterr(handle_) << std::endl;
        return false;
    }
    filter_installed_ = true;

    if(pcap_setfilter(handle_, &filter_program_) != 0) {
        std::cerr << "[Capture] pcap_setfilter: " << pcap_geterr(handle_) << std::endl;
        return false;
    }
    return true;
}

void PacketSource::close() {
    if(!handle_) return;

    if(!offline_) {
        struct pcap_stat ps;
        if(pcap_stats(handle_, &ps) == 0) {
            stats_.kernel_received = ps.ps_recv;
            stats_.kernel_dropped = ps.ps_drop;
            stats_.interface_dropped = ps.ps_ifdrop;
        }
    }

    if(filter_installed_) {
        pcap_freecode(&filter_program_);
        filter_installed_ = false;
    }

    pcap_close(handle_);
    handle_ = nullptr;
    std::cout << "[Capture] Closed " << source_name_ << "\n";
}

int PacketSource::capture_batch(const PacketCallback& callback) {
    if(!handle_ || exhausted_) return -1;

    struct pcap_pkthdr* header;
    const u_char* packet_data;
    int delivered = 0;

    while(delivered < config_.batch_size) {
        int r = pcap_next_ex(handle_, &header, &packet_data);

        if(r == 1) {
            RawPacket packet;
            packet.data = packet_data;
            packet.caplen = header->caplen;
            packet.length = header->len;
            packet.port = config_.port;
            packet.timestamp = header->ts;

            stats_.packets_read++;
            stats_.bytes_read += header->len;
            delivered++;

            callback(packet);
        } else if(r == 0) {
            // live capture timeout
            break;
        } else if(r == PCAP_ERROR_BREAK) {
            exhausted_ = true;
            break;
        } else {
            std::cerr << "[Capture] pcap_next_ex: " << pcap_geterr(handle_) << std::endl;
            exhausted_ = true;
            break;
        }
    }

    if(delivered > 0) {
        stats_.batches++;
        return delivered;
    }
    return exhausted_ ? -1 : 0;
}

CaptureStats PacketSource::stats() {
    if(handle_ && !offline_) {
        struct pcap_stat ps;
        if(pcap_stats(handle_, &ps) == 0) {
            stats_.kernel_received = ps.ps_recv;
            stats_.kernel_dropped = ps.ps_drop;
            stats_.interface_dropped = ps.ps_ifdrop;
        }
    }
    return stats_;
}

void PacketSource::print_stats() {
    CaptureStats s = stats();
    std::cout << "\n=== Capture Statistics ===\n";
    std::cout << "Source: " << source_name_ << (offline_ ? " (file)" : " (live)") << "\n";
    std::cout << "Packets Read: " << s.packets_read << "\n";
    std::cout << "Bytes Read: " << s.bytes_read << "\n";
    std::cout << "Batches: " << s.batches << "\n";
    if(!offline_) {
        std::cout << "Kernel Received: " << s.kernel_received << "\n";
        std::cout << "Kernel Dropped: " << s.kernel_dropped << "\n";
        std::cout << "Interface Dropped: " << s.interface_dropped << "\n";
    }
    std::cout << "==========================\n";
}
