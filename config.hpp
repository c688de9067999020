#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "flow_table.hpp"
#include <string>
#include <cstdint>

struct ExtractorConfig {
    double flow_timeout_seconds = DEFAULT_FLOW_TIMEOUT_SECONDS;
    size_t eviction_threshold = DEFAULT_EVICTION_THRESHOLD;
    size_t shard_count = DEFAULT_SHARD_COUNT;
    bool verbose = false;
};

struct CaptureConfig {
    std::string interface;
    std::string pcap_file;      // wins over interface when both are set
    int snaplen = 65535;
    bool promiscuous = true;
    int timeout_ms = 100;
    int batch_size = 32;
    uint16_t port = 0;
    std::string bpf_filter;
};

struct PublisherConfig {
    std::string pipe_name = "/tmp/flowlens.sock";
    std::string topic = "network-flows";
    std::string client_id = "flowlens";
    bool enabled = true;
};

struct AppConfig {
    ExtractorConfig extractor;
    CaptureConfig capture;
    PublisherConfig publisher;
};

// Reads a key=value properties file into config. Unknown keys are skipped
// with a warning; a malformed value fails the load and keeps the old value.
bool load_config_file(const std::string& path, AppConfig& config);

enum class ConfigResult {
    OK,
    UNKNOWN_KEY,
    BAD_VALUE
};

ConfigResult apply_config_value(const std::string& key, const std::string& value, AppConfig& config);

void print_config(const AppConfig& config);

#endif // CONFIG_HPP
