#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <cmath>

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool parse_bool(const std::string& value, bool& out) {
    if(value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if(value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_unsigned(const std::string& value, unsigned long max_value, unsigned long& out) {
    if(value.empty() || value[0] == '-') return false;
    try {
        size_t pos = 0;
        unsigned long parsed = std::stoul(value, &pos);
        if(pos != value.size() || parsed > max_value) return false;
        out = parsed;
        return true;
    } catch(const std::exception&) {
        return false;
    }
}

static bool parse_seconds(const std::string& value, double& out) {
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        // timeouts must be finite
        if(pos != value.size() || !std::isfinite(parsed) || parsed < 0.0) return false;
        out = parsed;
        return true;
    } catch(const std::exception&) {
        return false;
    }
}

ConfigResult apply_config_value(const std::string& key, const std::string& value, AppConfig& config) {
    unsigned long number = 0;

    // extractor
    if(key == "extractor.flow_timeout") {
        return parse_seconds(value, config.extractor.flow_timeout_seconds) ? ConfigResult::OK : ConfigResult::BAD_VALUE;
    }
    if(key == "extractor.eviction_threshold") {
        if(!parse_unsigned(value, 100000000UL, number)) return ConfigResult::BAD_VALUE;
        config.extractor.eviction_threshold = number;
        return ConfigResult::OK;
    }
    if(key == "extractor.shard_count") {
        if(!parse_unsigned(value, 4096UL, number) || number == 0 || (number & (number - 1)) != 0) {
            return ConfigResult::BAD_VALUE;
        }
        config.extractor.shard_count = number;
        return ConfigResult::OK;
    }
    if(key == "extractor.verbose") {
        return parse_bool(value, config.extractor.verbose) ? ConfigResult::OK : ConfigResult::BAD_VALUE;
    }

    // capture
    if(key == "capture.interface") {
        config.capture.interface = value;
        return ConfigResult::OK;
    }
    if(key == "capture.pcap_file") {
        config.capture.pcap_file = value;
        return ConfigResult::OK;
    }
    if(key == "capture.snaplen") {
        if(!parse_unsigned(value, 262144UL, number) || number == 0) return ConfigResult::BAD_VALUE;
        config.capture.snaplen = static_cast<int>(number);
        return ConfigResult::OK;
    }
    if(key == "capture.promiscuous") {
        return parse_bool(value, config.capture.promiscuous) ? ConfigResult::OK : ConfigResult::BAD_VALUE;
    }
    if(key == "capture.timeout_ms") {
        if(!parse_unsigned(value, 60000UL, number)) return ConfigResult::BAD_VALUE;
        config.capture.timeout_ms = static_cast<int>(number);
        return ConfigResult::OK;
    }
    if(key == "capture.batch_size") {
        if(!parse_unsigned(value, 65536UL, number) || number == 0) return ConfigResult::BAD_VALUE;
        config.capture.batch_size = static_cast<int>(number);
        return ConfigResult::OK;
    }
    if(key == "capture.port") {
        if(!parse_unsigned(value, 65535UL, number)) return ConfigResult::BAD_VALUE;
        config.capture.port = static_cast<uint16_t>(number);
        return ConfigResult::OK;
    }
    if(key == "capture.filter") {
        config.capture.bpf_filter = value;
        return ConfigResult::OK;
    }

    // publisher
    if(key == "publisher.pipe") {
        if(value.empty()) return ConfigResult::BAD_VALUE;
        config.publisher.pipe_name = value;
        return ConfigResult::OK;
    }
    if(key == "publisher.topic") {
        config.publisher.topic = value;
        return ConfigResult::OK;
    }
    if(key == "publisher.client_id") {
        config.publisher.client_id = value;
        return ConfigResult::OK;
    }
    if(key == "publisher.enabled") {
        return parse_bool(value, config.publisher.enabled) ? ConfigResult::OK : ConfigResult::BAD_VALUE;
    }

    return ConfigResult::UNKNOWN_KEY;
}

bool load_config_file(const std::string& path, AppConfig& config) {
    std::ifstream file(path);
    if(!file.is_open()) {
        std::cerr << "[Config] Config file " << path << " not found, using defaults" << std::endl;
        return false;
    }

    bool ok = true;
    std::string line;
    size_t line_number = 0;

    while(std::getline(file, line)) {
        line_number++;
        line = trim(line);

        // skip empty lines and comments
        if(line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if(eq == std::string::npos) {
            std::cerr << "[Config] Ignoring line " << line_number << " without '=': " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        switch(apply_config_value(key, value, config)) {
            case ConfigResult::OK:
                break;
            case ConfigResult::UNKNOWN_KEY:
                std::cerr << "[Config] Unknown key '" << key << "' on line " << line_number << std::endl;
                break;
            case ConfigResult::BAD_VALUE:
                std::cerr << "[Config] Invalid value '" << value << "' for " << key
                          << " on line " << line_number << std::endl;
                ok = false;
                break;
        }
    }

    return ok;
}

void print_config(const AppConfig& config) {
    std::cout << "\n=== flowlens Configuration ===\n";
    std::cout << "Extractor:\n";
    std::cout << "  Flow Timeout: " << config.extractor.flow_timeout_seconds << " s\n";
    std::cout << "  Eviction Threshold: " << config.extractor.eviction_threshold << " flows\n";
    std::cout << "  Shards: " << config.extractor.shard_count << "\n";
    std::cout << "  Verbose: " << (config.extractor.verbose ? "yes" : "no") << "\n";
    std::cout << "Capture:\n";
    if(!config.capture.pcap_file.empty()) {
        std::cout << "  PCAP File: " << config.capture.pcap_file << "\n";
    } else {
        std::cout << "  Interface: " << (config.capture.interface.empty() ? "(default)" : config.capture.interface) << "\n";
    }
    std::cout << "  Batch Size: " << config.capture.batch_size << "\n";
    std::cout << "  Port: " << config.capture.port << "\n";
    if(!config.capture.bpf_filter.empty()) {
        std::cout << "  Filter: " << config.capture.bpf_filter << "\n";
    }
    std::cout << "Publisher:\n";
    std::cout << "  Enabled: " << (config.publisher.enabled ? "yes" : "no") << "\n";
    std::cout << "  Pipe: " << config.publisher.pipe_name << "\n";
    std::cout << "  Topic: " << config.publisher.topic << "\n";
    std::cout << "==============================\n";
}
