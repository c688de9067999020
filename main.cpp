#include "feature_extractor.hpp"
#include "feature_publisher.hpp"
#include "packet_source.hpp"
#include "config.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <csignal>
#include <cstdlib>

static std::atomic<bool> g_running{true};

static void signal_handler(int signum) {
    (void)signum;
    g_running.store(false);
}

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Capture:\n";
    std::cout << "  --interface <dev>    Live capture device (default: first available)\n";
    std::cout << "  --pcap <file>        Read packets from a capture file instead\n";
    std::cout << "  --port <n>           Ingress port id stamped on packets (default: 0)\n";
    std::cout << "  --batch-size <n>     Packets per capture batch (default: 32)\n";
    std::cout << "  --filter <bpf>       BPF filter expression\n";
    std::cout << "Output:\n";
    std::cout << "  --pipe <path>        Publisher pipe (default: /tmp/flowlens.sock)\n";
    std::cout << "  --no-publish         Disable publishing\n";
    std::cout << "Flows:\n";
    std::cout << "  --timeout <sec>      Idle flow timeout (default: 600)\n";
    std::cout << "  --threshold <n>      Table size that triggers eviction (default: 1000)\n";
    std::cout << "General:\n";
    std::cout << "  --config <file>      key=value properties file\n";
    std::cout << "  --verbose            Print every feature record\n";
    std::cout << "  --help               Show this help\n";
}

// Command line values are applied after the config file so they win.
static bool parse_arguments(int argc, char* argv[], AppConfig& config) {
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> overrides;

    for(int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) -> bool {
            if(i + 1 >= argc) {
                std::cerr << "[flowlens] Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if(arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if(arg == "--config") {
            if(!next_value(config_file)) return false;
        } else if(arg == "--interface") {
            if(!next_value(value)) return false;
            overrides.emplace_back("capture.interface", value);
        } else if(arg == "--pcap") {
            if(!next_value(value)) return false;
            overrides.emplace_back("capture.pcap_file", value);
        } else if(arg == "--port") {
            if(!next_value(value)) return false;
            overrides.emplace_back("capture.port", value);
        } else if(arg == "--batch-size") {
            if(!next_value(value)) return false;
            overrides.emplace_back("capture.batch_size", value);
        } else if(arg == "--filter") {
            if(!next_value(value)) return false;
            overrides.emplace_back("capture.filter", value);
        } else if(arg == "--pipe") {
            if(!next_value(value)) return false;
            overrides.emplace_back("publisher.pipe", value);
        } else if(arg == "--no-publish") {
            overrides.emplace_back("publisher.enabled", "false");
        } else if(arg == "--timeout") {
            if(!next_value(value)) return false;
            overrides.emplace_back("extractor.flow_timeout", value);
        } else if(arg == "--threshold") {
            if(!next_value(value)) return false;
            overrides.emplace_back("extractor.eviction_threshold", value);
        } else if(arg == "--verbose") {
            overrides.emplace_back("extractor.verbose", "true");
        } else {
            std::cerr << "[flowlens] Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if(!config_file.empty() && !load_config_file(config_file, config)) {
        std::cerr << "[flowlens] Problems loading " << config_file << ", continuing with defaults\n";
    }

    for(const auto& kv : overrides) {
        if(apply_config_value(kv.first, kv.second, config) != ConfigResult::OK) {
            std::cerr << "[flowlens] Invalid value '" << kv.second << "' for " << kv.first << "\n";
            return false;
        }
    }

    return true;
}

int main(int argc, char* argv[]) {
    AppConfig config;
    if(!parse_arguments(argc, argv, config)) {
        return 1;
    }

    std::cout << "flowlens - flow feature extraction" << std::endl;
    std::cout << "==================================" << std::endl;
    print_config(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<FeatureExtractor> extractor;
    std::unique_ptr<FeaturePublisher> publisher;
    PacketSource source(config.capture);

    try {
        extractor = std::make_unique<FeatureExtractor>(config.extractor);

        if(config.publisher.enabled) {
            publisher = std::make_unique<FeaturePublisher>(config.publisher);
            if(publisher->start_client() != 0) {
                std::cerr << "[flowlens] Failed to start publisher\n";
                return 1;
            }
        }
    } catch(const std::exception& e) {
        std::cerr << "[flowlens] Initialization failed: " << e.what() << std::endl;
        return 1;
    }

    if(!source.open()) {
        std::cerr << "[flowlens] Failed to open packet source\n";
        if(publisher) publisher->stop();
        return 1;
    }

    std::cout << "[flowlens] Starting packet capture loop...\n";

    uint64_t records = 0;
    uint64_t publish_failures = 0;
    bool verbose = config.extractor.verbose;

    auto on_packet = [&](const RawPacket& packet) {
        FeatureRecord record;
        if(!extractor->extract(packet, record)) {
            return;
        }
        records++;

        if(publisher && !publisher->publish(record)) {
            publish_failures++;
        }
        if(verbose) {
            std::cout << record.to_json().dump() << "\n";
        }
    };

    while(g_running.load()) {
        int captured = source.capture_batch(on_packet);

        if(captured < 0) {
            // end of capture file or capture error
            break;
        }
        if(captured == 0) {
            // short sleep to prevent CPU spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::cout << "[flowlens] Stopping, " << records << " feature records produced";
    if(publish_failures > 0) {
        std::cout << ", " << publish_failures << " not published";
    }
    std::cout << "\n";

    extractor->drain();
    if(publisher) {
        publisher->stop();
    }
    source.close();

    source.print_stats();
    extractor->print_stats();
    if(publisher) {
        publisher->print_stats();
    }

    return 0;
}
