#ifndef FEATURE_PUBLISHER_HPP
#define FEATURE_PUBLISHER_HPP

#include <uv.h>
#include "feature_calculator.hpp"
#include "config.hpp"
#include <memory>
#include <functional>
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <deque>

struct PublisherStats {
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t failed = 0;
    uint64_t queued = 0;
};

// server side callback: message key and the JSON envelope text
using MessageCallback = std::function<void(const std::string& key, const std::string& value)>;

// Streams feature records over a Unix-domain pipe, one "<key>\t<json>\n"
// line per record. In client mode publish() may be called from any thread;
// the libuv loop runs on its own thread and performs every write. Server
// mode accepts clients and hands each received line to a callback.
class FeaturePublisher {
private:
    PublisherConfig config_;
    std::unique_ptr<uv_loop_t> loop_;
    std::unique_ptr<uv_pipe_t> pipe_;      // listener (server) or connection (client)
    std::unique_ptr<uv_async_t> async_;
    uv_connect_t connect_req_;
    uv_shutdown_t shutdown_req_;
    bool is_server_;
    bool handles_initialized_;
    std::thread thread_;

    std::atomic<bool> running_;
    std::atomic<bool> connected_;
    std::atomic<bool> connect_failed_;
    bool stopping_;                        // guarded by queue_mutex_

    std::mutex queue_mutex_;
    std::deque<std::string> pending_;

    MessageCallback callback_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};

    // write request structure for async operations
    struct WriteReq {
        uv_write_t req;
        uv_buf_t buf;
        std::unique_ptr<char[]> data;
        FeaturePublisher* owner;
    };

    // accepted server-side client with its partial line
    struct Connection {
        uv_pipe_t handle;
        std::string buffer;
        FeaturePublisher* owner;
    };

public:
    explicit FeaturePublisher(const PublisherConfig& config);
    ~FeaturePublisher();

    // disable copy constructor and assignment
    FeaturePublisher(const FeaturePublisher&) = delete;
    FeaturePublisher& operator=(const FeaturePublisher&) = delete;

    // client functions (flowlens -> sink)
    int start_client();
    bool publish(const FeatureRecord& record);
    bool publish_line(const std::string& line);

    // server functions (sink side)
    int start_server(MessageCallback callback);

    // flushes pending writes, closes handles and joins the loop thread
    void stop();

    bool is_running() const { return running_.load(); }
    bool is_connected() const { return connected_.load(); }
    bool is_server() const { return is_server_; }

    PublisherStats stats();
    void print_stats();

    // "<key>\t{"topic":..,"client_id":..,"value":{record}}\n"
    static std::string encode_message(const FeatureRecord& record, const std::string& topic,
                                      const std::string& client_id);
    // splits one line (without '\n') into key and JSON text
    static bool decode_message(const std::string& line, std::string& key_out, std::string& value_out);

private:
    void init_handles();
    void run_event_loop();
    void flush_pending();
    void write_line(const std::string& line);
    void close_all_handles();
    void cleanup_handles();
    void process_received_data(Connection* connection, const char* data, size_t len);

    // libuv callback functions (static for C compatibility)
    static void async_cb(uv_async_t* handle);
    static void alloc_cb(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
    static void read_cb(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void connection_cb(uv_stream_t* server, int status);
    static void connect_cb(uv_connect_t* req, int status);
    static void write_cb(uv_write_t* req, int status);
    static void shutdown_cb(uv_shutdown_t* req, int status);
    static void close_cb(uv_handle_t* handle);
    static void connection_close_cb(uv_handle_t* handle);
    static void walk_cb(uv_handle_t* handle, void* arg);
};

#endif // FEATURE_PUBLISHER_HPP
