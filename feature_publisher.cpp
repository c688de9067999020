#include "feature_publisher.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

FeaturePublisher::FeaturePublisher(const PublisherConfig& config)
    : config_(config)
    , connect_req_{}
    , shutdown_req_{}
    , is_server_(false)
    , handles_initialized_(false)
    , running_(false)
    , connected_(false)
    , connect_failed_(false)
    , stopping_(false) {

    // initialize libuv loop
    loop_ = std::make_unique<uv_loop_t>();
    if(uv_loop_init(loop_.get()) != 0) {
        throw std::runtime_error("Failed to initialize libuv loop");
    }

    pipe_ = std::make_unique<uv_pipe_t>();
    async_ = std::make_unique<uv_async_t>();
}

FeaturePublisher::~FeaturePublisher() {
    stop();

    if(handles_initialized_) {
        cleanup_handles();
    }

    if(thread_.joinable()) {
        thread_.join();
    }

    if(loop_) {
        int r = uv_loop_close(loop_.get());
        if(r) {
            std::cerr << "[Publisher] Loop close error: " << uv_strerror(r) << std::endl;
        }
    }
}

void FeaturePublisher::init_handles() {
    uv_pipe_init(loop_.get(), pipe_.get(), 0);
    pipe_->data = this;

    uv_async_init(loop_.get(), async_.get(), async_cb);
    async_->data = this;

    handles_initialized_ = true;
}

// closes handles of a loop that never ran
void FeaturePublisher::cleanup_handles() {
    uv_walk(loop_.get(), walk_cb, this);
    uv_run(loop_.get(), UV_RUN_NOWAIT);
    handles_initialized_ = false;
}

int FeaturePublisher::start_client() {
    if(running_.load()) return -1;

    is_server_ = false;
    connected_ = false;
    connect_failed_ = false;

    // a closed sink must surface as EPIPE in write_cb, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    init_handles();

    connect_req_.data = this;
    uv_pipe_connect(&connect_req_, pipe_.get(), config_.pipe_name.c_str(), connect_cb);

    running_.store(true);
    std::cout << "[Publisher] Connecting to " << config_.pipe_name
              << " (topic " << config_.topic << ")\n";

    // start event loop in separate thread
    thread_ = std::thread([this]() { run_event_loop(); });
    return 0;
}

int FeaturePublisher::start_server(MessageCallback callback) {
    if(running_.load()) return -1;

    is_server_ = true;
    callback_ = std::move(callback);
    init_handles();

    // remove existing pipe if it exists
    unlink(config_.pipe_name.c_str());

    int r = uv_pipe_bind(pipe_.get(), config_.pipe_name.c_str());
    if(r) {
        std::cerr << "[Publisher] Bind error: " << uv_strerror(r) << std::endl;
        cleanup_handles();
        return r;
    }

    r = uv_listen(reinterpret_cast<uv_stream_t*>(pipe_.get()), 128, connection_cb);
    if(r) {
        std::cerr << "[Publisher] Listen error: " << uv_strerror(r) << std::endl;
        cleanup_handles();
        return r;
    }

    running_.store(true);
    std::cout << "[Publisher] Server listening on: " << config_.pipe_name << std::endl;

    thread_ = std::thread([this]() { run_event_loop(); });
    return 0;
}

void FeaturePublisher::stop() {
    if(!running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        uv_async_send(async_.get());
    }

    // wait for thread to finish
    if(thread_.joinable()) {
        thread_.join();
    }

    running_.store(false);
    connected_.store(false);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }

    if(is_server_) {
        unlink(config_.pipe_name.c_str());
    }

    std::cout << "[Publisher] Stopped" << std::endl;
}

void FeaturePublisher::run_event_loop() {
    std::cout << "[Publisher] Starting event loop" << std::endl;
    uv_run(loop_.get(), UV_RUN_DEFAULT);
    handles_initialized_ = false;
    std::cout << "[Publisher] Event loop finished" << std::endl;
}

bool FeaturePublisher::publish(const FeatureRecord& record) {
    return publish_line(encode_message(record, config_.topic, config_.client_id));
}

bool FeaturePublisher::publish_line(const std::string& line) {
    published_++;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if(is_server_ || !running_.load() || stopping_ || connect_failed_.load()) {
        failed_++;
        return false;
    }

    pending_.push_back(line);
    uv_async_send(async_.get());
    return true;
}

void FeaturePublisher::flush_pending() {
    std::deque<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if(!connected_.load()) return;
        batch.swap(pending_);
    }

    for(const auto& line : batch) {
        write_line(line);
    }
}

void FeaturePublisher::write_line(const std::string& line) {
    auto write_req = std::make_unique<WriteReq>();
    write_req->owner = this;
    write_req->data = std::make_unique<char[]>(line.length());
    std::memcpy(write_req->data.get(), line.data(), line.length());

    write_req->buf = uv_buf_init(write_req->data.get(), static_cast<unsigned int>(line.length()));

    WriteReq* req_ptr = write_req.release();
    int r = uv_write(&req_ptr->req, reinterpret_cast<uv_stream_t*>(pipe_.get()), &req_ptr->buf, 1, write_cb);
    if(r) {
        std::cerr << "[Publisher] Write error: " << uv_strerror(r) << std::endl;
        failed_++;
        delete req_ptr;
    }
}

void FeaturePublisher::close_all_handles() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        failed_ += pending_.size();
        pending_.clear();
    }
    uv_walk(loop_.get(), walk_cb, this);
}

void FeaturePublisher::process_received_data(Connection* connection, const char* data, size_t len) {
    connection->buffer.append(data, len);

    size_t newline;
    while((newline = connection->buffer.find('\n')) != std::string::npos) {
        std::string line = connection->buffer.substr(0, newline);
        connection->buffer.erase(0, newline + 1);

        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if(line.empty()) continue;

        std::string key;
        std::string value;
        if(!decode_message(line, key, value)) {
            std::cerr << "[Publisher] Dropping malformed message (" << line.size() << " bytes)" << std::endl;
            continue;
        }

        delivered_++;
        if(callback_) {
            callback_(key, value);
        }
    }
}

PublisherStats FeaturePublisher::stats() {
    PublisherStats s;
    s.published = published_.load();
    s.delivered = delivered_.load();
    s.failed = failed_.load();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        s.queued = pending_.size();
    }
    return s;
}

void FeaturePublisher::print_stats() {
    PublisherStats s = stats();
    std::cout << "\n=== Publisher Statistics ===\n";
    std::cout << "Mode: " << (is_server_ ? "server" : "client") << "\n";
    std::cout << "Pipe: " << config_.pipe_name << "\n";
    std::cout << "Topic: " << config_.topic << "\n";
    if(is_server_) {
        std::cout << "Messages Received: " << s.delivered << "\n";
    } else {
        std::cout << "Messages Published: " << s.published << "\n";
        std::cout << "Messages Delivered: " << s.delivered << "\n";
        std::cout << "Messages Failed: " << s.failed << "\n";
        std::cout << "Messages Queued: " << s.queued << "\n";
    }
    std::cout << "============================\n";
}

std::string FeaturePublisher::encode_message(const FeatureRecord& record, const std::string& topic,
                                             const std::string& client_id) {
    nlohmann::ordered_json envelope;
    envelope["topic"] = topic;
    envelope["client_id"] = client_id;
    envelope["value"] = record.to_json();

    // dump() escapes control characters, so the line holds no raw '\t' or '\n';
    // invalid UTF-8 in configured strings becomes U+FFFD instead of throwing
    return record.message_key() + "\t" +
           envelope.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

bool FeaturePublisher::decode_message(const std::string& line, std::string& key_out, std::string& value_out) {
    size_t tab = line.find('\t');
    if(tab == std::string::npos || tab == 0 || tab + 1 >= line.size()) {
        return false;
    }

    key_out = line.substr(0, tab);
    value_out = line.substr(tab + 1);
    return true;
}

// static libuv callback functions (C-compatible)
void FeaturePublisher::async_cb(uv_async_t* handle) {
    FeaturePublisher* self = static_cast<FeaturePublisher*>(handle->data);

    std::deque<std::string> batch;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        stopping = self->stopping_;
        if(self->connected_.load()) {
            batch.swap(self->pending_);
        }
    }

    for(const auto& line : batch) {
        self->write_line(line);
    }

    if(!stopping) return;

    // let queued writes drain before the connection goes away
    if(!self->is_server_ && self->connected_.load()) {
        self->shutdown_req_.data = self;
        int r = uv_shutdown(&self->shutdown_req_, reinterpret_cast<uv_stream_t*>(self->pipe_.get()), shutdown_cb);
        if(r == 0) return;
        std::cerr << "[Publisher] Shutdown error: " << uv_strerror(r) << std::endl;
    }
    self->close_all_handles();
}

void FeaturePublisher::alloc_cb(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf) {
    (void)handle;
    buf->base = new char[suggested_size];
    buf->len = suggested_size;
}

void FeaturePublisher::read_cb(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    Connection* connection = static_cast<Connection*>(stream->data);

    if(nread < 0) {
        if(nread != UV_EOF) {
            std::cerr << "[Publisher] Read error: " << uv_strerror(static_cast<int>(nread)) << std::endl;
        }
        if(!uv_is_closing(reinterpret_cast<uv_handle_t*>(stream))) {
            uv_close(reinterpret_cast<uv_handle_t*>(stream), connection_close_cb);
        }
        if(buf->base) delete[] buf->base;
        return;
    }

    if(nread > 0) {
        connection->owner->process_received_data(connection, buf->base, static_cast<size_t>(nread));
    }

    if(buf->base) delete[] buf->base;
}

void FeaturePublisher::connection_cb(uv_stream_t* server, int status) {
    if(status < 0) {
        std::cerr << "[Publisher] Connection error: " << uv_strerror(status) << std::endl;
        return;
    }

    FeaturePublisher* self = static_cast<FeaturePublisher*>(server->data);
    auto connection = std::make_unique<Connection>();
    connection->owner = self;
    uv_pipe_init(self->loop_.get(), &connection->handle, 0);
    connection->handle.data = connection.get();

    // ownership moves to libuv, released again in connection_close_cb
    Connection* conn = connection.release();
    if(uv_accept(server, reinterpret_cast<uv_stream_t*>(&conn->handle)) == 0) {
        uv_read_start(reinterpret_cast<uv_stream_t*>(&conn->handle), alloc_cb, read_cb);
        std::cout << "[Publisher] Client connected" << std::endl;
    } else {
        uv_close(reinterpret_cast<uv_handle_t*>(&conn->handle), connection_close_cb);
    }
}

void FeaturePublisher::connect_cb(uv_connect_t* req, int status) {
    FeaturePublisher* self = static_cast<FeaturePublisher*>(req->data);

    if(status < 0) {
        std::cerr << "[Publisher] Connect error: " << uv_strerror(status) << std::endl;
        self->connect_failed_.store(true);
        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        self->failed_ += self->pending_.size();
        self->pending_.clear();
        return;
    }

    self->connected_.store(true);
    std::cout << "[Publisher] Connected to event server: " << self->config_.pipe_name << std::endl;
    self->flush_pending();
}

void FeaturePublisher::write_cb(uv_write_t* req, int status) {
    WriteReq* write_req = reinterpret_cast<WriteReq*>(req);
    FeaturePublisher* self = write_req->owner;

    if(status < 0) {
        std::cerr << "[Publisher] Write error: " << uv_strerror(status) << std::endl;
        self->failed_++;
    } else {
        uint64_t delivered = ++self->delivered_;
        if(delivered % 1000 == 0) {
            std::cout << "[Publisher] Delivered " << delivered << " messages to " << self->config_.topic << std::endl;
        }
    }

    delete write_req;
}

void FeaturePublisher::shutdown_cb(uv_shutdown_t* req, int status) {
    FeaturePublisher* self = static_cast<FeaturePublisher*>(req->data);
    if(status < 0) {
        std::cerr << "[Publisher] Shutdown error: " << uv_strerror(status) << std::endl;
    }
    self->close_all_handles();
}

void FeaturePublisher::close_cb(uv_handle_t* handle) {
    // member handles are owned by the publisher
    (void)handle;
}

void FeaturePublisher::connection_close_cb(uv_handle_t* handle) {
    delete static_cast<Connection*>(handle->data);
}

void FeaturePublisher::walk_cb(uv_handle_t* handle, void* arg) {
    FeaturePublisher* self = static_cast<FeaturePublisher*>(arg);
    if(uv_is_closing(handle)) return;

    if(handle == reinterpret_cast<uv_handle_t*>(self->pipe_.get()) ||
       handle == reinterpret_cast<uv_handle_t*>(self->async_.get())) {
        uv_close(handle, close_cb);
    } else {
        uv_close(handle, connection_close_cb);
    }
}
