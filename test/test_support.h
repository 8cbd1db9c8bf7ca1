#ifndef SWARMFETCH_TEST_TEST_SUPPORT_H
#define SWARMFETCH_TEST_TEST_SUPPORT_H

#include "swarmfetch/origin/fetcher.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/swarm/engine.h"
#include "swarmfetch/tracker/client.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cstring>

namespace swarmfetch::test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag = "swarmfetch_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (tag + "_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::string make_payload(size_t size, uint32_t seed = 1) {
    std::string data(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1664525u + 1013904223u;
        data[i] = static_cast<char>(x >> 24);
    }
    return data;
}

inline void write_file(const std::string& path, const std::string& data) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// Files in dir whose name starts with '.' (temp files left behind)
inline size_t count_hidden_files(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind('.', 0) == 0) {
            ++count;
        }
    }
    return count;
}

inline ArtifactFingerprint make_fingerprint(const std::string& filename = "model.safetensors") {
    ArtifactFingerprint fp;
    fp.repo_id = "acme/tiny-model";
    fp.revision = "main";
    fp.repo_type = "model";
    fp.filename = filename;
    return fp;
}

// Tracker transport answering from a fixed script and recording every call
class ScriptedTransport : public TrackerTransport {
public:
    struct Call {
        std::string method;
        std::string target;
        std::string body;
        uint32_t timeout_ms = 0;
    };

    // Response for requests whose "METHOD target" starts with prefix,
    // optionally answered only after delay
    void on(const std::string& method, const std::string& target_prefix, HttpResult result,
            std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[method + " " + target_prefix] = Route{std::move(result), delay};
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    HttpResult send(const std::string& method, const std::string& target,
                    const std::string& body, uint32_t timeout_ms) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        std::optional<Route> route;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({method, target, body, timeout_ms});
            std::string key = method + " " + target;
            for (const auto& [prefix, r] : routes_) {
                if (key.rfind(prefix, 0) == 0) {
                    route = r;
                    break;
                }
            }
        }
        if (!route) {
            HttpResult unreachable;
            unreachable.code = ErrorCode::ConnectionFailed;
            unreachable.error = "connection refused";
            return unreachable;
        }
        if (route->delay.count() > 0) {
            std::this_thread::sleep_for(route->delay);
        }
        return route->result;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& method, const std::string& target_prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.method == method && c.target.rfind(target_prefix, 0) == 0) ++n;
        }
        return n;
    }

private:
    struct Route {
        HttpResult result;
        std::chrono::milliseconds delay{0};
    };

    mutable std::mutex mutex_;
    std::map<std::string, Route> routes_;
    std::vector<Call> calls_;
    std::chrono::milliseconds delay_{0};
};

// Single-threaded HTTP server on 127.0.0.1 for client tests. Each
// connection gets one raw response from the handler, written in full or
// one byte per byte_delay, then the connection is closed.
class LoopbackHttpServer {
public:
    struct Request {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers;  // lower-case names

        std::string header(const std::string& name) const {
            auto it = headers.find(name);
            return it == headers.end() ? "" : it->second;
        }
    };

    using Handler = std::function<std::string(const Request&)>;

    explicit LoopbackHttpServer(Handler handler,
                                std::chrono::milliseconds byte_delay = std::chrono::milliseconds(0))
        : handler_(std::move(handler)), byte_delay_(byte_delay) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 16);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_ = true;
        thread_ = std::thread([this]() { serve_loop(); });
    }

    ~LoopbackHttpServer() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    uint16_t port() const { return port_; }
    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve_loop() {
        while (running_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            handle(fd);
            ::close(fd);
        }
    }

    void handle(int fd) {
        std::string data;
        char buffer[4096];
        size_t head_end = std::string::npos;
        while (running_ && head_end == std::string::npos) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) return;
            data.append(buffer, static_cast<size_t>(n));
            head_end = data.find("\r\n\r\n");
        }
        if (head_end == std::string::npos) return;

        Request request;
        std::istringstream stream(data.substr(0, head_end));
        std::string line;
        std::getline(stream, line);
        std::istringstream status_line(line);
        status_line >> request.method >> request.target;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = line.substr(0, colon);
            for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            request.headers[name] = value;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        std::string response = handler_(request);
        if (byte_delay_.count() == 0) {
            send_all(fd, response.data(), response.size());
            return;
        }
        for (size_t i = 0; i < response.size() && running_; ++i) {
            if (!send_all(fd, response.data() + i, 1)) return;
            std::this_thread::sleep_for(byte_delay_);
        }
    }

    static bool send_all(int fd, const char* data, size_t size) {
        size_t sent = 0;
        while (sent < size) {
            ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    Handler handler_;
    std::chrono::milliseconds byte_delay_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<Request> requests_;
};

// Raw HTTP/1.1 response. content_length overrides the advertised length.
inline std::string raw_response(int status, const std::string& body,
                                const std::vector<std::pair<std::string, std::string>>& headers = {},
                                std::optional<size_t> content_length = std::nullopt) {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " Status\r\n";
    out << "Content-Length: " << content_length.value_or(body.size()) << "\r\n";
    out << "Connection: close\r\n";
    for (const auto& h : headers) {
        out << h.first << ": " << h.second << "\r\n";
    }
    out << "\r\n" << body;
    return out.str();
}

// Serves payload honouring "Range: bytes=a-b" with 206 answers
inline std::string ranged_response(const LoopbackHttpServer::Request& request, const std::string& payload,
                                   const std::vector<std::pair<std::string, std::string>>& headers = {}) {
    auto range = request.header("range");
    if (range.rfind("bytes=", 0) != 0) {
        return raw_response(200, payload, headers);
    }
    auto dash = range.find('-');
    uint64_t first = std::stoull(range.substr(6, dash - 6));
    uint64_t last = std::stoull(range.substr(dash + 1));
    if (first >= payload.size()) {
        auto h = headers;
        h.emplace_back("Content-Range", "bytes */" + std::to_string(payload.size()));
        return raw_response(416, "", h);
    }
    last = std::min<uint64_t>(last, payload.size() - 1);
    auto h = headers;
    h.emplace_back("Content-Range", "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
                                    std::to_string(payload.size()));
    return raw_response(206, payload.substr(first, last - first + 1), h);
}

inline HttpResult http_response(int status, const std::string& body = "") {
    HttpResult r;
    r.status = status;
    r.body = body;
    return r;
}

// Tracker body with a single record for fp
inline std::string tracker_record_body(const ArtifactFingerprint& fp, const SwarmDescriptor& desc,
                                       const std::vector<std::string>& peers = {"127.0.0.1:6999"}) {
    nlohmann::json record = {
        {"repo_id", fp.repo_id},
        {"revision", fp.revision},
        {"repo_type", fp.repo_type},
        {"filename", fp.filename},
        {"name", desc.file_name},
        {"info_hash", desc.content_hash},
        {"peers", peers},
        {"descriptor", desc.to_json()}
    };
    return nlohmann::json::array({record}).dump();
}

// Origin that writes a fixed payload after a delay, honouring cancellation
class FakeOriginFetcher : public OriginFetcher {
public:
    explicit FakeOriginFetcher(std::string payload, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : payload_(std::move(payload)), delay_(delay) {}

    void fail_with(ErrorCode code) { failure_ = code; }

    OriginResult fetch(const ArtifactFingerprint&, const std::string& destination_path,
                       const OriginProgressCallback& on_progress,
                       const std::shared_ptr<CancellationToken>& cancel) override {
        calls_++;
        OriginResult result;
        auto until = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < until) {
            if (cancel && cancel->is_cancelled()) {
                cancelled_ = true;
                result.error = ErrorCode::Cancelled;
                result.message = "cancelled";
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (failure_ != ErrorCode::Success) {
            result.error = failure_;
            result.message = "scripted origin failure";
            return result;
        }
        write_file(destination_path, payload_);
        if (on_progress) {
            on_progress(payload_.size(), payload_.size());
        }
        result.bytes = payload_.size();
        return result;
    }

    int calls() const { return calls_.load(); }
    bool was_cancelled() const { return cancelled_.load(); }

private:
    std::string payload_;
    std::chrono::milliseconds delay_;
    ErrorCode failure_ = ErrorCode::Success;
    std::atomic<int> calls_{0};
    std::atomic<bool> cancelled_{false};
};

// Swarm engine driven by the test. A transfer either completes after a
// delay with the given payload, or stalls with no verified bytes.
class FakeSwarmEngine : public SwarmEngine {
public:
    enum class Mode { Complete, Stall, Fail, Corrupt };

    FakeSwarmEngine(std::string work_dir, std::string payload)
        : work_dir_(std::move(work_dir)), payload_(std::move(payload)) {}

    void set_mode(Mode mode) { mode_ = mode; }
    void set_complete_after(std::chrono::milliseconds delay) { complete_after_ = delay; }
    void reject_swarms(bool reject) { reject_ = reject; }

    SessionHandle create_session() override {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionHandle h = next_session_++;
        open_sessions_.insert(h);
        sessions_created_++;
        return h;
    }

    std::optional<TransferHandle> add_swarm(SessionHandle session, const SwarmDescriptor& descriptor,
                                            const std::vector<std::string>& peer_hints) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reject_ || peer_hints.empty()) {
            return std::nullopt;
        }
        TransferHandle t = next_transfer_++;
        Transfer tr;
        tr.session = session;
        tr.total = descriptor.total_length;
        tr.started = std::chrono::steady_clock::now();
        tr.staged = work_dir_ + "/" + descriptor.content_hash + "." + std::to_string(t) + "/" + descriptor.file_name;
        if (mode_ == Mode::Complete) {
            write_file(tr.staged, payload_);
        } else if (mode_ == Mode::Corrupt) {
            std::string bad = payload_;
            if (!bad.empty()) bad[0] = static_cast<char>(bad[0] ^ 0xFF);
            write_file(tr.staged, bad);
        }
        transfers_[t] = tr;
        return t;
    }

    SwarmProgress progress(TransferHandle transfer) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        SwarmProgress p;
        auto it = transfers_.find(transfer);
        if (it == transfers_.end()) return p;
        p.bytes_total = it->second.total;
        p.peers_connected = 1;
        if (mode_ != Mode::Stall && mode_ != Mode::Fail && elapsed(it->second) >= complete_after_) {
            p.bytes_done = it->second.total;
        }
        return p;
    }

    bool is_verified_complete(TransferHandle transfer) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer);
        if (it == transfers_.end()) return false;
        return (mode_ == Mode::Complete || mode_ == Mode::Corrupt) && elapsed(it->second) >= complete_after_;
    }

    bool has_failed(TransferHandle transfer) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return mode_ == Mode::Fail && transfers_.count(transfer) > 0;
    }

    std::string staged_path(TransferHandle transfer) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transfer);
        return it == transfers_.end() ? "" : it->second.staged;
    }

    bool serve(SessionHandle session, const SwarmDescriptor& descriptor, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        served_[session] = descriptor.content_hash;
        return true;
    }

    ServeStats serve_stats(const std::string& content_hash) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [session, hash] : served_) {
            if (hash == content_hash) {
                auto it = serve_stats_.find(content_hash);
                return it == serve_stats_.end() ? ServeStats{} : it->second;
            }
        }
        return ServeStats{};
    }

    void set_serve_stats(const std::string& content_hash, ServeStats stats) {
        std::lock_guard<std::mutex> lock(mutex_);
        serve_stats_[content_hash] = stats;
    }

    std::vector<std::string> local_peer_hints() const override {
        return {"127.0.0.1:6881"};
    }

    void close(SessionHandle session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_sessions_.count(session) && !first_close_) {
            first_close_ = std::chrono::steady_clock::now();
        }
        open_sessions_.erase(session);
        served_.erase(session);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->second.session == session) {
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    int sessions_created() const { return sessions_created_.load(); }

    std::optional<std::chrono::steady_clock::time_point> first_close() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_close_;
    }

    size_t open_sessions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_sessions_.size();
    }

    size_t served_count(const std::string& content_hash) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [session, hash] : served_) {
            if (hash == content_hash) ++n;
        }
        return n;
    }

private:
    struct Transfer {
        SessionHandle session = 0;
        uint64_t total = 0;
        std::chrono::steady_clock::time_point started;
        std::string staged;
    };

    std::chrono::milliseconds elapsed(const Transfer& t) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t.started);
    }

    std::string work_dir_;
    std::string payload_;
    Mode mode_ = Mode::Complete;
    std::chrono::milliseconds complete_after_{0};
    bool reject_ = false;

    mutable std::mutex mutex_;
    SessionHandle next_session_ = 1;
    TransferHandle next_transfer_ = 1;
    std::set<SessionHandle> open_sessions_;
    std::map<TransferHandle, Transfer> transfers_;
    std::map<SessionHandle, std::string> served_;
    std::map<std::string, ServeStats> serve_stats_;
    std::optional<std::chrono::steady_clock::time_point> first_close_;
    std::atomic<int> sessions_created_{0};
};

} // namespace swarmfetch::test

#endif // SWARMFETCH_TEST_TEST_SUPPORT_H
