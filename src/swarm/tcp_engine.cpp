#include "swarmfetch/swarm/tcp_engine.h"
#include "swarmfetch/swarm/wire.h"
#include "swarmfetch/base/logger.h"
#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <elio/hash/sha256.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <fcntl.h>
#include <unistd.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace swarmfetch {

namespace fs = std::filesystem;

namespace {

// Upper bound for a single piece on the wire (largest tier)
constexpr uint32_t MAX_PIECE_LENGTH = 16 * 1024 * 1024;
constexpr uint32_t MAX_RECONNECT_BACKOFF_MS = 5000;

elio::coro::task<bool> read_exact(elio::net::tcp_stream& stream, void* buffer, size_t length) {
    auto* out = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < length) {
        auto result = co_await stream.read(out + done, length - done);
        if (result.result <= 0) {
            co_return false;
        }
        done += static_cast<size_t>(result.result);
    }
    co_return true;
}

elio::coro::task<bool> write_all(elio::net::tcp_stream& stream, const void* buffer, size_t length) {
    const auto* in = static_cast<const uint8_t*>(buffer);
    size_t done = 0;
    while (done < length) {
        auto result = co_await stream.write(in + done, length - done);
        if (result.result <= 0) {
            co_return false;
        }
        done += static_cast<size_t>(result.result);
    }
    co_return true;
}

bool split_peer_hint(const std::string& hint, std::string& host, uint16_t& port) {
    auto pos = hint.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= hint.size()) {
        return false;
    }
    try {
        int value = std::stoi(hint.substr(pos + 1));
        if (value <= 0 || value > 65535) return false;
        host = hint.substr(0, pos);
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// First non-loopback IPv4 address of this host
std::string detect_local_address() {
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        return "127.0.0.1";
    }
    std::string result = "127.0.0.1";
    for (auto* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
        std::string addr(buf);
        if (addr.rfind("127.", 0) == 0) continue;
        result = addr;
        break;
    }
    freeifaddrs(addrs);
    return result;
}

} // anonymous namespace

// State of one leech transfer, shared by its workers
struct LeechTransfer {
    TransferHandle id = 0;
    SessionHandle session = 0;
    SwarmDescriptor descriptor;
    RawHash info_hash{};
    std::string path;
    int fd = -1;

    std::mutex mutex;
    std::vector<bool> have;
    std::vector<bool> in_flight;
    size_t pieces_done = 0;

    std::atomic<uint64_t> bytes_done{0};
    std::atomic<uint32_t> peers_connected{0};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> complete{false};

    ~LeechTransfer() {
        if (fd >= 0) {
            ::close(fd);
        }
    }

    // Next missing piece not requested by another worker
    std::optional<uint32_t> pick_piece() {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = 0; i < have.size(); ++i) {
            if (!have[i] && !in_flight[i]) {
                in_flight[i] = true;
                return static_cast<uint32_t>(i);
            }
        }
        return std::nullopt;
    }

    void release_piece(uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight[index] = false;
    }

    void mark_have(uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight[index] = false;
        if (have[index]) return;
        have[index] = true;
        ++pieces_done;
        bytes_done += descriptor.piece_size(index);
        if (pieces_done == have.size()) {
            complete = true;
        }
    }
};

// Swarm registered for serving, possibly by several sessions
struct ServedSwarm {
    SwarmDescriptor descriptor;
    std::unordered_map<SessionHandle, std::string> sources;  // session -> file path
    ServeStats stats;
};

struct EngineSession {
    std::vector<TransferHandle> transfers;
    std::vector<std::string> served;  // content hashes
};

struct TcpSwarmEngine::Impl {
    SwarmConfig config;
    std::string work_dir;

    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> tcp_listener;
    std::thread io_thread;
    std::atomic<bool> running{false};
    std::atomic<uint32_t> active_tasks{0};
    uint16_t listen_port = 0;

    mutable std::mutex mutex;
    std::unordered_map<SessionHandle, EngineSession> sessions;
    std::unordered_map<TransferHandle, std::shared_ptr<LeechTransfer>> transfers;
    std::unordered_map<std::string, ServedSwarm> served;
    std::atomic<uint64_t> next_handle{1};

    Impl(const SwarmConfig& cfg, const std::string& dir) : config(cfg), work_dir(dir) {}

    std::shared_ptr<LeechTransfer> find_transfer(TransferHandle handle) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = transfers.find(handle);
        return it == transfers.end() ? nullptr : it->second;
    }

    // Source file for a served piece, empty if not served
    std::string lookup_source(const std::string& content_hash, uint32_t piece_index, uint64_t& offset,
                              uint64_t& size, std::string& piece_hash) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = served.find(content_hash);
        if (it == served.end() || it->second.sources.empty()) {
            return "";
        }
        const auto& desc = it->second.descriptor;
        if (piece_index >= desc.num_pieces()) {
            return "";
        }
        offset = desc.piece_offset(piece_index);
        size = desc.piece_size(piece_index);
        piece_hash = desc.piece_hashes[piece_index];
        return it->second.sources.begin()->second;
    }

    // Count a piece sent; the first one on a connection also counts the peer
    void record_upload(const std::string& content_hash, uint64_t bytes, bool new_peer) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = served.find(content_hash);
        if (it == served.end()) return;
        it->second.stats.bytes_uploaded += bytes;
        if (new_peer) it->second.stats.peers_connected++;
    }

    void release_peer(const std::string& content_hash) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = served.find(content_hash);
        if (it != served.end() && it->second.stats.peers_connected > 0) {
            it->second.stats.peers_connected--;
        }
    }

    elio::coro::task<bool> send_error(elio::net::tcp_stream& stream, const PieceMessageHeader& request) {
        RawHash info_hash{};
        std::memcpy(info_hash.data(), request.info_hash, info_hash.size());
        auto header = make_header(PieceMessageType::Error, request.piece_index, 0, info_hash);
        co_return co_await write_all(stream, &header, sizeof(header));
    }

    // Serve piece requests on one connection until the peer hangs up
    elio::coro::task<void> handle_peer_connection(elio::net::tcp_stream stream) {
        auto peer = stream.peer_address();
        std::string peer_name = peer ? peer->to_string() : "unknown";
        Logger::instance().debug("Peer connected: " + peer_name);

        std::set<std::string> uploaded_to;  // swarms this peer fetched from
        try {
            std::vector<uint8_t> buffer;
            while (running.load()) {
                PieceMessageHeader request;
                if (!co_await read_exact(stream, &request, sizeof(request))) {
                    break;
                }
                header_to_host(request);

                if (!header_valid(request) ||
                    request.message_type != static_cast<uint32_t>(PieceMessageType::Request)) {
                    Logger::instance().warning("Invalid piece request from " + peer_name);
                    break;
                }

                std::string content_hash = raw_to_hex(request.info_hash);
                uint64_t offset = 0;
                uint64_t size = 0;
                std::string piece_hash;
                std::string source = lookup_source(content_hash, request.piece_index, offset, size, piece_hash);
                if (source.empty()) {
                    Logger::instance().debug("Piece {} of {} not served", request.piece_index, content_hash);
                    if (!co_await send_error(stream, request)) break;
                    continue;
                }

                buffer.resize(size);
                bool read_ok = false;
                int fd = ::open(source.c_str(), O_RDONLY);
                if (fd >= 0) {
                    ssize_t n = ::pread(fd, buffer.data(), size, static_cast<off_t>(offset));
                    read_ok = n == static_cast<ssize_t>(size);
                    ::close(fd);
                }
                if (!read_ok) {
                    Logger::instance().warning("Cannot read piece {} from {}", request.piece_index, source);
                    if (!co_await send_error(stream, request)) break;
                    continue;
                }

                RawHash info_hash{};
                std::memcpy(info_hash.data(), request.info_hash, info_hash.size());
                auto raw_piece_hash = hex_to_raw(piece_hash);
                auto response = make_header(PieceMessageType::Response, request.piece_index,
                                            static_cast<uint32_t>(size), info_hash,
                                            raw_piece_hash ? &*raw_piece_hash : nullptr);
                if (!co_await write_all(stream, &response, sizeof(response))) break;
                if (!co_await write_all(stream, buffer.data(), buffer.size())) break;
                record_upload(content_hash, size, uploaded_to.insert(content_hash).second);
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Error serving peer " + peer_name + ": " + e.what());
        }

        for (const auto& hash : uploaded_to) {
            release_peer(hash);
        }

        co_await stream.close();
        Logger::instance().debug("Peer disconnected: " + peer_name);
        active_tasks--;
    }

    elio::coro::task<void> accept_loop() {
        Logger::instance().info("Swarm listener accepting on port " + std::to_string(listen_port));

        while (running.load()) {
            auto stream_result = co_await tcp_listener->accept();
            if (!stream_result) {
                continue;
            }
            active_tasks++;
            auto handler = handle_peer_connection(std::move(*stream_result));
            scheduler->spawn(handler.release());
        }

        active_tasks--;
    }

    // Fetch pieces from one peer until the transfer is done or cancelled
    elio::coro::task<void> leech_worker(std::shared_ptr<LeechTransfer> transfer, std::string hint) {
        std::string host;
        uint16_t port = 0;
        if (!split_peer_hint(hint, host, port)) {
            Logger::instance().warning("Ignoring malformed peer hint: " + hint);
            active_tasks--;
            co_return;
        }

        uint32_t backoff_ms = std::max<uint32_t>(config.reconnect_backoff_ms, 1);
        std::vector<uint8_t> payload;

        while (running.load() && !transfer->cancelled.load() && !transfer->complete.load()) {
            elio::net::tcp_options opts;
            opts.no_delay = true;

            auto connect_result = co_await elio::net::tcp_connect(host, port, opts);
            if (!connect_result) {
                Logger::instance().debug("Cannot reach peer {} for {}", hint, transfer->descriptor.content_hash);
                co_await elio::time::sleep_for(std::chrono::milliseconds(backoff_ms));
                backoff_ms = std::min(backoff_ms * 2, MAX_RECONNECT_BACKOFF_MS);
                continue;
            }

            elio::net::tcp_stream& stream = *connect_result;
            transfer->peers_connected++;
            bool drop_peer = false;

            while (!drop_peer && running.load() && !transfer->cancelled.load() && !transfer->complete.load()) {
                auto piece = transfer->pick_piece();
                if (!piece) {
                    // Remaining pieces are in flight on other workers
                    co_await elio::time::sleep_for(std::chrono::milliseconds(50));
                    continue;
                }
                uint32_t index = *piece;
                uint64_t expected_size = transfer->descriptor.piece_size(index);

                auto request = make_header(PieceMessageType::Request, index, 0, transfer->info_hash);
                PieceMessageHeader response;
                if (!co_await write_all(stream, &request, sizeof(request)) ||
                    !co_await read_exact(stream, &response, sizeof(response))) {
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }
                header_to_host(response);

                if (!header_valid(response) || response.piece_index != index) {
                    Logger::instance().warning("Protocol error from peer " + hint);
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }
                if (response.message_type == static_cast<uint32_t>(PieceMessageType::Error)) {
                    Logger::instance().debug("Peer {} does not serve piece {} of {}", hint, index,
                                             transfer->descriptor.content_hash);
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }
                if (response.message_type != static_cast<uint32_t>(PieceMessageType::Response) ||
                    response.data_length != expected_size || response.data_length > MAX_PIECE_LENGTH) {
                    Logger::instance().warning("Unexpected response from peer " + hint);
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }

                payload.resize(response.data_length);
                if (!co_await read_exact(stream, payload.data(), payload.size())) {
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }

                std::string actual = DescriptorBuilder::sha256_hex(payload.data(), payload.size());
                if (actual != transfer->descriptor.piece_hashes[index]) {
                    Logger::instance().error("Piece {} from peer {} failed verification", index, hint);
                    transfer->release_piece(index);
                    drop_peer = true;
                    break;
                }

                ssize_t written = ::pwrite(transfer->fd, payload.data(), payload.size(),
                                           static_cast<off_t>(transfer->descriptor.piece_offset(index)));
                if (written != static_cast<ssize_t>(payload.size())) {
                    Logger::instance().error("Cannot write piece {} to {}", index, transfer->path);
                    transfer->release_piece(index);
                    transfer->failed = true;
                    break;
                }

                transfer->mark_have(index);
                backoff_ms = std::max<uint32_t>(config.reconnect_backoff_ms, 1);
            }

            transfer->peers_connected--;
            co_await stream.close();

            if (transfer->failed.load()) {
                break;
            }
            if (drop_peer && !transfer->cancelled.load() && !transfer->complete.load()) {
                co_await elio::time::sleep_for(std::chrono::milliseconds(backoff_ms));
                backoff_ms = std::min(backoff_ms * 2, MAX_RECONNECT_BACKOFF_MS);
            }
        }

        if (transfer->complete.load()) {
            Logger::instance().debug("Worker for peer {} finished {}", hint, transfer->descriptor.content_hash);
        }
        active_tasks--;
    }

    bool start_io_thread() {
        std::promise<bool> bound;
        auto bound_future = bound.get_future();
        running = true;

        io_thread = std::thread([this, &bound]() {
            scheduler = std::make_shared<elio::runtime::scheduler>(2);
            scheduler->start();

            elio::net::tcp_options opts;
            opts.reuse_addr = true;
            opts.no_delay = true;
            opts.backlog = 64;

            auto bind_addr = elio::net::socket_address(
                elio::net::ipv4_address(config.bind_address, config.listen_port));
            auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);
            if (!listener_result) {
                Logger::instance().error("Failed to bind swarm listener on " + config.bind_address +
                                         ":" + std::to_string(config.listen_port) + ": " + strerror(errno));
                running = false;
                bound.set_value(false);
                return;
            }

            tcp_listener = std::move(*listener_result);
            listen_port = tcp_listener->local_address().port();

            active_tasks++;
            auto loop = accept_loop();
            scheduler->spawn(loop.release());
            bound.set_value(true);

            while (running.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            if (tcp_listener) {
                tcp_listener->close();
            }
        });

        bool ok = bound_future.get();
        if (!ok) {
            io_thread.join();
            scheduler->shutdown();
            scheduler.reset();
        }
        return ok;
    }

    void stop_io_thread() {
        if (!running.exchange(false)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& [handle, transfer] : transfers) {
                transfer->cancelled = true;
            }
        }

        if (io_thread.joinable()) {
            io_thread.join();
        }

        // Give workers and handlers a moment to notice the stop flag
        for (int i = 0; i < 50 && active_tasks.load() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (scheduler) {
            scheduler->shutdown();
            scheduler.reset();
        }
        tcp_listener = std::nullopt;
    }
};

TcpSwarmEngine::TcpSwarmEngine(const SwarmConfig& config, const std::string& work_dir)
    : impl_(std::make_unique<Impl>(config, work_dir)) {}

TcpSwarmEngine::~TcpSwarmEngine() {
    stop();
}

bool TcpSwarmEngine::start() {
    if (impl_->running.load()) {
        return true;
    }
    if (!impl_->start_io_thread()) {
        return false;
    }
    Logger::instance().info("Swarm engine started on port " + std::to_string(impl_->listen_port));
    return true;
}

void TcpSwarmEngine::stop() {
    if (!impl_->running.load()) {
        return;
    }
    impl_->stop_io_thread();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->transfers.clear();
    impl_->served.clear();
    impl_->sessions.clear();
    Logger::instance().info("Swarm engine stopped");
}

bool TcpSwarmEngine::is_running() const {
    return impl_->running.load();
}

uint16_t TcpSwarmEngine::listen_port() const {
    return impl_->listen_port;
}

SessionHandle TcpSwarmEngine::create_session() {
    SessionHandle handle = impl_->next_handle++;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->sessions[handle] = EngineSession{};
    return handle;
}

std::optional<TransferHandle> TcpSwarmEngine::add_swarm(SessionHandle session,
                                                        const SwarmDescriptor& descriptor,
                                                        const std::vector<std::string>& peer_hints) {
    if (!impl_->running.load()) {
        Logger::instance().warning("Swarm engine is not running");
        return std::nullopt;
    }
    auto info_hash = hex_to_raw(descriptor.content_hash);
    if (!info_hash || !descriptor.valid()) {
        Logger::instance().warning("Refusing invalid descriptor for " + descriptor.file_name);
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->sessions.find(session) == impl_->sessions.end()) {
            Logger::instance().warning("add_swarm on unknown session " + std::to_string(session));
            return std::nullopt;
        }
    }

    // Never dial ourselves
    auto own = local_peer_hints();
    std::vector<std::string> peers;
    for (const auto& hint : peer_hints) {
        if (std::find(own.begin(), own.end(), hint) == own.end() &&
            std::find(peers.begin(), peers.end(), hint) == peers.end()) {
            peers.push_back(hint);
        }
    }
    if (peers.empty() && descriptor.total_length > 0) {
        Logger::instance().info("No usable peers for " + descriptor.content_hash);
        return std::nullopt;
    }
    if (peers.size() > impl_->config.max_peers_per_transfer) {
        peers.resize(std::max<uint32_t>(impl_->config.max_peers_per_transfer, 1));
    }

    auto transfer = std::make_shared<LeechTransfer>();
    transfer->id = impl_->next_handle++;
    transfer->session = session;
    transfer->descriptor = descriptor;
    transfer->info_hash = *info_hash;
    transfer->have.assign(descriptor.num_pieces(), false);
    transfer->in_flight.assign(descriptor.num_pieces(), false);

    fs::path dir = fs::path(impl_->work_dir) / (descriptor.content_hash + "." + std::to_string(transfer->id));
    std::error_code ec;
    fs::create_directories(dir, ec);
    transfer->path = (dir / descriptor.file_name).string();
    transfer->fd = ::open(transfer->path.c_str(), O_CREAT | O_RDWR | O_TRUNC, 0644);
    if (ec || transfer->fd < 0 ||
        ::ftruncate(transfer->fd, static_cast<off_t>(descriptor.total_length)) != 0) {
        Logger::instance().error("Cannot create staging file " + transfer->path);
        transfer->failed = true;
    }
    if (descriptor.num_pieces() == 0 && !transfer->failed.load()) {
        transfer->complete = true;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->sessions.find(session);
        if (it == impl_->sessions.end()) {
            Logger::instance().warning("add_swarm on unknown session " + std::to_string(session));
            return std::nullopt;
        }
        it->second.transfers.push_back(transfer->id);
        impl_->transfers[transfer->id] = transfer;
    }

    if (!transfer->failed.load() && !transfer->complete.load()) {
        for (const auto& hint : peers) {
            impl_->active_tasks++;
            auto worker = impl_->leech_worker(transfer, hint);
            impl_->scheduler->spawn(worker.release());
        }
    }

    Logger::instance().info("Swarm transfer {} started for {} with {} peer(s)",
                            transfer->id, descriptor.file_name, peers.size());
    return transfer->id;
}

SwarmProgress TcpSwarmEngine::progress(TransferHandle transfer) const {
    SwarmProgress result;
    auto t = impl_->find_transfer(transfer);
    if (!t) return result;
    result.bytes_done = t->bytes_done.load();
    result.bytes_total = t->descriptor.total_length;
    result.peers_connected = t->peers_connected.load();
    return result;
}

bool TcpSwarmEngine::is_verified_complete(TransferHandle transfer) const {
    auto t = impl_->find_transfer(transfer);
    return t && t->complete.load() && !t->failed.load();
}

bool TcpSwarmEngine::has_failed(TransferHandle transfer) const {
    auto t = impl_->find_transfer(transfer);
    return !t || t->failed.load();
}

std::string TcpSwarmEngine::staged_path(TransferHandle transfer) const {
    auto t = impl_->find_transfer(transfer);
    return t ? t->path : "";
}

bool TcpSwarmEngine::serve(SessionHandle session, const SwarmDescriptor& descriptor,
                           const std::string& source_path) {
    if (!impl_->running.load()) {
        Logger::instance().warning("Swarm engine is not running");
        return false;
    }
    std::error_code ec;
    auto size = fs::file_size(source_path, ec);
    if (ec || size != descriptor.total_length) {
        Logger::instance().error("Cannot serve " + source_path + ": size does not match descriptor");
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->sessions.find(session);
    if (it == impl_->sessions.end()) {
        return false;
    }
    auto& entry = impl_->served[descriptor.content_hash];
    entry.descriptor = descriptor;
    entry.sources[session] = source_path;
    it->second.served.push_back(descriptor.content_hash);

    Logger::instance().debug("Serving {} from {}", descriptor.content_hash, source_path);
    return true;
}

ServeStats TcpSwarmEngine::serve_stats(const std::string& content_hash) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->served.find(content_hash);
    return it == impl_->served.end() ? ServeStats{} : it->second.stats;
}

std::vector<std::string> TcpSwarmEngine::local_peer_hints() const {
    if (!impl_->running.load() || impl_->listen_port == 0) {
        return {};
    }
    std::string host = impl_->config.advertise_address;
    if (host.empty()) {
        host = impl_->config.bind_address != "0.0.0.0" ? impl_->config.bind_address : detect_local_address();
    }
    return {host + ":" + std::to_string(impl_->listen_port)};
}

void TcpSwarmEngine::close(SessionHandle session) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->sessions.find(session);
    if (it == impl_->sessions.end()) {
        return;
    }

    for (auto handle : it->second.transfers) {
        auto t = impl_->transfers.find(handle);
        if (t != impl_->transfers.end()) {
            t->second->cancelled = true;
            impl_->transfers.erase(t);
        }
    }
    for (const auto& hash : it->second.served) {
        auto s = impl_->served.find(hash);
        if (s == impl_->served.end()) continue;
        s->second.sources.erase(session);
        if (s->second.sources.empty()) {
            impl_->served.erase(s);
        }
    }
    impl_->sessions.erase(it);
}

} // namespace swarmfetch
