#include "swarmfetch/seed/seed_manager.h"
#include "swarmfetch/tracker/client.h"
#include "swarmfetch/base/logger.h"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace swarmfetch {

namespace {

using SteadyClock = std::chrono::steady_clock;

struct SeedTask {
    std::string content_hash;
    std::string file_path;
    SteadyClock::time_point started;
    std::chrono::system_clock::time_point started_wall;
    uint32_t duration_sec = 0;
    SessionHandle session = 0;
    SteadyClock::time_point serving_since;
    bool ready = false;        // engine session created and serving
    uint64_t generation = 0;   // identifies the start_seeding call that created it

    std::optional<SteadyClock::time_point> deadline() const {
        if (duration_sec == 0) return std::nullopt;
        return started + std::chrono::seconds(duration_sec);
    }
};

} // anonymous namespace

struct SeedManager::Impl {
    SeedConfig config;
    SwarmEngine* engine;
    TrackingClient* tracker = nullptr;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<std::string, SeedTask> tasks;
    uint64_t next_generation = 1;
    bool stopping = false;
    std::thread expiry_thread;

    Impl(const SeedConfig& cfg, SwarmEngine* eng) : config(cfg), engine(eng) {}

    void announce(const std::string& content_hash, AnnounceEvent event) {
        if (!tracker || !engine) return;
        tracker->announce(content_hash, engine->local_peer_hints(), event);
    }

    // Release a task already removed from the map
    void teardown(const SeedTask& task, const char* reason) {
        if (task.ready && engine) {
            engine->close(task.session);
        }
        Logger::instance().info("Stopped seeding {} ({})", task.content_hash, reason);
        announce(task.content_hash, AnnounceEvent::Stopped);
    }

    void expiry_loop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            std::optional<SteadyClock::time_point> earliest;
            for (const auto& [hash, task] : tasks) {
                auto d = task.deadline();
                if (task.ready && d && (!earliest || *d < *earliest)) {
                    earliest = d;
                }
            }

            if (earliest) {
                cv.wait_until(lock, *earliest);
            } else {
                cv.wait(lock);
            }
            if (stopping) break;

            auto now = SteadyClock::now();
            std::vector<SeedTask> expired;
            for (auto it = tasks.begin(); it != tasks.end();) {
                auto d = it->second.deadline();
                if (it->second.ready && d && *d <= now) {
                    expired.push_back(std::move(it->second));
                    it = tasks.erase(it);
                } else {
                    ++it;
                }
            }

            if (!expired.empty()) {
                lock.unlock();
                for (const auto& task : expired) {
                    teardown(task, "duration elapsed");
                }
                lock.lock();
                cv.notify_all();
            }
        }
    }
};

SeedManager::SeedManager(const SeedConfig& config, SwarmEngine* engine)
    : impl_(std::make_unique<Impl>(config, engine)) {
    impl_->expiry_thread = std::thread([this]() { impl_->expiry_loop(); });
}

SeedManager::~SeedManager() {
    stop_all();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
    }
    impl_->cv.notify_all();
    if (impl_->expiry_thread.joinable()) {
        impl_->expiry_thread.join();
    }
}

void SeedManager::set_tracking_client(TrackingClient* client) {
    impl_->tracker = client;
}

bool SeedManager::start_seeding(const SwarmDescriptor& descriptor,
                                const std::string& source_path,
                                std::optional<uint32_t> duration_sec) {
    if (!impl_->engine) {
        Logger::instance().warning("No swarm engine, not seeding " + descriptor.content_hash);
        return false;
    }

    uint32_t duration = duration_sec.value_or(impl_->config.duration_sec);
    const std::string& hash = descriptor.content_hash;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->tasks.find(hash);
        if (it != impl_->tasks.end()) {
            // Already seeding (or being set up): restart the timer only
            it->second.started = SteadyClock::now();
            it->second.started_wall = std::chrono::system_clock::now();
            it->second.duration_sec = duration;
            impl_->cv.notify_all();
            Logger::instance().debug("Refreshed seed timer for {}", hash);
            return true;
        }

        SeedTask task;
        task.content_hash = hash;
        task.file_path = source_path;
        task.started = SteadyClock::now();
        task.started_wall = std::chrono::system_clock::now();
        task.duration_sec = duration;
        task.generation = generation = impl_->next_generation++;
        impl_->tasks.emplace(hash, std::move(task));
    }

    SessionHandle session = impl_->engine->create_session();
    if (!impl_->engine->serve(session, descriptor, source_path)) {
        impl_->engine->close(session);
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->tasks.find(hash);
        if (it != impl_->tasks.end() && it->second.generation == generation) {
            impl_->tasks.erase(it);
        }
        Logger::instance().warning("Failed to seed {} from {}", hash, source_path);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->tasks.find(hash);
        if (it == impl_->tasks.end() || it->second.generation != generation) {
            // Stopped while the session was being created
            impl_->engine->close(session);
            return false;
        }
        it->second.session = session;
        it->second.serving_since = SteadyClock::now();
        it->second.ready = true;
    }
    impl_->cv.notify_all();

    Logger::instance().info("Seeding {} from {} ({})", hash, source_path,
                            duration == 0 ? std::string("until stopped") : std::to_string(duration) + " s");
    impl_->announce(hash, AnnounceEvent::Started);
    return true;
}

bool SeedManager::stop_seeding(const std::string& content_hash) {
    SeedTask task;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->tasks.find(content_hash);
        if (it == impl_->tasks.end()) {
            return false;
        }
        task = std::move(it->second);
        impl_->tasks.erase(it);
    }
    impl_->cv.notify_all();
    impl_->teardown(task, "stopped");
    return true;
}

size_t SeedManager::stop_all() {
    std::unordered_map<std::string, SeedTask> tasks;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        tasks.swap(impl_->tasks);
    }
    impl_->cv.notify_all();
    for (const auto& [hash, task] : tasks) {
        impl_->teardown(task, "stopped");
    }
    return tasks.size();
}

bool SeedManager::is_seeding(const std::string& content_hash) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->tasks.count(content_hash) > 0;
}

size_t SeedManager::active_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->tasks.size();
}

std::vector<SeedStatus> SeedManager::status() const {
    std::vector<SeedStatus> result;
    auto now = SteadyClock::now();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& [hash, task] : impl_->tasks) {
        SeedStatus s;
        s.content_hash = hash;
        s.file_path = task.file_path;
        s.started_at = task.started_wall;
        s.duration_sec = task.duration_sec;
        if (auto d = task.deadline()) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(*d - now).count();
            s.remaining_sec = left > 0 ? static_cast<uint64_t>(left) : 0;
        }
        if (task.ready && impl_->engine) {
            auto stats = impl_->engine->serve_stats(hash);
            s.peers_connected = stats.peers_connected;
            s.bytes_uploaded = stats.bytes_uploaded;
            // Restarted timers keep the original serving window for the rate
            double elapsed = std::chrono::duration<double>(now - task.serving_since).count();
            if (elapsed > 0.0) {
                s.upload_rate_bps = static_cast<double>(stats.bytes_uploaded) / elapsed;
            }
        }
        result.push_back(std::move(s));
    }
    return result;
}

void SeedManager::wait_until_idle(const std::function<bool()>& should_stop) {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    while (!impl_->tasks.empty()) {
        if (should_stop && should_stop()) {
            return;
        }
        impl_->cv.wait_for(lock, std::chrono::milliseconds(200));
    }
}

} // namespace swarmfetch
