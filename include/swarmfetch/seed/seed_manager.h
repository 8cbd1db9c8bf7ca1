#ifndef SWARMFETCH_SEED_SEED_MANAGER_H
#define SWARMFETCH_SEED_SEED_MANAGER_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/swarm/engine.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarmfetch {

class TrackingClient;

struct SeedStatus {
    std::string content_hash;
    std::string file_path;
    std::chrono::system_clock::time_point started_at;
    uint32_t duration_sec = 0;                // 0 = until stopped
    std::optional<uint64_t> remaining_sec;    // nullopt when unbounded
    uint32_t peers_connected = 0;
    uint64_t bytes_uploaded = 0;
    double upload_rate_bps = 0.0;             // average since seeding started
};

// Keeps completed artifacts served for a bounded time.
// At most one engine session per content hash.
class SeedManager {
public:
    SeedManager(const SeedConfig& config, SwarmEngine* engine);
    ~SeedManager();

    SeedManager(const SeedManager&) = delete;
    SeedManager& operator=(const SeedManager&) = delete;

    // Announce started/stopped to the tracker when set
    void set_tracking_client(TrackingClient* client);

    // Start serving, or refresh the timer of an active seed.
    // duration_sec defaults to the configured duration; 0 = until stopped.
    bool start_seeding(const SwarmDescriptor& descriptor,
                       const std::string& source_path,
                       std::optional<uint32_t> duration_sec = std::nullopt);

    // False if nothing was seeding under this hash
    bool stop_seeding(const std::string& content_hash);

    // Returns the number of seeds stopped
    size_t stop_all();

    bool is_seeding(const std::string& content_hash) const;
    size_t active_count() const;
    std::vector<SeedStatus> status() const;

    // Block until every seed has expired or should_stop returns true
    void wait_until_idle(const std::function<bool()>& should_stop);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_SEED_SEED_MANAGER_H
