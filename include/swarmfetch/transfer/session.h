#ifndef SWARMFETCH_TRANSFER_SESSION_H
#define SWARMFETCH_TRANSFER_SESSION_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/base/error_code.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/transfer/fingerprint.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <elio/elio.hpp>

namespace swarmfetch {

class TrackingClient;
class SwarmEngine;
class OriginFetcher;
class SeedManager;

enum class TransferState {
    Querying,
    SwarmRace,
    OriginOnly,
    Delivered,
    Failed
};

enum class Winner {
    None,
    Swarm,
    Origin
};

std::string to_string(TransferState state);
std::string to_string(Winner winner);

// Result shared by every requester of one artifact
struct TransferOutcome {
    bool success = false;
    std::string path;
    bool was_p2p = false;
    ErrorCode error = ErrorCode::Success;
    std::string message;
};

// Collaborators a session talks to; any may be null
struct SessionDependencies {
    TrackingClient* tracker = nullptr;
    SwarmEngine* engine = nullptr;
    OriginFetcher* origin = nullptr;
    SeedManager* seeder = nullptr;
};

// One race between the swarm and the origin for one artifact.
// run() drives it to a terminal state; wait() blocks until then.
// Seeding and publishing happen afterwards in seed_and_publish(), so
// requesters are released as soon as the file is in place.
class TransferSession {
public:
    using Clock = std::chrono::steady_clock;

    TransferSession(const ArtifactFingerprint& fingerprint,
                    const std::string& destination,
                    Clock::time_point deadline,
                    const TransferConfig& config,
                    bool auto_seed,
                    const SessionDependencies& deps);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    elio::coro::task<void> run();

    // Seed the delivered file and tell the tracker about it. Does nothing
    // unless run() delivered; runs at most once.
    void seed_and_publish();

    // Block until the session is terminal
    TransferOutcome wait() const;

    // Stop both paths; the session fails with Cancelled
    void cancel();

    bool is_terminal() const;
    TransferState state() const;
    Winner winner() const;
    bool publish_attempted() const;

    const ArtifactFingerprint& fingerprint() const { return fingerprint_; }
    const std::string& destination() const { return destination_; }
    Clock::time_point deadline() const { return deadline_; }

private:
    struct Race;

    void set_state(TransferState state);
    void finish(TransferOutcome outcome, Winner winner);

    ArtifactFingerprint fingerprint_;
    std::string destination_;
    Clock::time_point deadline_;
    TransferConfig config_;
    bool auto_seed_;
    SessionDependencies deps_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    TransferState state_ = TransferState::Querying;
    Winner winner_ = Winner::None;
    TransferOutcome outcome_;
    bool terminal_ = false;
    bool follow_up_done_ = false;
    std::optional<SwarmDescriptor> tracked_descriptor_;  // descriptor of the tracker's record, if any
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> publish_attempted_{false};
};

} // namespace swarmfetch

#endif // SWARMFETCH_TRANSFER_SESSION_H
