#ifndef SWARMFETCH_TRANSFER_ORCHESTRATOR_H
#define SWARMFETCH_TRANSFER_ORCHESTRATOR_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/transfer/coordinator.h"
#include "swarmfetch/transfer/session.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace swarmfetch {

// Entry point for fetching one artifact. Concurrent requests for the same
// fingerprint share a single race and observe the same outcome. Seeding and
// publishing of delivered files run on a background worker.
class Orchestrator {
public:
    Orchestrator(const GlobalConfig& config, const SessionDependencies& deps);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Never throws. deadline defaults to now + transfer.deadline_sec.
    // A joining requester receives the path of the session it joined.
    TransferOutcome request_artifact(const ArtifactFingerprint& fingerprint,
                                     const std::string& destination_path,
                                     std::optional<TransferSession::Clock::time_point> deadline = std::nullopt);

    // Cancel every in-flight transfer
    size_t cancel_all();

    // Block until queued seeding and publishing is done
    void wait_for_follow_ups();

    BatchCoordinator& coordinator() { return coordinator_; }

private:
    void follow_up_loop();

    GlobalConfig config_;
    SessionDependencies deps_;
    BatchCoordinator coordinator_;

    std::mutex follow_up_mutex_;
    std::condition_variable follow_up_cv_;
    std::deque<std::shared_ptr<TransferSession>> follow_ups_;
    bool follow_up_busy_ = false;
    bool stopping_ = false;
    std::thread follow_up_thread_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_TRANSFER_ORCHESTRATOR_H
