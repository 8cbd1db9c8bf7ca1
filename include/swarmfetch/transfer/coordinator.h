#ifndef SWARMFETCH_TRANSFER_COORDINATOR_H
#define SWARMFETCH_TRANSFER_COORDINATOR_H

#include "swarmfetch/transfer/fingerprint.h"
#include "swarmfetch/transfer/session.h"
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace swarmfetch {

struct AcquireResult {
    std::shared_ptr<TransferSession> session;
    bool is_new = false;
};

// Registry of in-flight sessions, at most one per fingerprint
class BatchCoordinator {
public:
    using SessionFactory = std::function<std::shared_ptr<TransferSession>()>;

    BatchCoordinator() = default;
    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;

    // Join the live session for fingerprint or register the one factory builds.
    // A throwing factory registers nothing and the exception reaches the caller.
    AcquireResult acquire(const ArtifactFingerprint& fingerprint, const SessionFactory& factory);

    // Drop the entry if it still points at session
    void release(const ArtifactFingerprint& fingerprint, const std::shared_ptr<TransferSession>& session);

    std::shared_ptr<TransferSession> find(const ArtifactFingerprint& fingerprint) const;
    size_t active_count() const;

    // Cancel every registered session; returns how many were cancelled
    size_t cancel_all();

private:
    mutable std::mutex mutex_;
    std::unordered_map<ArtifactFingerprint, std::shared_ptr<TransferSession>> sessions_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_TRANSFER_COORDINATOR_H
