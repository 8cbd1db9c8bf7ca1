#include "swarmfetch/transfer/coordinator.h"
#include "swarmfetch/base/logger.h"

namespace swarmfetch {

AcquireResult BatchCoordinator::acquire(const ArtifactFingerprint& fingerprint, const SessionFactory& factory) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(fingerprint);
        if (it != sessions_.end() && !it->second->is_terminal()) {
            Logger::instance().debug("Joining in-flight transfer of {}", fingerprint.key());
            return {it->second, false};
        }
    }

    // Built outside the lock; a concurrent acquire may win the registration
    auto candidate = factory();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(fingerprint);
    if (it != sessions_.end() && !it->second->is_terminal()) {
        return {it->second, false};
    }
    sessions_[fingerprint] = candidate;
    return {candidate, true};
}

void BatchCoordinator::release(const ArtifactFingerprint& fingerprint,
                               const std::shared_ptr<TransferSession>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(fingerprint);
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
}

std::shared_ptr<TransferSession> BatchCoordinator::find(const ArtifactFingerprint& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(fingerprint);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t BatchCoordinator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [fp, session] : sessions_) {
        if (!session->is_terminal()) {
            ++count;
        }
    }
    return count;
}

size_t BatchCoordinator::cancel_all() {
    std::vector<std::shared_ptr<TransferSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [fp, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    size_t count = 0;
    for (auto& session : sessions) {
        if (!session->is_terminal()) {
            session->cancel();
            ++count;
        }
    }
    return count;
}

} // namespace swarmfetch
