#include "swarmfetch/transfer/orchestrator.h"
#include "swarmfetch/transfer/file_delivery.h"
#include "swarmfetch/base/logger.h"
#include <elio/elio.hpp>

namespace swarmfetch {

namespace {

TransferOutcome failure(const std::string& path, ErrorCode code, const std::string& message) {
    TransferOutcome outcome;
    outcome.path = path;
    outcome.error = code;
    outcome.message = message;
    return outcome;
}

} // anonymous namespace

Orchestrator::Orchestrator(const GlobalConfig& config, const SessionDependencies& deps)
    : config_(config), deps_(deps) {
    follow_up_thread_ = std::thread([this]() { follow_up_loop(); });
}

Orchestrator::~Orchestrator() {
    {
        std::lock_guard<std::mutex> lock(follow_up_mutex_);
        stopping_ = true;
        if (!follow_ups_.empty()) {
            Logger::instance().warning("Dropping {} pending seed/publish task(s) on shutdown", follow_ups_.size());
            follow_ups_.clear();
        }
    }
    follow_up_cv_.notify_all();
    if (follow_up_thread_.joinable()) {
        follow_up_thread_.join();
    }
}

void Orchestrator::follow_up_loop() {
    std::unique_lock<std::mutex> lock(follow_up_mutex_);
    while (true) {
        follow_up_cv_.wait(lock, [this]() { return stopping_ || !follow_ups_.empty(); });
        if (stopping_) {
            break;
        }
        auto session = std::move(follow_ups_.front());
        follow_ups_.pop_front();
        follow_up_busy_ = true;
        lock.unlock();

        session->seed_and_publish();

        lock.lock();
        follow_up_busy_ = false;
        follow_up_cv_.notify_all();
    }
}

void Orchestrator::wait_for_follow_ups() {
    std::unique_lock<std::mutex> lock(follow_up_mutex_);
    follow_up_cv_.wait(lock, [this]() { return stopping_ || (follow_ups_.empty() && !follow_up_busy_); });
}

TransferOutcome Orchestrator::request_artifact(const ArtifactFingerprint& fingerprint,
                                               const std::string& destination_path,
                                               std::optional<TransferSession::Clock::time_point> deadline) {
    if (!fingerprint.valid()) {
        return failure(destination_path, ErrorCode::InvalidArgument,
                       "incomplete artifact identity " + fingerprint.key());
    }

    auto when = deadline.value_or(TransferSession::Clock::now() +
                                  std::chrono::seconds(config_.transfer.deadline_sec));

    AcquireResult acquired;
    try {
        acquired = coordinator_.acquire(fingerprint, [&]() {
            FileDelivery::prepare_destination(destination_path);
            return std::make_shared<TransferSession>(fingerprint, destination_path, when,
                                                     config_.transfer, config_.seed.auto_seed, deps_);
        });
    } catch (const SwarmFetchError& e) {
        Logger::instance().error("Cannot start transfer of {}: {}", fingerprint.key(), e.what());
        return failure(destination_path, e.code(), e.what());
    } catch (const std::exception& e) {
        Logger::instance().error("Cannot start transfer of {}: {}", fingerprint.key(), e.what());
        return failure(destination_path, ErrorCode::InternalError, e.what());
    }

    auto session = acquired.session;
    if (!acquired.is_new) {
        if (session->destination() != destination_path) {
            Logger::instance().info("{} already in flight to {}, sharing its result",
                                    fingerprint.key(), session->destination());
        }
        return session->wait();
    }

    Logger::instance().info("Requesting {} -> {}", fingerprint.key(), destination_path);
    elio::run(session->run());
    coordinator_.release(fingerprint, session);

    auto outcome = session->wait();
    if (outcome.success) {
        {
            std::lock_guard<std::mutex> lock(follow_up_mutex_);
            follow_ups_.push_back(session);
        }
        follow_up_cv_.notify_all();
    }
    return outcome;
}

size_t Orchestrator::cancel_all() {
    return coordinator_.cancel_all();
}

} // namespace swarmfetch
