#include "swarmfetch/transfer/session.h"
#include "swarmfetch/transfer/file_delivery.h"
#include "swarmfetch/tracker/client.h"
#include "swarmfetch/swarm/engine.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/origin/fetcher.h"
#include "swarmfetch/seed/seed_manager.h"
#include "swarmfetch/base/logger.h"
#include <elio/time/timer.hpp>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <thread>

namespace swarmfetch {

namespace fs = std::filesystem;

std::string to_string(TransferState state) {
    switch (state) {
        case TransferState::Querying: return "QUERYING";
        case TransferState::SwarmRace: return "SWARM_RACE";
        case TransferState::OriginOnly: return "ORIGIN_ONLY";
        case TransferState::Delivered: return "DELIVERED";
        case TransferState::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

std::string to_string(Winner winner) {
    switch (winner) {
        case Winner::None: return "none";
        case Winner::Swarm: return "swarm";
        case Winner::Origin: return "origin";
        default: return "unknown";
    }
}

namespace {

// Written by the origin thread, read by the session loop
struct OriginState {
    std::atomic<bool> done{false};
    std::atomic<uint64_t> bytes{0};
    OriginResult result;  // valid once done is set
};

struct StallSample {
    TransferSession::Clock::time_point time;
    uint64_t bytes;
};

} // anonymous namespace

// Resources of one run(); the destructor is the last-resort cleanup
struct TransferSession::Race {
    SwarmEngine* engine = nullptr;
    std::optional<SwarmRecord> record;

    // Origin path
    std::string origin_temp;
    std::shared_ptr<CancellationToken> origin_cancel = std::make_shared<CancellationToken>();
    std::shared_ptr<OriginState> origin = std::make_shared<OriginState>();
    std::thread origin_thread;

    // Swarm path
    std::optional<SessionHandle> engine_session;
    std::optional<TransferHandle> transfer;
    bool swarm_active = false;
    std::string staged_path;
    std::deque<StallSample> samples;

    ~Race() {
        origin_cancel->cancel();
        if (origin_thread.joinable()) {
            origin_thread.join();
        }
        release_swarm();
        FileDelivery::discard(origin_temp);
    }

    // Close the engine session and drop the staging directory
    void release_swarm() {
        swarm_active = false;
        if (engine && engine_session) {
            engine->close(*engine_session);
            engine_session.reset();
        }
        if (!staged_path.empty()) {
            FileDelivery::discard(fs::path(staged_path).parent_path().string());
            staged_path.clear();
        }
    }
};

TransferSession::TransferSession(const ArtifactFingerprint& fingerprint,
                                 const std::string& destination,
                                 Clock::time_point deadline,
                                 const TransferConfig& config,
                                 bool auto_seed,
                                 const SessionDependencies& deps)
    : fingerprint_(fingerprint),
      destination_(destination),
      deadline_(deadline),
      config_(config),
      auto_seed_(auto_seed),
      deps_(deps) {}

TransferSession::~TransferSession() = default;

void TransferSession::set_state(TransferState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

TransferState TransferSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Winner TransferSession::winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return winner_;
}

bool TransferSession::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_;
}

bool TransferSession::publish_attempted() const {
    return publish_attempted_.load();
}

void TransferSession::cancel() {
    cancel_requested_ = true;
}

TransferOutcome TransferSession::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return terminal_; });
    return outcome_;
}

void TransferSession::finish(TransferOutcome outcome, Winner winner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = std::move(outcome);
        winner_ = winner;
        state_ = outcome_.success ? TransferState::Delivered : TransferState::Failed;
        terminal_ = true;
    }
    cv_.notify_all();

    if (outcome_.success) {
        Logger::instance().info("{} delivered to {} via {}", fingerprint_.key(), outcome_.path, to_string(winner));
    } else {
        Logger::instance().warning("{} failed: {}", fingerprint_.key(), outcome_.message);
    }
}

elio::coro::task<void> TransferSession::run() {
    Race race;
    race.engine = deps_.engine;
    Winner winner = Winner::None;
    TransferOutcome outcome;
    outcome.path = destination_;

    try {
        // QUERYING
        set_state(TransferState::Querying);
        if (deps_.tracker && deps_.tracker->is_enabled()) {
            // Bounded by the time left before the deadline
            auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now()).count();
            if (budget > 0) {
                auto timeout = std::min<int64_t>(budget, deps_.tracker->query_timeout_ms());
                race.record = deps_.tracker->query(fingerprint_, static_cast<uint32_t>(std::max<int64_t>(timeout, 1)));
            } else {
                Logger::instance().warning("Deadline for {} passed before the tracker query", fingerprint_.key());
            }
            if (race.record) {
                tracked_descriptor_ = race.record->descriptor;
            }
        }

        // The origin always runs; the swarm joins when a record exists
        race.origin_temp = FileDelivery::temp_path_for(destination_, "origin");
        if (deps_.origin) {
            auto origin = race.origin;
            auto cancel = race.origin_cancel;
            OriginFetcher* fetcher = deps_.origin;
            ArtifactFingerprint fp = fingerprint_;
            std::string temp = race.origin_temp;
            race.origin_thread = std::thread([origin, cancel, fetcher, fp, temp]() {
                auto on_progress = [origin](uint64_t received, uint64_t) { origin->bytes = received; };
                try {
                    origin->result = fetcher->fetch(fp, temp, on_progress, cancel);
                } catch (const std::exception& e) {
                    origin->result.error = ErrorCode::OriginFailed;
                    origin->result.message = e.what();
                }
                origin->done = true;
            });
        } else {
            race.origin->result.error = ErrorCode::OriginFailed;
            race.origin->result.message = "no origin configured";
            race.origin->done = true;
        }

        if (race.record && deps_.engine) {
            race.engine_session = deps_.engine->create_session();
            race.transfer = deps_.engine->add_swarm(*race.engine_session, race.record->descriptor,
                                                    race.record->peers);
            if (race.transfer) {
                race.swarm_active = true;
                race.staged_path = deps_.engine->staged_path(*race.transfer);
                race.samples.push_back({Clock::now(), 0});
            } else {
                Logger::instance().info("Swarm for {} not usable, origin only", fingerprint_.key());
                race.release_swarm();
            }
        }
        set_state(race.swarm_active ? TransferState::SwarmRace : TransferState::OriginOnly);

        std::optional<OriginResult> origin_error;
        std::optional<std::pair<ErrorCode, std::string>> swarm_error;
        bool deadline_hit = false;
        bool cancelled = false;
        auto grace = std::chrono::seconds(config_.stall_grace_sec);
        uint64_t stall_floor = std::max<uint64_t>(1, config_.min_swarm_throughput_bps * config_.stall_grace_sec);

        while (true) {
            auto now = Clock::now();
            if (cancel_requested_.load()) {
                cancelled = true;
                break;
            }

            if (!origin_error && race.origin->done.load()) {
                if (race.origin->result.ok()) {
                    winner = Winner::Origin;
                    break;
                }
                origin_error = race.origin->result;
                Logger::instance().warning("Origin path for {} failed: {}", fingerprint_.key(), origin_error->message);
            }

            if (race.swarm_active) {
                auto progress = deps_.engine->progress(*race.transfer);
                if (deps_.engine->is_verified_complete(*race.transfer)) {
                    if (DescriptorBuilder::verify_file(race.record->descriptor, race.staged_path)) {
                        winner = Winner::Swarm;
                        break;
                    }
                    Logger::instance().error("Swarm output for {} failed whole-file verification", fingerprint_.key());
                    swarm_error = std::make_pair(ErrorCode::IntegrityFailure, std::string("swarm output failed verification"));
                    race.release_swarm();
                } else if (deps_.engine->has_failed(*race.transfer)) {
                    swarm_error = std::make_pair(ErrorCode::SwarmUnavailable, std::string("swarm transfer failed"));
                    race.release_swarm();
                } else {
                    // Keep one sample at or before the window start
                    race.samples.push_back({now, progress.bytes_done});
                    while (race.samples.size() >= 2 && race.samples[1].time <= now - grace) {
                        race.samples.pop_front();
                    }
                    const auto& oldest = race.samples.front();
                    if (oldest.time <= now - grace && progress.bytes_done - oldest.bytes < stall_floor) {
                        Logger::instance().warning("Swarm for {} stalled at {}/{} bytes with {} peer(s), abandoning",
                                                   fingerprint_.key(), progress.bytes_done, progress.bytes_total,
                                                   progress.peers_connected);
                        swarm_error = std::make_pair(ErrorCode::SwarmStalled, std::string("swarm stalled"));
                        race.release_swarm();
                    }
                }
            }

            if (origin_error && !race.swarm_active) {
                break;
            }
            if (now >= deadline_) {
                deadline_hit = true;
                break;
            }

            co_await elio::time::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
        }

        // Stop the loser(s) and wait for the origin thread to wind down
        if (winner != Winner::Origin) {
            race.origin_cancel->cancel();
        }
        while (race.origin_thread.joinable() && !race.origin->done.load()) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
        }
        if (race.origin_thread.joinable()) {
            race.origin_thread.join();
        }

        std::string error;
        if (winner == Winner::Origin) {
            race.release_swarm();
            if (FileDelivery::commit(race.origin_temp, destination_, error)) {
                race.origin_temp.clear();
                outcome.success = true;
            } else {
                outcome.error = ErrorCode::DestinationUnwritable;
                outcome.message = error;
                winner = Winner::None;
            }
        } else if (winner == Winner::Swarm) {
            FileDelivery::discard(race.origin_temp);
            race.origin_temp.clear();
            if (FileDelivery::link_into_place(race.staged_path, destination_, error)) {
                outcome.success = true;
                outcome.was_p2p = true;
            } else {
                outcome.error = ErrorCode::DestinationUnwritable;
                outcome.message = error;
                winner = Winner::None;
            }
            race.release_swarm();
        } else if (cancelled) {
            outcome.error = ErrorCode::Cancelled;
            outcome.message = "transfer cancelled";
        } else if (deadline_hit) {
            outcome.error = ErrorCode::DeadlineExceeded;
            outcome.message = "no path delivered " + fingerprint_.filename + " before the deadline";
        } else if (origin_error) {
            outcome.error = origin_error->error == ErrorCode::IntegrityFailure
                ? ErrorCode::IntegrityFailure : ErrorCode::OriginFailed;
            outcome.message = origin_error->message;
        } else if (swarm_error) {
            outcome.error = swarm_error->first;
            outcome.message = swarm_error->second;
        } else {
            outcome.error = ErrorCode::OriginFailed;
            outcome.message = "no path available";
        }

    } catch (const std::exception& e) {
        Logger::instance().error("Transfer of {} aborted: {}", fingerprint_.key(), e.what());
        outcome.success = false;
        outcome.error = ErrorCode::InternalError;
        outcome.message = e.what();
        winner = Winner::None;
    }

    if (!outcome.success) {
        race.release_swarm();
    }
    finish(std::move(outcome), winner);
    co_return;
}

void TransferSession::seed_and_publish() {
    Winner winner = Winner::None;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!terminal_ || !outcome_.success || follow_up_done_) {
            return;
        }
        follow_up_done_ = true;
        winner = winner_;
    }

    try {
        std::optional<SwarmDescriptor> descriptor;
        bool need_publish = !tracked_descriptor_;

        if (tracked_descriptor_) {
            if (winner == Winner::Swarm) {
                // Swarm bytes were verified against this descriptor before delivery
                descriptor = tracked_descriptor_;
            } else if (DescriptorBuilder::verify_file(*tracked_descriptor_, destination_)) {
                descriptor = tracked_descriptor_;
            } else {
                Logger::instance().warning("Delivered {} does not match the tracked swarm, not seeding", fingerprint_.key());
            }
        } else {
            std::error_code ec;
            auto size = fs::file_size(destination_, ec);
            if (ec) {
                throw SwarmFetchError(ErrorCode::IoError, "cannot stat " + destination_);
            }
            descriptor = DescriptorBuilder::build(destination_, size, fs::path(fingerprint_.filename).filename().string());
        }
        if (!descriptor) {
            return;
        }

        bool seeding = false;
        if (auto_seed_ && deps_.seeder) {
            seeding = deps_.seeder->start_seeding(*descriptor, destination_);
        }
        std::vector<std::string> hints;
        if (seeding && deps_.engine) {
            hints = deps_.engine->local_peer_hints();
        }

        if (deps_.tracker && deps_.tracker->is_enabled()) {
            if (need_publish) {
                publish_attempted_ = true;
                auto rc = deps_.tracker->publish(fingerprint_, *descriptor, hints);
                if (rc != ErrorCode::Success) {
                    Logger::instance().warning("Publish failed for {} ({}), download already succeeded",
                                               fingerprint_.key(), to_string(rc));
                }
            } else if (seeding) {
                deps_.tracker->announce(descriptor->content_hash, hints, AnnounceEvent::Completed);
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().warning("Cannot seed or publish {}: {}", fingerprint_.key(), e.what());
    }
}

} // namespace swarmfetch
