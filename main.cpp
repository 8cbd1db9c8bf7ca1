#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <filesystem>
#include <vector>
#include <atomic>

#include <nlohmann/json.hpp>
#include "swarmfetch/base/logger.h"
#include "swarmfetch/base/config.h"
#include "swarmfetch/swarm/tcp_engine.h"
#include "swarmfetch/tracker/client.h"
#include "swarmfetch/origin/fetcher.h"
#include "swarmfetch/seed/seed_manager.h"
#include "swarmfetch/transfer/orchestrator.h"

using namespace swarmfetch;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class SwarmFetchApplication {
public:
    SwarmFetchApplication() = default;
    ~SwarmFetchApplication() {
        stop();
    }

    bool initialize() {
        auto& config = Config::instance().get();

        tracker_ = std::make_unique<TrackingClient>(config.tracker);
        origin_ = std::make_unique<HttpOriginFetcher>(config.origin);

        if (config.swarm.enable) {
            engine_ = std::make_unique<TcpSwarmEngine>(config.swarm, config.transfer.work_dir);
            if (!engine_->start()) {
                Logger::instance().warning("Swarm engine failed to start, continuing origin-only");
                engine_.reset();
            }
        } else {
            Logger::instance().info("Peer swarm disabled");
        }

        seeder_ = std::make_unique<SeedManager>(config.seed, engine_.get());
        seeder_->set_tracking_client(tracker_.get());

        SessionDependencies deps;
        deps.tracker = tracker_.get();
        deps.engine = engine_.get();
        deps.origin = origin_.get();
        deps.seeder = seeder_.get();
        orchestrator_ = std::make_unique<Orchestrator>(config, deps);
        return true;
    }

    int download(const CommandOptions& cmd) {
        struct Result {
            std::string filename;
            TransferOutcome outcome;
        };
        std::vector<Result> results(cmd.filenames.size());
        std::vector<std::thread> workers;

        for (size_t i = 0; i < cmd.filenames.size(); ++i) {
            workers.emplace_back([this, &cmd, &results, i]() {
                ArtifactFingerprint fp;
                fp.repo_id = cmd.repo_id;
                fp.revision = cmd.revision;
                fp.repo_type = cmd.repo_type;
                fp.filename = cmd.filenames[i];
                auto dest = (std::filesystem::path(cmd.local_dir) / fp.filename).string();
                results[i].filename = fp.filename;
                results[i].outcome = orchestrator_->request_artifact(fp, dest);
            });
        }

        // Cancel in-flight transfers when a signal arrives
        std::thread watcher([this]() {
            while (g_running && !all_done_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!g_running) {
                orchestrator_->cancel_all();
            }
        });
        for (auto& w : workers) {
            w.join();
        }
        all_done_ = true;
        watcher.join();

        // Delivered files are described, seeded and published in the background
        orchestrator_->wait_for_follow_ups();

        int failures = 0;
        for (const auto& r : results) {
            if (r.outcome.success) {
                std::cout << r.outcome.path << " (" << (r.outcome.was_p2p ? "swarm" : "origin") << ")" << std::endl;
            } else {
                ++failures;
                std::cerr << r.filename << ": " << to_string(r.outcome.error) << ": " << r.outcome.message << std::endl;
            }
        }

        if (cmd.seed_wait && seeder_->active_count() > 0) {
            Logger::instance().info("Seeding {} artifact(s), press Ctrl+C to stop", seeder_->active_count());
            seeder_->wait_until_idle([]() { return g_running == 0; });
        }
        return failures == 0 ? 0 : 1;
    }

    int seed(const CommandOptions& cmd) {
        if (!engine_) {
            std::cerr << "Seeding needs the peer swarm enabled" << std::endl;
            return 1;
        }

        ArtifactFingerprint fp;
        fp.repo_id = cmd.repo_id;
        fp.revision = cmd.revision;
        fp.repo_type = cmd.repo_type;
        fp.filename = cmd.filenames.empty() ? "" : cmd.filenames.front();

        auto size = std::filesystem::file_size(cmd.path);
        auto descriptor = DescriptorBuilder::build(cmd.path, size,
                                                   std::filesystem::path(fp.filename).filename().string());
        std::cout << "info_hash: " << descriptor.content_hash << std::endl;
        std::cout << "magnet: " << make_magnet_link(descriptor) << std::endl;

        if (!seeder_->start_seeding(descriptor, cmd.path, cmd.duration_sec)) {
            std::cerr << "Failed to seed " << cmd.path << std::endl;
            return 1;
        }
        auto rc = tracker_->publish(fp, descriptor, engine_->local_peer_hints());
        if (rc != ErrorCode::Success) {
            Logger::instance().warning("Publish failed ({}), other nodes will not find this seed", to_string(rc));
        }

        seeder_->wait_until_idle([]() { return g_running == 0; });
        return 0;
    }

    int inspect(const CommandOptions& cmd) {
        auto size = std::filesystem::file_size(cmd.path);
        auto descriptor = DescriptorBuilder::build(cmd.path, size);
        nlohmann::json out = descriptor.to_json();
        out["magnet_link"] = make_magnet_link(descriptor);
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    void stop() {
        if (orchestrator_) {
            orchestrator_->cancel_all();
        }
        if (seeder_) {
            seeder_->stop_all();
        }
        if (engine_) {
            engine_->stop();
        }
    }

private:
    std::unique_ptr<TrackingClient> tracker_;
    std::unique_ptr<HttpOriginFetcher> origin_;
    std::unique_ptr<TcpSwarmEngine> engine_;
    std::unique_ptr<SeedManager> seeder_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::atomic<bool> all_done_{false};
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto& cfg = Config::instance();
    cfg.load_from_env();
    // Returns false for --help/--version or errors; CLI11 has printed the message
    if (!cfg.parse_command_line(argc, argv)) {
        return cfg.cli_exit_code();
    }
    if (!cfg.validate()) {
        return 1;
    }

    const auto& cmd = cfg.command();

    try {
        if (cmd.command == "inspect") {
            SwarmFetchApplication app;
            return app.inspect(cmd);
        }

        SwarmFetchApplication app;
        if (!app.initialize()) {
            std::cerr << "Failed to initialize swarmfetch" << std::endl;
            return 1;
        }

        int rc = 0;
        if (cmd.command == "download") {
            rc = app.download(cmd);
        } else if (cmd.command == "seed") {
            rc = app.seed(cmd);
        }
        app.stop();
        return rc;
    } catch (const SwarmFetchError& e) {
        std::cerr << "Error: " << to_string(e.code()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
