#ifndef SWARMFETCH_SWARM_TCP_ENGINE_H
#define SWARMFETCH_SWARM_TCP_ENGINE_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/swarm/engine.h"
#include <memory>

namespace swarmfetch {

// Swarm engine speaking the piece wire protocol over TCP.
// One listener serves every registered swarm; each leech transfer runs
// one worker per peer hint, all sharing a piece picker.
class TcpSwarmEngine : public SwarmEngine {
public:
    TcpSwarmEngine(const SwarmConfig& config, const std::string& work_dir);
    ~TcpSwarmEngine() override;

    // Bind the listener and start the I/O thread
    bool start();
    void stop();
    bool is_running() const;

    // Actual listen port (useful when configured with port 0)
    uint16_t listen_port() const;

    SessionHandle create_session() override;
    std::optional<TransferHandle> add_swarm(SessionHandle session,
                                            const SwarmDescriptor& descriptor,
                                            const std::vector<std::string>& peer_hints) override;
    SwarmProgress progress(TransferHandle transfer) const override;
    bool is_verified_complete(TransferHandle transfer) const override;
    bool has_failed(TransferHandle transfer) const override;
    std::string staged_path(TransferHandle transfer) const override;
    bool serve(SessionHandle session, const SwarmDescriptor& descriptor,
               const std::string& source_path) override;
    ServeStats serve_stats(const std::string& content_hash) const override;
    std::vector<std::string> local_peer_hints() const override;
    void close(SessionHandle session) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_SWARM_TCP_ENGINE_H
