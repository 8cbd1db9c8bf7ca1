#ifndef SWARMFETCH_SWARM_ENGINE_H
#define SWARMFETCH_SWARM_ENGINE_H

#include "swarmfetch/swarm/descriptor.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace swarmfetch {

using SessionHandle = uint64_t;
using TransferHandle = uint64_t;

struct SwarmProgress {
    uint64_t bytes_done = 0;   // verified bytes only
    uint64_t bytes_total = 0;
    uint32_t peers_connected = 0;
};

// Upload side of one served swarm
struct ServeStats {
    uint32_t peers_connected = 0;  // connections that fetched a piece of it
    uint64_t bytes_uploaded = 0;
};

// Peer transfer engine. A session owns its transfers and served swarms;
// closing it cancels and releases all of them.
class SwarmEngine {
public:
    virtual ~SwarmEngine() = default;

    virtual SessionHandle create_session() = 0;

    // Start fetching the swarm from the given "host:port" hints.
    // nullopt if no transfer could be started.
    virtual std::optional<TransferHandle> add_swarm(SessionHandle session,
                                                    const SwarmDescriptor& descriptor,
                                                    const std::vector<std::string>& peer_hints) = 0;

    virtual SwarmProgress progress(TransferHandle transfer) const = 0;

    // Every piece received and verified against the descriptor
    virtual bool is_verified_complete(TransferHandle transfer) const = 0;

    // Transfer cannot make progress anymore (e.g. staging file not writable)
    virtual bool has_failed(TransferHandle transfer) const = 0;

    // Where verified bytes are reconstructed
    virtual std::string staged_path(TransferHandle transfer) const = 0;

    // Serve pieces of a complete local file to other peers
    virtual bool serve(SessionHandle session, const SwarmDescriptor& descriptor,
                       const std::string& source_path) = 0;

    // Counters for a served swarm; zeros when nothing serves it
    virtual ServeStats serve_stats(const std::string& content_hash) const = 0;

    // "host:port" entries other peers can use to reach this node
    virtual std::vector<std::string> local_peer_hints() const = 0;

    // Idempotent
    virtual void close(SessionHandle session) = 0;
};

} // namespace swarmfetch

#endif // SWARMFETCH_SWARM_ENGINE_H
