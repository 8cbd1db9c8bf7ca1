#ifndef SWARMFETCH_TRACKER_CLIENT_H
#define SWARMFETCH_TRACKER_CLIENT_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/net/http_client.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/transfer/fingerprint.h"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace swarmfetch {

// Swarm as published to the tracking service
struct SwarmRecord {
    ArtifactFingerprint fingerprint;
    std::string info_hash;
    std::string magnet_link;
    SwarmDescriptor descriptor;
    std::vector<std::string> peers;  // "host:port"
};

enum class AnnounceEvent {
    Started,
    Completed,
    Stopped
};

std::string to_string(AnnounceEvent event);

// Raw request/response exchange with the tracking service
class TrackerTransport {
public:
    virtual ~TrackerTransport() = default;

    // target is path plus query, relative to the service base URL
    virtual HttpResult send(const std::string& method,
                            const std::string& target,
                            const std::string& body,
                            uint32_t timeout_ms) = 0;
};

class HttpTrackerTransport : public TrackerTransport {
public:
    explicit HttpTrackerTransport(const std::string& base_url);

    HttpResult send(const std::string& method,
                    const std::string& target,
                    const std::string& body,
                    uint32_t timeout_ms) override;

private:
    std::string base_url_;
};

// Stateless client for the tracking service. Query failures of any kind
// collapse to nullopt, with the reason available through an out parameter.
// publish reports an ErrorCode; announce is best effort.
class TrackingClient {
public:
    // A null transport selects HttpTrackerTransport on config.url
    explicit TrackingClient(const TrackerConfig& config,
                            std::unique_ptr<TrackerTransport> transport = nullptr);
    ~TrackingClient();

    bool is_enabled() const { return config_.enable; }
    uint32_t query_timeout_ms() const { return config_.query_timeout_ms; }

    // Usable swarm for this exact file, if any. Blocks for at most
    // timeout_ms, or config.query_timeout_ms when timeout_ms is 0.
    // reason receives NotFound, TrackerUnavailable or ProtocolError on nullopt.
    std::optional<SwarmRecord> query(const ArtifactFingerprint& fingerprint,
                                     uint32_t timeout_ms = 0,
                                     ErrorCode* reason = nullptr);

    // Success, TrackerUnavailable (disabled or unreachable) or PublishFailed
    ErrorCode publish(const ArtifactFingerprint& fingerprint,
                      const SwarmDescriptor& descriptor,
                      const std::vector<std::string>& peer_hints);

    bool announce(const std::string& info_hash,
                  const std::vector<std::string>& peer_hints,
                  AnnounceEvent event);

    // Pick the first valid record for fingerprint out of a query body.
    // Records with fields of the wrong type are skipped.
    // reason receives NotFound or ProtocolError on nullopt.
    static std::optional<SwarmRecord> select_record(const ArtifactFingerprint& fingerprint,
                                                    const std::string& body,
                                                    ErrorCode* reason = nullptr);

private:
    TrackerConfig config_;
    std::unique_ptr<TrackerTransport> transport_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_TRACKER_CLIENT_H
