#ifndef SWARMFETCH_ORIGIN_FETCHER_H
#define SWARMFETCH_ORIGIN_FETCHER_H

#include "swarmfetch/base/config.h"
#include "swarmfetch/base/error_code.h"
#include "swarmfetch/net/http_client.h"
#include "swarmfetch/transfer/fingerprint.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace swarmfetch {

// Shared flag a fetch polls to stop early
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct OriginResult {
    ErrorCode error = ErrorCode::Success;
    std::string message;
    uint64_t bytes = 0;

    bool ok() const { return error == ErrorCode::Success; }
};

// (bytes_received, bytes_total or 0 when unknown)
using OriginProgressCallback = std::function<void(uint64_t, uint64_t)>;

// Direct download from the origin. Blocking; writes the whole body to
// destination_path and returns early once cancel is set.
class OriginFetcher {
public:
    virtual ~OriginFetcher() = default;

    virtual OriginResult fetch(const ArtifactFingerprint& fingerprint,
                               const std::string& destination_path,
                               const OriginProgressCallback& on_progress,
                               const std::shared_ptr<CancellationToken>& cancel) = 0;
};

// Downloads with ranged GETs through elio::http::client, appending each
// range to the destination and checking the cancel token between ranges.
class HttpOriginFetcher : public OriginFetcher {
public:
    explicit HttpOriginFetcher(const OriginConfig& config);

    OriginResult fetch(const ArtifactFingerprint& fingerprint,
                       const std::string& destination_path,
                       const OriginProgressCallback& on_progress,
                       const std::shared_ptr<CancellationToken>& cancel) override;

    // <endpoint>/<prefix><repo_id>/resolve/<revision>/<filename>
    std::string resolve_url(const ArtifactFingerprint& fingerprint) const;

    // Whether the Authorization header may follow a redirect from -> to
    static bool forward_credentials(const Url& from, const Url& to);

private:
    OriginConfig config_;
};

} // namespace swarmfetch

#endif // SWARMFETCH_ORIGIN_FETCHER_H
