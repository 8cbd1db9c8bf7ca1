#include "swarmfetch/origin/fetcher.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/base/logger.h"
#include <elio/elio.hpp>
#include <elio/http/http_client.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace swarmfetch {

namespace {

// Encode each path segment, keeping the separators
std::string encode_path(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        out += url_encode(path.substr(start, slash - start));
        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

// SHA-256 advertised in an ETag value, if it carries one
std::optional<std::string> checksum_from_etag(std::string v) {
    if (v.rfind("W/", 0) == 0) v = v.substr(2);
    v.erase(std::remove(v.begin(), v.end(), '"'), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (is_hex_digest(v)) return v;
    return std::nullopt;
}

// One ranged GET as seen by the download loop
struct RangeReply {
    bool received = false;
    int status = 0;
    std::string body;
    std::string location;
    std::string content_range;
    std::string content_length;
    std::string linked_etag;
    std::string etag;
};

// "bytes a-b/total" or "bytes */total"
struct ContentRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;
    std::optional<uint64_t> total;
};

std::optional<ContentRange> parse_content_range(const std::string& value) {
    if (value.rfind("bytes ", 0) != 0) return std::nullopt;
    std::string range_spec = value.substr(6);
    auto slash = range_spec.find('/');
    if (slash == std::string::npos) return std::nullopt;

    ContentRange range;
    try {
        std::string span = range_spec.substr(0, slash);
        std::string total = range_spec.substr(slash + 1);
        if (total != "*") {
            range.total = std::stoull(total);
        }
        if (span != "*") {
            auto dash = span.find('-');
            if (dash == std::string::npos) return std::nullopt;
            range.first = std::stoull(span.substr(0, dash));
            range.last = std::stoull(span.substr(dash + 1));
            if (*range.last < *range.first) return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return range;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

elio::coro::task<RangeReply> get_range(const Url& url, uint64_t offset, uint64_t length,
                                       const std::string& authorization) {
    RangeReply reply;

    elio::http::client http_client;
    elio::http::request req(elio::http::method::GET, url.path());
    auto query = url.query();
    if (!query.empty()) {
        req.set_query(query);
    }
    req.set_host(url.host);
    req.set_header("User-Agent", std::string("swarmfetch/") + SWARMFETCH_VERSION);

    std::ostringstream range_header;
    range_header << "bytes=" << offset << "-" << (offset + length - 1);
    req.set_header("Range", range_header.str());

    if (!authorization.empty()) {
        req.set_header("Authorization", authorization);
    }

    auto parsed_url = elio::http::url::parse(url.to_string());
    if (!parsed_url) {
        Logger::instance().error("Failed to parse URL: " + url.to_string());
        co_return reply;
    }

    auto response = co_await http_client.send(req, *parsed_url);
    if (!response) {
        co_return reply;
    }

    reply.received = true;
    reply.status = response->status_code();
    reply.body = std::string(response->body());
    reply.location = std::string(response->header("Location"));
    reply.content_range = std::string(response->header("Content-Range"));
    reply.content_length = std::string(response->header("Content-Length"));
    reply.linked_etag = std::string(response->header("X-Linked-Etag"));
    reply.etag = std::string(response->header("ETag"));
    co_return reply;
}

OriginResult failure(ErrorCode code, std::string message) {
    OriginResult result;
    result.error = code;
    result.message = std::move(message);
    return result;
}

// Ranged download loop. Each range is appended to destination_path; a 200
// answer means the server ignored Range and sent the whole body.
elio::coro::task<OriginResult> download_ranges(const OriginConfig& config,
                                               const ArtifactFingerprint& fingerprint,
                                               Url url,
                                               const std::string& destination_path,
                                               const OriginProgressCallback& on_progress,
                                               const std::shared_ptr<CancellationToken>& cancel) {
    std::string authorization;
    if (config.token && !config.token->empty()) {
        authorization = "Bearer " + *config.token;
    }

    auto cancelled = [&cancel]() { return cancel && cancel->is_cancelled(); };

    std::ofstream out;
    auto open_output = [&]() {
        out.close();
        out.clear();
        out.open(destination_path, std::ios::binary | std::ios::trunc);
        return out.is_open();
    };

    std::optional<std::string> expected_sha256;
    std::optional<uint64_t> total;
    uint64_t offset = 0;
    uint32_t redirects = 0;

    while (!total || offset < *total) {
        if (cancelled()) {
            co_return failure(ErrorCode::Cancelled, "origin fetch cancelled");
        }

        uint64_t length = config.range_size;
        if (total) {
            length = std::min<uint64_t>(length, *total - offset);
        }

        Logger::instance().debug("Origin GET {} bytes {}+{}", url.to_string(), offset, length);
        RangeReply reply = co_await get_range(url, offset, length, authorization);

        if (cancelled()) {
            co_return failure(ErrorCode::Cancelled, "origin fetch cancelled");
        }
        if (!reply.received) {
            co_return failure(ErrorCode::OriginFailed, "no response from " + url.host);
        }

        if (!expected_sha256) {
            if (!reply.linked_etag.empty()) {
                expected_sha256 = checksum_from_etag(reply.linked_etag);
            }
            if (!expected_sha256 && !reply.etag.empty()) {
                expected_sha256 = checksum_from_etag(reply.etag);
            }
        }

        if (is_redirect(reply.status)) {
            if (++redirects > config.max_redirects) {
                co_return failure(ErrorCode::OriginFailed, "too many redirects for " + fingerprint.key());
            }
            auto next = reply.location.empty() ? std::nullopt : url.resolve(reply.location);
            if (!next) {
                co_return failure(ErrorCode::OriginFailed, "redirect without usable Location from " + url.to_string());
            }
            if (!HttpOriginFetcher::forward_credentials(url, *next)) {
                authorization.clear();
            }
            url = *next;
            continue;
        }

        if (reply.status == 416 && offset == 0) {
            // Range past the end of an empty file
            auto range = parse_content_range(reply.content_range);
            if (range && range->total && *range->total == 0) {
                total = 0;
                break;
            }
            co_return failure(ErrorCode::OriginFailed, "origin rejected range for " + fingerprint.key());
        }

        if (reply.status == 206) {
            auto range = parse_content_range(reply.content_range);
            if (!range || !range->first || !range->total) {
                co_return failure(ErrorCode::OriginFailed, "invalid Content-Range from " + url.host);
            }
            if (*range->first != offset || (total && *total != *range->total)) {
                co_return failure(ErrorCode::OriginFailed, "origin returned an unexpected range for " + fingerprint.key());
            }
            uint64_t expected = *range->last - *range->first + 1;
            if (reply.body.size() != expected) {
                co_return failure(ErrorCode::OriginFailed,
                                  "short range: got " + std::to_string(reply.body.size()) + " of " +
                                  std::to_string(expected) + " bytes");
            }
            total = range->total;
            if (offset == 0 && !open_output()) {
                co_return failure(ErrorCode::IoError, "cannot write " + destination_path);
            }
        } else if (reply.status == 200) {
            if (!reply.content_length.empty()) {
                uint64_t expected = 0;
                try {
                    expected = std::stoull(reply.content_length);
                } catch (const std::exception&) {
                    co_return failure(ErrorCode::OriginFailed, "invalid Content-Length from " + url.host);
                }
                if (reply.body.size() != expected) {
                    co_return failure(ErrorCode::OriginFailed,
                                      "short body: got " + std::to_string(reply.body.size()) + " of " +
                                      std::to_string(expected) + " bytes");
                }
            }
            offset = 0;
            total = reply.body.size();
            if (!open_output()) {
                co_return failure(ErrorCode::IoError, "cannot write " + destination_path);
            }
        } else {
            co_return failure(ErrorCode::OriginFailed,
                              "origin returned status " + std::to_string(reply.status) + " for " + url.to_string());
        }

        out.write(reply.body.data(), static_cast<std::streamsize>(reply.body.size()));
        if (!out) {
            co_return failure(ErrorCode::IoError, "cannot write " + destination_path);
        }
        offset += reply.body.size();
        if (on_progress) {
            on_progress(offset, *total);
        }
        if (reply.body.empty() && offset < *total) {
            co_return failure(ErrorCode::OriginFailed, "origin sent an empty range for " + fingerprint.key());
        }
    }

    // Empty files never open the output inside the loop
    if (!out.is_open() && !open_output()) {
        co_return failure(ErrorCode::IoError, "cannot write " + destination_path);
    }
    out.close();
    if (!out) {
        co_return failure(ErrorCode::IoError, "cannot flush " + destination_path);
    }

    if (config.verify_checksum && expected_sha256) {
        auto actual = sha256_file(destination_path);
        if (!actual || *actual != *expected_sha256) {
            Logger::instance().error("Origin content for {} does not match checksum {}",
                                     fingerprint.key(), *expected_sha256);
            co_return failure(ErrorCode::IntegrityFailure, "origin checksum mismatch for " + fingerprint.filename);
        }
    }

    OriginResult outcome;
    outcome.bytes = offset;
    Logger::instance().debug("Origin delivered {} bytes for {}", offset, fingerprint.key());
    co_return outcome;
}

} // anonymous namespace

HttpOriginFetcher::HttpOriginFetcher(const OriginConfig& config)
    : config_(config) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
    if (config_.range_size == 0) {
        config_.range_size = OriginConfig().range_size;
    }
}

std::string HttpOriginFetcher::resolve_url(const ArtifactFingerprint& fingerprint) const {
    std::string prefix;
    if (fingerprint.repo_type == "dataset") {
        prefix = "datasets/";
    } else if (fingerprint.repo_type == "space") {
        prefix = "spaces/";
    }
    return config_.endpoint + "/" + prefix + encode_path(fingerprint.repo_id) +
           "/resolve/" + url_encode(fingerprint.revision) + "/" + encode_path(fingerprint.filename);
}

bool HttpOriginFetcher::forward_credentials(const Url& from, const Url& to) {
    // Credentials only go to the configured endpoint
    return from.same_origin(to);
}

OriginResult HttpOriginFetcher::fetch(const ArtifactFingerprint& fingerprint,
                                      const std::string& destination_path,
                                      const OriginProgressCallback& on_progress,
                                      const std::shared_ptr<CancellationToken>& cancel) {
    std::string url = resolve_url(fingerprint);
    auto parsed = Url::parse(url);
    if (!parsed) {
        return failure(ErrorCode::InvalidArgument, "invalid origin URL " + url);
    }

    OriginResult outcome;
    elio::run([&]() -> elio::coro::task<void> {
        outcome = co_await download_ranges(config_, fingerprint, *parsed, destination_path, on_progress, cancel);
    }());
    return outcome;
}

} // namespace swarmfetch
