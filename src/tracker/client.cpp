#include "swarmfetch/tracker/client.h"
#include "swarmfetch/base/logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace swarmfetch {

namespace {

void set_reason(ErrorCode* reason, ErrorCode code) {
    if (reason) {
        *reason = code;
    }
}

// Optional string field; false when present with another type
bool string_field(const json& item, const char* name, std::string& out) {
    auto it = item.find(name);
    if (it == item.end()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Peers as "host:port"; entries with an unusable address are dropped
std::vector<std::string> parse_peers(const json& record) {
    std::vector<std::string> peers;
    auto it = record.find("peers");
    if (it == record.end() || !it->is_array()) {
        return peers;
    }
    for (const auto& p : *it) {
        if (p.is_string()) {
            peers.push_back(p.get<std::string>());
            continue;
        }
        if (!p.is_object()) continue;
        auto ip = p.find("ip");
        auto port = p.find("port");
        if (ip == p.end() || !ip->is_string() || port == p.end() || !port->is_number_unsigned()) {
            continue;
        }
        auto port_value = port->get<uint64_t>();
        if (port_value == 0 || port_value > 65535) continue;
        peers.push_back(ip->get<std::string>() + ":" + std::to_string(port_value));
    }
    return peers;
}

} // anonymous namespace

std::string to_string(AnnounceEvent event) {
    switch (event) {
        case AnnounceEvent::Started: return "started";
        case AnnounceEvent::Completed: return "completed";
        case AnnounceEvent::Stopped: return "stopped";
        default: return "started";
    }
}

HttpTrackerTransport::HttpTrackerTransport(const std::string& base_url)
    : base_url_(base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpResult HttpTrackerTransport::send(const std::string& method,
                                      const std::string& target,
                                      const std::string& body,
                                      uint32_t timeout_ms) {
    return SimpleHttpClient::request(method, base_url_ + target, body, {}, timeout_ms);
}

TrackingClient::TrackingClient(const TrackerConfig& config, std::unique_ptr<TrackerTransport> transport)
    : config_(config), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_unique<HttpTrackerTransport>(config_.url);
    }
}

TrackingClient::~TrackingClient() = default;

std::optional<SwarmRecord> TrackingClient::select_record(const ArtifactFingerprint& fingerprint,
                                                         const std::string& body,
                                                         ErrorCode* reason) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        Logger::instance().warning("Tracker returned malformed JSON for {}: {}", fingerprint.key(), e.what());
        set_reason(reason, ErrorCode::ProtocolError);
        return std::nullopt;
    }

    json records;
    if (data.is_array()) {
        records = data;
    } else if (data.is_object() && data.contains("torrents") && data["torrents"].is_array()) {
        records = data["torrents"];
    } else {
        Logger::instance().warning("Tracker response for {} has no record list", fingerprint.key());
        set_reason(reason, ErrorCode::ProtocolError);
        return std::nullopt;
    }

    for (const auto& item : records) {
        if (!item.is_object()) continue;

        try {
            // The service may answer with every file of the revision
            std::string filename = fingerprint.filename;
            std::string info_hash;
            if (!string_field(item, "filename", filename) || !string_field(item, "info_hash", info_hash)) {
                Logger::instance().warning("Skipping tracker record with mistyped fields for {}", fingerprint.key());
                continue;
            }
            if (filename != fingerprint.filename) {
                continue;
            }

            if (!item.contains("descriptor")) {
                Logger::instance().debug("Record {} carries no descriptor", info_hash);
                continue;
            }
            auto descriptor = SwarmDescriptor::from_json(item["descriptor"]);
            if (!descriptor || descriptor->content_hash != info_hash) {
                Logger::instance().warning("Record {} for {} failed descriptor validation", info_hash, fingerprint.key());
                continue;
            }

            SwarmRecord record;
            record.fingerprint = fingerprint;
            record.magnet_link = make_magnet_link(*descriptor);
            if (!string_field(item, "repo_id", record.fingerprint.repo_id) ||
                !string_field(item, "revision", record.fingerprint.revision) ||
                !string_field(item, "repo_type", record.fingerprint.repo_type) ||
                !string_field(item, "magnet_link", record.magnet_link)) {
                Logger::instance().warning("Skipping tracker record {} with mistyped fields", info_hash);
                continue;
            }
            record.fingerprint.filename = filename;
            record.info_hash = info_hash;
            record.descriptor = std::move(*descriptor);
            record.peers = parse_peers(item);
            return record;
        } catch (const json::exception& e) {
            Logger::instance().warning("Skipping unreadable tracker record for {}: {}", fingerprint.key(), e.what());
        }
    }

    Logger::instance().debug("No usable swarm record for {}", fingerprint.key());
    set_reason(reason, ErrorCode::NotFound);
    return std::nullopt;
}

std::optional<SwarmRecord> TrackingClient::query(const ArtifactFingerprint& fingerprint,
                                                 uint32_t timeout_ms,
                                                 ErrorCode* reason) {
    if (!config_.enable) {
        set_reason(reason, ErrorCode::TrackerUnavailable);
        return std::nullopt;
    }

    std::string target = "/api/v1/torrents?repo_id=" + url_encode(fingerprint.repo_id) +
                         "&revision=" + url_encode(fingerprint.revision) +
                         "&repo_type=" + url_encode(fingerprint.repo_type) +
                         "&filename=" + url_encode(fingerprint.filename);

    Logger::instance().debug("Querying tracker for " + fingerprint.key());
    auto result = transport_->send("GET", target, "", timeout_ms > 0 ? timeout_ms : config_.query_timeout_ms);

    if (!result.error.empty()) {
        Logger::instance().warning("Tracker unreachable ({}), continuing without swarm: {}",
                                   to_string(result.code), result.error);
        set_reason(reason, ErrorCode::TrackerUnavailable);
        return std::nullopt;
    }
    if (result.status == 404) {
        Logger::instance().debug("Tracker has no swarm for " + fingerprint.key());
        set_reason(reason, ErrorCode::NotFound);
        return std::nullopt;
    }
    if (result.status != 200) {
        Logger::instance().warning("Tracker query degraded, status " + std::to_string(result.status));
        set_reason(reason, ErrorCode::TrackerUnavailable);
        return std::nullopt;
    }

    auto record = select_record(fingerprint, result.body, reason);
    if (record) {
        Logger::instance().info("Found swarm {} for {} ({} peers)",
                                record->info_hash, fingerprint.key(), record->peers.size());
        set_reason(reason, ErrorCode::Success);
    }
    return record;
}

ErrorCode TrackingClient::publish(const ArtifactFingerprint& fingerprint,
                                  const SwarmDescriptor& descriptor,
                                  const std::vector<std::string>& peer_hints) {
    if (!config_.enable) {
        return ErrorCode::TrackerUnavailable;
    }

    json body = {
        {"repo_id", fingerprint.repo_id},
        {"revision", fingerprint.revision},
        {"repo_type", fingerprint.repo_type},
        {"filename", fingerprint.filename},
        {"name", descriptor.file_name},
        {"info_hash", descriptor.content_hash},
        {"magnet_link", make_magnet_link(descriptor)},
        {"file_size", descriptor.total_length},
        {"piece_length", descriptor.piece_length},
        {"peers", peer_hints},
        {"descriptor", descriptor.to_json()}
    };

    auto result = transport_->send("POST", "/api/v1/publish", body.dump(), config_.request_timeout_ms);
    if (!result.error.empty()) {
        Logger::instance().warning("Publish of {} failed: {}", descriptor.content_hash, result.error);
        return ErrorCode::TrackerUnavailable;
    }
    if (result.status != 200 && result.status != 201) {
        Logger::instance().warning("Publish of {} rejected with status {}", descriptor.content_hash, result.status);
        return ErrorCode::PublishFailed;
    }

    Logger::instance().info("Published swarm {} for {}", descriptor.content_hash, fingerprint.key());
    return ErrorCode::Success;
}

bool TrackingClient::announce(const std::string& info_hash,
                              const std::vector<std::string>& peer_hints,
                              AnnounceEvent event) {
    if (!config_.enable) {
        return false;
    }

    json body = {
        {"info_hash", info_hash},
        {"peers", peer_hints},
        {"event", to_string(event)}
    };

    auto result = transport_->send("POST", "/api/v1/announce", body.dump(), config_.request_timeout_ms);
    if (!result.ok()) {
        Logger::instance().debug("Announce {} for {} failed: {}", to_string(event), info_hash,
                                 result.error.empty() ? "status " + std::to_string(result.status) : result.error);
        return false;
    }
    return true;
}

} // namespace swarmfetch
