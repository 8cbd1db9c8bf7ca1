#include "swarmfetch/base/config.h"
#include "swarmfetch/base/logger.h"
#include "CLI/CLI.hpp"
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace swarmfetch {

namespace {

using IniSections = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    std::string lower;
    for (char c : value) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, IniSections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

// Returns the value of -c/--config if present, without consuming arguments
std::string find_config_argument(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(std::strlen("--config="));
        }
    }
    return "";
}

template <typename T>
void set_unsigned_from_env(const char* name, T& target) {
    const char* val = std::getenv(name);
    if (!val) return;
    try {
        target = static_cast<T>(std::stoull(val));
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid value for " + std::string(name) + ": " + val);
    }
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    command_ = CommandOptions{};
    config_file_.clear();
    cli_exit_code_ = 0;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    IniSections sections;
    parse_ini_file(path, sections);

    try {
        if (sections.count("log")) {
            auto& s = sections["log"];
            if (s.count("level")) config_.log.level = s["level"];
            if (s.count("output")) config_.log.output = s["output"];
            if (s.count("file_path")) config_.log.file_path = s["file_path"];
        }

        if (sections.count("tracker")) {
            auto& s = sections["tracker"];
            if (s.count("url")) config_.tracker.url = s["url"];
            if (s.count("enable")) config_.tracker.enable = parse_bool(s["enable"]);
            if (s.count("query_timeout_ms")) config_.tracker.query_timeout_ms = std::stoul(s["query_timeout_ms"]);
            if (s.count("request_timeout_ms")) config_.tracker.request_timeout_ms = std::stoul(s["request_timeout_ms"]);
        }

        if (sections.count("transfer")) {
            auto& s = sections["transfer"];
            if (s.count("deadline_sec")) config_.transfer.deadline_sec = std::stoul(s["deadline_sec"]);
            if (s.count("stall_grace_sec")) config_.transfer.stall_grace_sec = std::stoul(s["stall_grace_sec"]);
            if (s.count("min_swarm_throughput_bps")) config_.transfer.min_swarm_throughput_bps = std::stoull(s["min_swarm_throughput_bps"]);
            if (s.count("poll_interval_ms")) config_.transfer.poll_interval_ms = std::stoul(s["poll_interval_ms"]);
            if (s.count("work_dir")) config_.transfer.work_dir = s["work_dir"];
        }

        if (sections.count("swarm")) {
            auto& s = sections["swarm"];
            if (s.count("enable")) config_.swarm.enable = parse_bool(s["enable"]);
            if (s.count("bind_address")) config_.swarm.bind_address = s["bind_address"];
            if (s.count("listen_port")) config_.swarm.listen_port = static_cast<uint16_t>(std::stoi(s["listen_port"]));
            if (s.count("advertise_address")) config_.swarm.advertise_address = s["advertise_address"];
            if (s.count("max_peers_per_transfer")) config_.swarm.max_peers_per_transfer = std::stoul(s["max_peers_per_transfer"]);
            if (s.count("reconnect_backoff_ms")) config_.swarm.reconnect_backoff_ms = std::stoul(s["reconnect_backoff_ms"]);
        }

        if (sections.count("seed")) {
            auto& s = sections["seed"];
            if (s.count("auto_seed")) config_.seed.auto_seed = parse_bool(s["auto_seed"]);
            if (s.count("duration_sec")) config_.seed.duration_sec = std::stoul(s["duration_sec"]);
        }

        if (sections.count("origin")) {
            auto& s = sections["origin"];
            if (s.count("endpoint")) config_.origin.endpoint = s["endpoint"];
            if (s.count("token")) config_.origin.token = s["token"];
            if (s.count("range_size")) config_.origin.range_size = std::stoull(s["range_size"]);
            if (s.count("max_redirects")) config_.origin.max_redirects = std::stoul(s["max_redirects"]);
            if (s.count("verify_checksum")) config_.origin.verify_checksum = parse_bool(s["verify_checksum"]);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    override_from_env();
    return true;
}

void Config::override_from_env() {
    if (const char* val = std::getenv("SWARMFETCH_TRACKER")) {
        config_.tracker.url = val;
    }
    if (const char* val = std::getenv("SWARMFETCH_LOG_LEVEL")) {
        config_.log.level = val;
    }
    set_unsigned_from_env("SWARMFETCH_TIMEOUT", config_.transfer.deadline_sec);
    set_unsigned_from_env("SWARMFETCH_SEED_DURATION", config_.seed.duration_sec);
    if (const char* val = std::getenv("SWARMFETCH_AUTO_SEED")) {
        config_.seed.auto_seed = parse_bool(val);
    }
    set_unsigned_from_env("SWARMFETCH_P2P_PORT", config_.swarm.listen_port);
    if (const char* val = std::getenv("SWARMFETCH_ADVERTISE_ADDRESS")) {
        config_.swarm.advertise_address = val;
    }
    if (const char* val = std::getenv("SWARMFETCH_WORK_DIR")) {
        config_.transfer.work_dir = val;
    }
    if (const char* val = std::getenv("SWARMFETCH_ORIGIN_ENDPOINT")) {
        config_.origin.endpoint = val;
    }
    if (const char* val = std::getenv("SWARMFETCH_TOKEN")) {
        config_.origin.token = std::string(val);
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    cli_exit_code_ = 0;

    // File first, then environment, then the command line itself
    std::string config_file = find_config_argument(argc, argv);
    if (!config_file.empty() && !load_from_file(config_file)) {
        std::cerr << "Failed to load config file: " << config_file << std::endl;
        cli_exit_code_ = 1;
        return false;
    }
    override_from_env();

    CLI::App app{"swarmfetch - swarm-accelerated artifact downloads with origin fallback"};

    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Tracker options
    app.add_option("--tracker", config_.tracker.url, "Tracking service URL");
    app.add_flag_callback("--no-tracker", [this]() { config_.tracker.enable = false; },
                          "Do not contact the tracking service");
    app.add_option("--tracker-timeout", config_.tracker.query_timeout_ms, "Tracker query timeout (ms)");

    // Transfer options
    app.add_option("--timeout", config_.transfer.deadline_sec, "Overall transfer deadline (seconds)");
    app.add_option("--stall-grace", config_.transfer.stall_grace_sec, "Swarm stall grace window (seconds)");
    app.add_option("--min-swarm-rate", config_.transfer.min_swarm_throughput_bps, "Swarm throughput floor (bytes/s)");
    app.add_option("--work-dir", config_.transfer.work_dir, "Working directory for swarm staging files");

    // Swarm options
    app.add_option("--p2p-port", config_.swarm.listen_port, "Peer listen port (0 = random)");
    app.add_option("--p2p-bind", config_.swarm.bind_address, "Peer listen address");
    app.add_option("--advertise-address", config_.swarm.advertise_address, "Address other peers should dial");
    app.add_option("--max-peers", config_.swarm.max_peers_per_transfer, "Peers used per swarm transfer");
    app.add_flag_callback("--no-p2p", [this]() { config_.swarm.enable = false; },
                          "Disable the peer swarm (origin only)");

    // Seed options
    app.add_option("--seed-duration", config_.seed.duration_sec, "Seeding duration after download (seconds, 0 = until stopped)");

    // Origin options
    app.add_option("--origin-endpoint", config_.origin.endpoint, "Origin endpoint URL");
    app.add_option("--token", config_.origin.token, "Origin access token");

    app.set_version_flag("-v,--version", SWARMFETCH_VERSION);

    auto* download = app.add_subcommand("download", "Download files through the swarm with origin fallback");
    download->add_option("repo_id", command_.repo_id, "Repository id (e.g. gpt2)")->required();
    download->add_option("filenames", command_.filenames, "Files within the repository")->required();
    download->add_option("--revision", command_.revision, "Revision (branch or commit)");
    download->add_option("--repo-type", command_.repo_type, "Repository type (model, dataset, space)");
    download->add_option("--local-dir", command_.local_dir, "Directory to place the files in");
    download->add_flag("--no-seed", command_.no_seed, "Do not seed after download");
    download->add_flag("--seed-wait", command_.seed_wait, "Keep seeding until the seed duration expires");

    auto* seed = app.add_subcommand("seed", "Publish a local file and seed it");
    seed->add_option("path", command_.path, "Local file to seed")->required()->check(CLI::ExistingFile);
    seed->add_option("--repo-id", command_.repo_id, "Repository id")->required();
    seed->add_option("--filename", command_.filenames, "File name within the repository")->required()->expected(1);
    seed->add_option("--revision", command_.revision, "Revision (branch or commit)");
    seed->add_option("--repo-type", command_.repo_type, "Repository type (model, dataset, space)");
    seed->add_option("--duration", command_.duration_sec, "Seeding duration (seconds, 0 = until stopped)");

    auto* inspect = app.add_subcommand("inspect", "Print the swarm descriptor of a local file");
    inspect->add_option("path", command_.path, "Local file")->required()->check(CLI::ExistingFile);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        cli_exit_code_ = app.exit(e);
        return false;
    }

    if (download->parsed()) {
        command_.command = "download";
        if (command_.no_seed) {
            config_.seed.auto_seed = false;
        }
    } else if (seed->parsed()) {
        command_.command = "seed";
    } else if (inspect->parsed()) {
        command_.command = "inspect";
    }

    apply_logging();
    return true;
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    }
}

bool Config::validate() const {
    if (config_.tracker.enable && config_.tracker.url.empty()) {
        Logger::instance().error("tracker.url is required when the tracker is enabled");
        return false;
    }
    if (config_.tracker.enable && config_.tracker.url.rfind("http://", 0) != 0) {
        Logger::instance().error("tracker.url must be a plain http:// URL: " + config_.tracker.url);
        return false;
    }
    if (config_.origin.range_size == 0) {
        Logger::instance().error("origin.range_size must be positive");
        return false;
    }
    if (config_.transfer.deadline_sec == 0) {
        Logger::instance().error("transfer.deadline_sec must be positive");
        return false;
    }
    if (config_.transfer.poll_interval_ms == 0) {
        Logger::instance().error("transfer.poll_interval_ms must be positive");
        return false;
    }
    if (config_.transfer.stall_grace_sec == 0) {
        Logger::instance().error("transfer.stall_grace_sec must be positive");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Tracker: " + (config_.tracker.enable ? config_.tracker.url : std::string("disabled")));
    Logger::instance().info("Deadline: " + std::to_string(config_.transfer.deadline_sec) + " s");
    Logger::instance().info("Stall Grace: " + std::to_string(config_.transfer.stall_grace_sec) + " s");
    Logger::instance().info("Work Dir: " + config_.transfer.work_dir);
    Logger::instance().info("P2P: " + (config_.swarm.enable
        ? config_.swarm.bind_address + ":" + std::to_string(config_.swarm.listen_port)
        : std::string("disabled")));
    Logger::instance().info("Seed: " + (config_.seed.auto_seed
        ? std::to_string(config_.seed.duration_sec) + " s"
        : std::string("off")));
    Logger::instance().info("Origin: " + config_.origin.endpoint);
}

} // namespace swarmfetch
