#ifndef SWARMFETCH_BASE_CONFIG_H
#define SWARMFETCH_BASE_CONFIG_H

#include <string>
#include <optional>
#include <cstdint>
#include <vector>

#define SWARMFETCH_VERSION "0.1.0"

namespace swarmfetch {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Tracking service configuration
struct TrackerConfig {
    std::string url = "http://localhost:8080";
    bool enable = true;
    uint32_t query_timeout_ms = 5000;     // swarm lookup, kept short
    uint32_t request_timeout_ms = 10000;  // publish / announce
};

// Hybrid transfer race configuration
struct TransferConfig {
    uint32_t deadline_sec = 300;
    uint32_t stall_grace_sec = 30;
    uint64_t min_swarm_throughput_bps = 0;  // 0 = only zero progress counts as stalled
    uint32_t poll_interval_ms = 200;
    std::string work_dir = "/tmp/swarmfetch";
};

// Peer swarm engine configuration
struct SwarmConfig {
    bool enable = true;
    std::string bind_address = "0.0.0.0";
    uint16_t listen_port = 6881;  // 0 means random port
    std::string advertise_address = "";  // address other peers should dial
    uint32_t max_peers_per_transfer = 4;
    uint32_t reconnect_backoff_ms = 500;  // first retry delay, doubles per failure
};

// Seeding configuration
struct SeedConfig {
    bool auto_seed = true;
    uint32_t duration_sec = 3600;  // 0 = until stopped
};

// Origin (direct download) configuration
struct OriginConfig {
    std::string endpoint = "https://huggingface.co";
    std::optional<std::string> token;
    uint64_t range_size = 4 * 1024 * 1024;  // bytes per ranged GET
    uint32_t max_redirects = 5;
    bool verify_checksum = true;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    TrackerConfig tracker;
    TransferConfig transfer;
    SwarmConfig swarm;
    SeedConfig seed;
    OriginConfig origin;
};

// Command selected on the command line
struct CommandOptions {
    std::string command;                 // download, seed, inspect
    std::string repo_id;
    std::string revision = "main";
    std::string repo_type = "model";
    std::vector<std::string> filenames;
    std::string local_dir = ".";
    std::string path;                    // seed / inspect source file
    bool no_seed = false;
    bool seed_wait = false;
    std::optional<uint32_t> duration_sec;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI-style file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const CommandOptions& command() const { return command_; }

    // Exit code to use when parse_command_line() returns false (0 for --help/--version)
    int cli_exit_code() const { return cli_exit_code_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check if required fields are set
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

    // Restore defaults (tests)
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void override_from_env();
    void apply_logging() const;

    GlobalConfig config_;
    CommandOptions command_;
    std::string config_file_;
    int cli_exit_code_ = 0;
};

} // namespace swarmfetch

#endif // SWARMFETCH_BASE_CONFIG_H
