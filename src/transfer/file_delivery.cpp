#include "swarmfetch/transfer/file_delivery.h"
#include "swarmfetch/base/error_code.h"
#include "swarmfetch/base/logger.h"
#include <filesystem>
#include <random>
#include <sstream>
#include <iomanip>
#include <unistd.h>

namespace swarmfetch {

namespace fs = std::filesystem;

std::string FileDelivery::temp_path_for(const std::string& destination, const std::string& tag) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream suffix;
    suffix << std::hex << std::setw(12) << std::setfill('0') << (rng() & 0xffffffffffffULL);

    fs::path dest(destination);
    fs::path dir = dest.parent_path();
    std::string name = "." + dest.filename().string() + "." + suffix.str() + "." + tag + ".part";
    return (dir / name).string();
}

void FileDelivery::prepare_destination(const std::string& destination) {
    if (destination.empty()) {
        throw SwarmFetchError(ErrorCode::DestinationUnwritable, "empty destination path");
    }

    fs::path dest(destination);
    std::error_code ec;
    if (fs::is_directory(dest, ec)) {
        throw SwarmFetchError(ErrorCode::DestinationUnwritable, destination + " is a directory");
    }

    fs::path dir = dest.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw SwarmFetchError(ErrorCode::DestinationUnwritable,
                              "cannot create " + dir.string() + ": " + ec.message());
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        throw SwarmFetchError(ErrorCode::DestinationUnwritable, dir.string() + " is not writable");
    }
}

bool FileDelivery::commit(const std::string& temp_path, const std::string& destination, std::string& error) {
    std::error_code ec;
    fs::rename(temp_path, destination, ec);
    if (ec) {
        error = "cannot move " + temp_path + " to " + destination + ": " + ec.message();
        discard(temp_path);
        return false;
    }
    return true;
}

bool FileDelivery::link_into_place(const std::string& source, const std::string& destination, std::string& error) {
    std::string temp = temp_path_for(destination, "swarm");
    std::error_code ec;
    fs::create_hard_link(source, temp, ec);
    if (ec) {
        Logger::instance().debug("Hard link failed ({}), copying {}", ec.message(), source);
        ec.clear();
        fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            error = "cannot copy " + source + ": " + ec.message();
            discard(temp);
            return false;
        }
    }
    return commit(temp, destination, error);
}

void FileDelivery::discard(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    fs::remove_all(path, ec);
}

} // namespace swarmfetch
