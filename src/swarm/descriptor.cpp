#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/base/error_code.h"
#include "swarmfetch/base/logger.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <elio/hash/sha256.hpp>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <algorithm>

namespace swarmfetch {

namespace {

constexpr uint64_t KB = 1024;
constexpr uint64_t MB = 1024 * KB;
constexpr uint64_t GB = 1024 * MB;

// Read buffer for whole-file hashing
constexpr size_t FILE_READ_BUFFER = 1 * MB;

bool is_safe_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string base_name(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // anonymous namespace

bool is_hex_digest(const std::string& value) {
    if (value.size() != 64) return false;
    for (char c : value) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

uint64_t SwarmDescriptor::piece_size(size_t index) const {
    if (index >= num_pieces()) return 0;
    uint64_t offset = piece_offset(index);
    return std::min(piece_length, total_length - offset);
}

std::string SwarmDescriptor::compute_content_hash() const {
    nlohmann::json canonical = {
        {"file_name", file_name},
        {"piece_length", piece_length},
        {"pieces", piece_hashes},
        {"total_length", total_length}
    };
    std::string encoded = canonical.dump();
    return DescriptorBuilder::sha256_hex(reinterpret_cast<const uint8_t*>(encoded.data()), encoded.size());
}

bool SwarmDescriptor::valid() const {
    if (piece_length == 0 || !is_safe_file_name(file_name)) {
        return false;
    }
    uint64_t expected_pieces = (total_length + piece_length - 1) / piece_length;
    if (piece_hashes.size() != expected_pieces) {
        return false;
    }
    for (const auto& h : piece_hashes) {
        if (!is_hex_digest(h)) return false;
    }
    return content_hash == compute_content_hash();
}

nlohmann::json SwarmDescriptor::to_json() const {
    return {
        {"info_hash", content_hash},
        {"file_name", file_name},
        {"piece_length", piece_length},
        {"pieces", piece_hashes},
        {"total_length", total_length}
    };
}

std::optional<SwarmDescriptor> SwarmDescriptor::from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    try {
        SwarmDescriptor desc;
        desc.file_name = j.at("file_name").get<std::string>();
        desc.piece_length = j.at("piece_length").get<uint64_t>();
        desc.piece_hashes = j.at("pieces").get<std::vector<std::string>>();
        desc.total_length = j.at("total_length").get<uint64_t>();
        desc.content_hash = desc.compute_content_hash();

        // An embedded hash must agree with the recomputed one
        if (j.contains("info_hash") && j["info_hash"].get<std::string>() != desc.content_hash) {
            return std::nullopt;
        }
        if (!desc.valid()) {
            return std::nullopt;
        }
        return desc;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

uint64_t DescriptorBuilder::piece_length_for_size(uint64_t total_size) {
    if (total_size < 100 * MB) return 256 * KB;
    if (total_size < 1 * GB) return 1 * MB;
    if (total_size < 10 * GB) return 4 * MB;
    return 16 * MB;
}

std::string DescriptorBuilder::sha256_hex(const uint8_t* data, size_t size) {
    auto digest = elio::hash::sha256(data, size);
    return elio::hash::sha256_hex(digest);
}

SwarmDescriptor DescriptorBuilder::build(const std::string& path, uint64_t total_size,
                                         const std::string& file_name) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SwarmFetchError(ErrorCode::IoError, "cannot open " + path);
    }

    SwarmDescriptor desc;
    desc.file_name = file_name.empty() ? base_name(path) : file_name;
    desc.total_length = total_size;
    desc.piece_length = piece_length_for_size(total_size);

    std::vector<uint8_t> buffer(desc.piece_length);
    uint64_t remaining = total_size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(desc.piece_length, remaining));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(file.gcount()) != want) {
            throw SwarmFetchError(ErrorCode::IoError,
                                  "short read in " + path + " at offset " +
                                  std::to_string(total_size - remaining));
        }
        desc.piece_hashes.push_back(sha256_hex(buffer.data(), want));
        remaining -= want;
    }

    desc.content_hash = desc.compute_content_hash();
    Logger::instance().debug("Built descriptor {} for {} ({} pieces of {} bytes)",
                             desc.content_hash, desc.file_name, desc.num_pieces(), desc.piece_length);
    return desc;
}

bool DescriptorBuilder::verify_file(const SwarmDescriptor& descriptor, const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }
    if (static_cast<uint64_t>(file.tellg()) != descriptor.total_length) {
        return false;
    }
    file.seekg(0);

    std::vector<uint8_t> buffer(descriptor.piece_length);
    for (size_t i = 0; i < descriptor.num_pieces(); ++i) {
        size_t want = static_cast<size_t>(descriptor.piece_size(i));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(file.gcount()) != want) {
            return false;
        }
        if (sha256_hex(buffer.data(), want) != descriptor.piece_hashes[i]) {
            Logger::instance().error("Piece {} of {} does not match its hash", i, path);
            return false;
        }
    }
    return true;
}

std::optional<std::string> sha256_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(FILE_READ_BUFFER);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        return std::nullopt;
    }
    return to_hex(hash, len);
}

std::string make_magnet_link(const SwarmDescriptor& descriptor) {
    return "magnet:?xt=urn:sha256:" + descriptor.content_hash +
           "&dn=" + descriptor.file_name +
           "&xl=" + std::to_string(descriptor.total_length);
}

} // namespace swarmfetch
