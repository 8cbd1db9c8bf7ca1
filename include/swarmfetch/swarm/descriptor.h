#ifndef SWARMFETCH_SWARM_DESCRIPTOR_H
#define SWARMFETCH_SWARM_DESCRIPTOR_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace swarmfetch {

// Piece-partitioned, content-addressed manifest of one file.
// Immutable once built; content_hash identifies the swarm.
struct SwarmDescriptor {
    std::string content_hash;               // hex SHA-256 of the canonical encoding
    uint64_t piece_length = 0;
    std::vector<std::string> piece_hashes;  // hex SHA-256 per piece
    uint64_t total_length = 0;
    std::string file_name;

    size_t num_pieces() const { return piece_hashes.size(); }
    uint64_t piece_offset(size_t index) const { return static_cast<uint64_t>(index) * piece_length; }
    uint64_t piece_size(size_t index) const;

    // Hash of {file_name, piece_length, pieces, total_length}
    std::string compute_content_hash() const;

    // Checks piece count, hash formats, file name and content hash
    bool valid() const;

    nlohmann::json to_json() const;

    // Returns nullopt if fields are missing or the invariants do not hold
    static std::optional<SwarmDescriptor> from_json(const nlohmann::json& j);
};

class DescriptorBuilder {
public:
    // <100MB: 256KB, <1GB: 1MB, <10GB: 4MB, otherwise 16MB
    static uint64_t piece_length_for_size(uint64_t total_size);

    // Hash every piece of the file at path. Throws SwarmFetchError
    // (IoError) if the file cannot be read or is shorter than total_size.
    static SwarmDescriptor build(const std::string& path, uint64_t total_size,
                                 const std::string& file_name = "");

    // Re-hash the file piece by piece against the descriptor
    static bool verify_file(const SwarmDescriptor& descriptor, const std::string& path);

    static std::string sha256_hex(const uint8_t* data, size_t size);
};

// Streaming SHA-256 of a whole file, nullopt if it cannot be read
std::optional<std::string> sha256_file(const std::string& path);

// "magnet:?xt=urn:sha256:<hash>&dn=<name>&xl=<size>"
std::string make_magnet_link(const SwarmDescriptor& descriptor);

bool is_hex_digest(const std::string& value);

} // namespace swarmfetch

#endif // SWARMFETCH_SWARM_DESCRIPTOR_H
