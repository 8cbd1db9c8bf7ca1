#ifndef SWARMFETCH_SWARM_WIRE_H
#define SWARMFETCH_SWARM_WIRE_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace swarmfetch {

// Piece transfer protocol constants
static constexpr uint32_t PIECE_WIRE_MAGIC = 0x53574D50;  // "SWMP"
static constexpr uint32_t PIECE_WIRE_VERSION = 1;

enum class PieceMessageType : uint32_t {
    Request = 1,   // Ask for one piece, no payload
    Response = 2,  // Piece payload follows
    Error = 3      // Swarm or piece not served
};

// Piece message header, all integers in network byte order on the wire
struct PieceMessageHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t message_type;
    uint32_t piece_index;
    uint32_t data_length;
    uint8_t info_hash[32];   // raw content hash of the swarm
    uint8_t piece_hash[32];  // SHA-256 of the payload (responses)
} __attribute__((packed));

static_assert(sizeof(PieceMessageHeader) == 84, "piece header must be 84 bytes");

using RawHash = std::array<uint8_t, 32>;

// 64 hex chars to 32 raw bytes
std::optional<RawHash> hex_to_raw(const std::string& hex);
std::string raw_to_hex(const uint8_t* raw);

// Host-order header in, wire-order header out (and back)
PieceMessageHeader make_header(PieceMessageType type, uint32_t piece_index, uint32_t data_length,
                               const RawHash& info_hash, const RawHash* piece_hash = nullptr);
void header_to_host(PieceMessageHeader& header);

// Magic and version check on a host-order header
bool header_valid(const PieceMessageHeader& header);

} // namespace swarmfetch

#endif // SWARMFETCH_SWARM_WIRE_H
