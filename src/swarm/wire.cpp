#include "swarmfetch/swarm/wire.h"
#include <arpa/inet.h>
#include <cstring>

namespace swarmfetch {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<RawHash> hex_to_raw(const std::string& hex) {
    if (hex.size() != 64) return std::nullopt;
    RawHash raw{};
    for (size_t i = 0; i < raw.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        raw[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return raw;
}

std::string raw_to_hex(const uint8_t* raw) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (size_t i = 0; i < 32; ++i) {
        out += digits[raw[i] >> 4];
        out += digits[raw[i] & 0x0f];
    }
    return out;
}

PieceMessageHeader make_header(PieceMessageType type, uint32_t piece_index, uint32_t data_length,
                               const RawHash& info_hash, const RawHash* piece_hash) {
    PieceMessageHeader header{};
    header.magic = htonl(PIECE_WIRE_MAGIC);
    header.version = htonl(PIECE_WIRE_VERSION);
    header.message_type = htonl(static_cast<uint32_t>(type));
    header.piece_index = htonl(piece_index);
    header.data_length = htonl(data_length);
    std::memcpy(header.info_hash, info_hash.data(), info_hash.size());
    if (piece_hash) {
        std::memcpy(header.piece_hash, piece_hash->data(), piece_hash->size());
    }
    return header;
}

void header_to_host(PieceMessageHeader& header) {
    header.magic = ntohl(header.magic);
    header.version = ntohl(header.version);
    header.message_type = ntohl(header.message_type);
    header.piece_index = ntohl(header.piece_index);
    header.data_length = ntohl(header.data_length);
}

bool header_valid(const PieceMessageHeader& header) {
    return header.magic == PIECE_WIRE_MAGIC && header.version == PIECE_WIRE_VERSION;
}

} // namespace swarmfetch
