#pragma once

#include <cstdint>
#include <vector>

namespace pbrpc {
namespace internal {

// Big-endian (network order) conversion utilities for the packet head
// Explicit byte shuffling keeps the layout independent of the host byte order

inline uint32_t ReadUInt32BE(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline int32_t ReadInt32BE(const uint8_t* data) {
    return static_cast<int32_t>(ReadUInt32BE(data));
}

inline void WriteUInt32BE(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void WriteInt32BE(std::vector<uint8_t>& buffer, int32_t value) {
    WriteUInt32BE(buffer, static_cast<uint32_t>(value));
}

} // namespace internal
} // namespace pbrpc
