// blockbridge World
// varint.hpp - Little-endian base-128 integers as used on the wire

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace blockbridge::world {

// A 32-bit value never needs more than 5 bytes
inline constexpr size_t VAR_INT_MAX_BYTES = 5;

struct VarIntRead {
    int32_t value = 0;
    size_t length = 0;  // Bytes consumed
};

// Decode one varint at bytes[offset]. Throws PacketDecodeError when the buffer ends
// mid-value or a fifth byte still has the continuation bit set.
[[nodiscard]] VarIntRead read_var_int(std::span<const uint8_t> bytes, size_t offset);

// Append the encoding of value; negative values always take five bytes
void write_var_int(std::vector<uint8_t>& out, int32_t value);

[[nodiscard]] size_t var_int_size(int32_t value);

}  // namespace blockbridge::world
