// blockbridge World
// palette_packet.hpp - Palette packet wire format
//
// Layout starting at start_offset:
//   [varint count] [varint directory_key] * count
// Key i pairs with blockstate_offsets[i], split into block (high 16 bits)
// and augment (low 16 bits).

#pragma once

#include "id_list.hpp"
#include "palette.hpp"

#include <span>
#include <vector>

namespace blockbridge::world {

struct DecodedPalettePacket {
    std::vector<PaletteEntry> entries;  // In wire order
    size_t bytes_consumed = 0;          // Relative to start_offset
};

// Decode without touching any palette. Throws PacketDecodeError for a malformed
// varint, a truncated buffer, a start offset past the end, a negative count, a
// count above blockstate_offsets.size() or a key the id list cannot resolve.
[[nodiscard]] DecodedPalettePacket decode_palette_packet(std::span<const uint8_t> bytes, size_t start_offset,
                                                         std::span<const uint32_t> blockstate_offsets,
                                                         const IdDirectory& directory, IdListHandle id_list);

// Encode directory keys in the same layout (host tooling and tests)
[[nodiscard]] std::vector<uint8_t> encode_palette_packet(std::span<const int32_t> directory_keys);

}  // namespace blockbridge::world
