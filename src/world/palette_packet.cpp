// blockbridge World
// palette_packet.cpp - Palette packet decoding

#include <blockbridge/world/errors.hpp>
#include <blockbridge/world/palette_packet.hpp>
#include <blockbridge/world/varint.hpp>

namespace blockbridge::world {

DecodedPalettePacket decode_palette_packet(std::span<const uint8_t> bytes, size_t start_offset,
                                           std::span<const uint32_t> blockstate_offsets,
                                           const IdDirectory& directory, IdListHandle id_list) {
    if (start_offset > bytes.size()) {
        throw PacketDecodeError(
            fmt::format("start offset {} is past the end of a {} byte buffer", start_offset, bytes.size()));
    }

    size_t cursor = start_offset;
    auto count = read_var_int(bytes, cursor);
    cursor += count.length;

    if (count.value < 0) {
        throw PacketDecodeError(fmt::format("negative palette entry count {}", count.value));
    }
    if (static_cast<size_t>(count.value) > blockstate_offsets.size()) {
        throw PacketDecodeError(fmt::format("palette entry count {} exceeds {} block-state offsets", count.value,
                                            blockstate_offsets.size()));
    }

    DecodedPalettePacket packet;
    packet.entries.reserve(static_cast<size_t>(count.value));

    for (size_t i = 0; i < static_cast<size_t>(count.value); ++i) {
        auto key = read_var_int(bytes, cursor);
        cursor += key.length;

        auto host = directory.resolve(id_list, key.value);
        if (!host) {
            throw PacketDecodeError(fmt::format("directory key {} is not present in {}", key.value, id_list));
        }

        packet.entries.push_back(PaletteEntry{*host, BlockStateKey::from_packed(blockstate_offsets[i])});
    }

    packet.bytes_consumed = cursor - start_offset;
    return packet;
}

std::vector<uint8_t> encode_palette_packet(std::span<const int32_t> directory_keys) {
    std::vector<uint8_t> bytes;
    write_var_int(bytes, static_cast<int32_t>(directory_keys.size()));
    for (int32_t key : directory_keys) {
        write_var_int(bytes, key);
    }
    return bytes;
}

}  // namespace blockbridge::world
