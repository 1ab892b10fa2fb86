// blockbridge World
// varint.cpp - Varint codec implementation

#include <blockbridge/world/errors.hpp>
#include <blockbridge/world/varint.hpp>

#include <spdlog/fmt/fmt.h>

namespace blockbridge::world {

namespace {

constexpr uint8_t SEGMENT_BITS = 0x7F;
constexpr uint8_t CONTINUE_BIT = 0x80;

}  // namespace

VarIntRead read_var_int(std::span<const uint8_t> bytes, size_t offset) {
    uint32_t result = 0;
    size_t length = 0;

    while (true) {
        if (offset + length >= bytes.size()) {
            throw PacketDecodeError(fmt::format("truncated varint at offset {}", offset));
        }

        uint8_t byte = bytes[offset + length];
        result |= static_cast<uint32_t>(byte & SEGMENT_BITS) << (7 * length);
        ++length;

        if ((byte & CONTINUE_BIT) == 0) {
            break;
        }
        if (length == VAR_INT_MAX_BYTES) {
            throw PacketDecodeError(fmt::format("varint at offset {} exceeds {} bytes", offset, VAR_INT_MAX_BYTES));
        }
    }

    return VarIntRead{static_cast<int32_t>(result), length};
}

void write_var_int(std::vector<uint8_t>& out, int32_t value) {
    auto remaining = static_cast<uint32_t>(value);
    while ((remaining & ~static_cast<uint32_t>(SEGMENT_BITS)) != 0) {
        out.push_back(static_cast<uint8_t>((remaining & SEGMENT_BITS) | CONTINUE_BIT));
        remaining >>= 7;
    }
    out.push_back(static_cast<uint8_t>(remaining));
}

size_t var_int_size(int32_t value) {
    auto remaining = static_cast<uint32_t>(value);
    size_t size = 1;
    while ((remaining & ~static_cast<uint32_t>(SEGMENT_BITS)) != 0) {
        remaining >>= 7;
        ++size;
    }
    return size;
}

}  // namespace blockbridge::world
