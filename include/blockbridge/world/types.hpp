// blockbridge World
// types.hpp - Block-state keys, host handles and directions

#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <functional>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace blockbridge::world {

// ============================================================================
// Block State Keys
// ============================================================================

// Compact block-state identifier: block id plus variant ("augment")
struct BlockStateKey {
    uint16_t block = 0;
    uint16_t augment = 0;

    [[nodiscard]] constexpr uint32_t packed() const {
        return (static_cast<uint32_t>(block) << 16) | augment;
    }

    // Split a packed offset: high 16 bits are the block, low 16 bits the augment
    [[nodiscard]] static constexpr BlockStateKey from_packed(uint32_t packed) {
        return BlockStateKey{static_cast<uint16_t>(packed >> 16), static_cast<uint16_t>(packed & 0xFFFF)};
    }

    constexpr bool operator==(const BlockStateKey&) const = default;
};

// ============================================================================
// Host Handles
// ============================================================================

// Opaque token for an object owned by the host application. Never dereferenced
// here; only stored, compared and returned.
struct HostHandle {
    uint64_t value = 0;

    [[nodiscard]] constexpr bool is_null() const { return value == 0; }

    constexpr bool operator==(const HostHandle&) const = default;
};

inline constexpr HostHandle NULL_HOST_HANDLE{};

// ============================================================================
// Directions
// ============================================================================

enum class Direction : uint8_t {
    West = 0,   // -X
    East = 1,   // +X
    Down = 2,   // -Y
    Up = 3,     // +Y
    North = 4,  // -Z
    South = 5,  // +Z
    Count = 6
};

inline constexpr Direction ALL_DIRECTIONS[6] = {Direction::West, Direction::East,  Direction::Down,
                                                Direction::Up,   Direction::North, Direction::South};

// Direction offset vectors
inline constexpr glm::ivec3 DIRECTION_OFFSETS[6] = {{-1, 0, 0}, {1, 0, 0},  {0, -1, 0},
                                                    {0, 1, 0},  {0, 0, -1}, {0, 0, 1}};

// Pairs are adjacent, so flipping the low bit yields the opposite
[[nodiscard]] inline Direction opposite(Direction dir) {
    return static_cast<Direction>(static_cast<uint8_t>(dir) ^ 1);
}

[[nodiscard]] inline glm::ivec3 direction_offset(Direction dir) {
    return DIRECTION_OFFSETS[static_cast<uint8_t>(dir)];
}

[[nodiscard]] inline const char* direction_to_string(Direction dir) {
    switch (dir) {
        case Direction::West:
            return "West";
        case Direction::East:
            return "East";
        case Direction::Down:
            return "Down";
        case Direction::Up:
            return "Up";
        case Direction::North:
            return "North";
        case Direction::South:
            return "South";
        default:
            return "Unknown";
    }
}

}  // namespace blockbridge::world

// ============================================================================
// Hash specializations
// ============================================================================

namespace std {

template <>
struct hash<blockbridge::world::BlockStateKey> {
    size_t operator()(const blockbridge::world::BlockStateKey& key) const noexcept {
        return std::hash<uint32_t>{}(key.packed());
    }
};

template <>
struct hash<blockbridge::world::HostHandle> {
    size_t operator()(const blockbridge::world::HostHandle& handle) const noexcept {
        return std::hash<uint64_t>{}(handle.value);
    }
};

}  // namespace std

// ============================================================================
// fmt formatters
// ============================================================================

template <>
struct fmt::formatter<blockbridge::world::BlockStateKey> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::BlockStateKey& key, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{{block: {}, augment: {}}}", key.block, key.augment);
    }
};

template <>
struct fmt::formatter<blockbridge::world::HostHandle> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::HostHandle& handle, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "host#{:x}", handle.value);
    }
};

template <>
struct fmt::formatter<blockbridge::world::Direction> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(blockbridge::world::Direction dir, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(blockbridge::world::direction_to_string(dir), ctx);
    }
};
