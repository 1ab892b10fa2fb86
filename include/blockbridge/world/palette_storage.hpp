// blockbridge World
// palette_storage.hpp - Process-wide registry of palettes addressed by handle

#pragma once

#include "id_list.hpp"
#include "palette.hpp"

#include <blockbridge/core/settings.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace blockbridge::world {

// Slot index plus generation. A destroyed slot is recycled with a bumped
// generation, so stale handles are detected instead of aliasing a new palette.
struct PaletteHandle {
    uint32_t index = 0;
    uint32_t generation = 0;  // 0 is never issued

    [[nodiscard]] constexpr uint64_t to_u64() const {
        return (static_cast<uint64_t>(generation) << 32) | index;
    }

    [[nodiscard]] static constexpr PaletteHandle from_u64(uint64_t packed) {
        return PaletteHandle{static_cast<uint32_t>(packed & 0xFFFFFFFFu), static_cast<uint32_t>(packed >> 32)};
    }

    [[nodiscard]] constexpr bool is_null() const { return generation == 0; }

    constexpr bool operator==(const PaletteHandle&) const = default;
};

// Owns every palette; callers only ever hold handles.
//
// Locking: a registry-wide shared_mutex guards the slot table (exclusive only for
// create/copy insertion/destroy), and each slot carries its own shared_mutex for
// the palette contents. Operations on different palettes never block each other.
// All operations throw InvalidHandleError for null, unknown or destroyed handles.
class PaletteStorage {
public:
    explicit PaletteStorage(const IdDirectory& directory, size_t initial_slot_capacity = 4096,
                            size_t initial_entry_capacity = 5);
    PaletteStorage(const IdDirectory& directory, const core::BridgeSettings& settings);
    ~PaletteStorage();

    // Non-copyable
    PaletteStorage(const PaletteStorage&) = delete;
    PaletteStorage& operator=(const PaletteStorage&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    [[nodiscard]] PaletteHandle create(IdListHandle id_list);
    void destroy(PaletteHandle handle);

    // Deep clone taken under the source's shared lock
    [[nodiscard]] PaletteHandle copy(PaletteHandle handle);

    // ========================================================================
    // Mutation
    // ========================================================================

    void clear(PaletteHandle handle);
    size_t index(PaletteHandle handle, HostHandle host, BlockStateKey key);
    void add(PaletteHandle handle, HostHandle host, BlockStateKey key);

    // Decode a palette packet and append its entries in wire order. All-or-nothing:
    // on PacketDecodeError the palette is unchanged. Returns bytes consumed.
    size_t decode_packet(PaletteHandle handle, std::span<const uint8_t> bytes, size_t start_offset,
                         std::span<const uint32_t> blockstate_offsets);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] size_t size(PaletteHandle handle) const;

    // Out-of-range positions fall back to 0; EmptyPaletteError if the palette is empty
    [[nodiscard]] PaletteEntry get(PaletteHandle handle, size_t position) const;

    // Evaluated against a snapshot of the host handles with no lock held
    [[nodiscard]] bool has_any(PaletteHandle handle, const std::function<bool(HostHandle)>& predicate) const;

    // Log every entry at info level
    void debug_dump(PaletteHandle handle) const;

    [[nodiscard]] bool is_valid(PaletteHandle handle) const;
    [[nodiscard]] size_t palette_count() const;

    // Slots reserved up front (palette.initial_slot_capacity)
    [[nodiscard]] size_t slot_capacity() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blockbridge::world

template <>
struct fmt::formatter<blockbridge::world::PaletteHandle> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::PaletteHandle& handle, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "palette#{}v{}", handle.index, handle.generation);
    }
};
