// blockbridge World
// palette.hpp - De-duplicating table of (host handle, block-state key) entries

#pragma once

#include "id_list.hpp"
#include "types.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace blockbridge::world {

struct PaletteEntry {
    HostHandle host;
    BlockStateKey key;

    bool operator==(const PaletteEntry&) const = default;
};

// Ordered palette bound to a host id list.
// Every key in the index maps to a position holding an equal key.
// Not synchronized; PaletteStorage serializes access.
class Palette {
public:
    explicit Palette(IdListHandle id_list, size_t initial_capacity = 5);

    // Returns the existing position for key, or appends and returns the new one
    size_t index(HostHandle host, BlockStateKey key);

    // Always appends; the index entry for key is overwritten (last write wins)
    void add(HostHandle host, BlockStateKey key);

    // Out-of-range positions fall back to position 0. Throws EmptyPaletteError if empty.
    [[nodiscard]] const PaletteEntry& get(size_t position) const;

    // Position most recently recorded for key
    [[nodiscard]] std::optional<size_t> find(BlockStateKey key) const;

    [[nodiscard]] bool has_any(const std::function<bool(HostHandle)>& predicate) const;

    void clear();

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] IdListHandle id_list() const { return id_list_; }
    [[nodiscard]] const std::vector<PaletteEntry>& entries() const { return entries_; }

private:
    std::vector<PaletteEntry> entries_;
    std::unordered_map<BlockStateKey, size_t> indices_;
    IdListHandle id_list_;
};

}  // namespace blockbridge::world

template <>
struct fmt::formatter<blockbridge::world::PaletteEntry> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::PaletteEntry& entry, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "({}, {})", entry.host, entry.key);
    }
};

template <>
struct fmt::formatter<blockbridge::world::Palette> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::Palette& palette, FormatContext& ctx) const {
        auto out = fmt::format_to(ctx.out(), "Palette {{ id_list: {}, store: [", palette.id_list());
        bool first = true;
        for (const auto& entry : palette.entries()) {
            out = fmt::format_to(out, first ? "{}" : ", {}", entry);
            first = false;
        }
        return fmt::format_to(out, "] }}");
    }
};
