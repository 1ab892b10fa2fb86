// blockbridge World
// palette.cpp - Palette implementation

#include <blockbridge/core/logger.hpp>
#include <blockbridge/world/errors.hpp>
#include <blockbridge/world/palette.hpp>

#include <algorithm>

namespace blockbridge::world {

Palette::Palette(IdListHandle id_list, size_t initial_capacity) : id_list_(id_list) {
    entries_.reserve(initial_capacity);
}

size_t Palette::index(HostHandle host, BlockStateKey key) {
    auto it = indices_.find(key);
    if (it != indices_.end()) {
        return it->second;
    }

    size_t position = entries_.size();
    entries_.push_back(PaletteEntry{host, key});
    indices_.emplace(key, position);
    return position;
}

void Palette::add(HostHandle host, BlockStateKey key) {
    indices_[key] = entries_.size();
    entries_.push_back(PaletteEntry{host, key});
}

const PaletteEntry& Palette::get(size_t position) const {
    if (entries_.empty()) {
        throw EmptyPaletteError(fmt::format("palette get({}) on an empty palette", position));
    }
    if (position >= entries_.size()) {
        BLOCKBRIDGE_LOG_DEBUG(core::log_category::PALETTE, "Palette position {} out of range (size {}), using 0",
                              position, entries_.size());
        return entries_.front();
    }
    return entries_[position];
}

std::optional<size_t> Palette::find(BlockStateKey key) const {
    auto it = indices_.find(key);
    if (it == indices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Palette::has_any(const std::function<bool(HostHandle)>& predicate) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&predicate](const PaletteEntry& entry) { return predicate(entry.host); });
}

void Palette::clear() {
    entries_.clear();
    indices_.clear();
}

}  // namespace blockbridge::world
