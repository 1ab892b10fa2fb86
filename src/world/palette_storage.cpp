// blockbridge World
// palette_storage.cpp - Palette registry implementation

#include <blockbridge/core/logger.hpp>
#include <blockbridge/world/errors.hpp>
#include <blockbridge/world/palette_packet.hpp>
#include <blockbridge/world/palette_storage.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace blockbridge::world {

using core::log_category::PALETTE;

struct PaletteStorage::Impl {
    struct Slot {
        std::optional<Palette> palette;
        uint32_t generation = 1;
        mutable std::shared_mutex mutex;
    };

    const IdDirectory& directory;
    size_t entry_capacity;

    std::vector<std::unique_ptr<Slot>> slots;
    std::vector<uint32_t> free_slots;
    size_t live_count = 0;
    mutable std::shared_mutex registry_mutex;

    Impl(const IdDirectory& dir, size_t slot_capacity, size_t entry_cap) : directory(dir), entry_capacity(entry_cap) {
        slots.reserve(slot_capacity);
    }

    // Caller holds registry_mutex (shared or exclusive)
    Slot* find(PaletteHandle handle) const {
        if (handle.is_null() || handle.index >= slots.size()) {
            return nullptr;
        }
        Slot* slot = slots[handle.index].get();
        if (slot->generation != handle.generation || !slot->palette) {
            return nullptr;
        }
        return slot;
    }

    Slot& lookup(PaletteHandle handle) const {
        Slot* slot = find(handle);
        if (slot == nullptr) {
            throw InvalidHandleError(fmt::format("unknown or destroyed palette handle {}", handle));
        }
        return *slot;
    }

    // Caller holds registry_mutex exclusively
    PaletteHandle insert(Palette palette) {
        uint32_t index;
        if (!free_slots.empty()) {
            index = free_slots.back();
            free_slots.pop_back();
        } else {
            index = static_cast<uint32_t>(slots.size());
            slots.push_back(std::make_unique<Slot>());
        }

        Slot& slot = *slots[index];
        slot.palette.emplace(std::move(palette));
        ++live_count;
        return PaletteHandle{index, slot.generation};
    }

    template <typename Fn>
    decltype(auto) read(PaletteHandle handle, Fn&& fn) const {
        std::shared_lock<std::shared_mutex> registry_lock(registry_mutex);
        Slot& slot = lookup(handle);
        std::shared_lock<std::shared_mutex> slot_lock(slot.mutex);
        return fn(static_cast<const Palette&>(*slot.palette));
    }

    template <typename Fn>
    decltype(auto) write(PaletteHandle handle, Fn&& fn) {
        std::shared_lock<std::shared_mutex> registry_lock(registry_mutex);
        Slot& slot = lookup(handle);
        std::unique_lock<std::shared_mutex> slot_lock(slot.mutex);
        return fn(*slot.palette);
    }
};

PaletteStorage::PaletteStorage(const IdDirectory& directory, size_t initial_slot_capacity,
                               size_t initial_entry_capacity)
    : impl_(std::make_unique<Impl>(directory, initial_slot_capacity, initial_entry_capacity)) {}

PaletteStorage::PaletteStorage(const IdDirectory& directory, const core::BridgeSettings& settings)
    : PaletteStorage(directory, static_cast<size_t>(settings.palette_slot_capacity),
                     static_cast<size_t>(settings.palette_entry_capacity)) {}

PaletteStorage::~PaletteStorage() = default;

PaletteHandle PaletteStorage::create(IdListHandle id_list) {
    if (id_list.is_null()) {
        throw InvalidHandleError("cannot create a palette for a null id list");
    }

    std::unique_lock<std::shared_mutex> lock(impl_->registry_mutex);
    auto handle = impl_->insert(Palette(id_list, impl_->entry_capacity));
    BLOCKBRIDGE_LOG_TRACE(PALETTE, "Created {} for {}", handle, id_list);
    return handle;
}

void PaletteStorage::destroy(PaletteHandle handle) {
    std::unique_lock<std::shared_mutex> lock(impl_->registry_mutex);
    auto& slot = impl_->lookup(handle);
    slot.palette.reset();
    ++slot.generation;
    if (slot.generation == 0) {
        slot.generation = 1;
    }
    impl_->free_slots.push_back(handle.index);
    --impl_->live_count;
    BLOCKBRIDGE_LOG_TRACE(PALETTE, "Destroyed {}", handle);
}

PaletteHandle PaletteStorage::copy(PaletteHandle handle) {
    Palette clone = impl_->read(handle, [](const Palette& palette) { return palette; });

    std::unique_lock<std::shared_mutex> lock(impl_->registry_mutex);
    auto copied = impl_->insert(std::move(clone));
    BLOCKBRIDGE_LOG_TRACE(PALETTE, "Copied {} to {}", handle, copied);
    return copied;
}

void PaletteStorage::clear(PaletteHandle handle) {
    impl_->write(handle, [](Palette& palette) { palette.clear(); });
}

size_t PaletteStorage::index(PaletteHandle handle, HostHandle host, BlockStateKey key) {
    return impl_->write(handle, [&](Palette& palette) { return palette.index(host, key); });
}

void PaletteStorage::add(PaletteHandle handle, HostHandle host, BlockStateKey key) {
    impl_->write(handle, [&](Palette& palette) { palette.add(host, key); });
}

size_t PaletteStorage::decode_packet(PaletteHandle handle, std::span<const uint8_t> bytes, size_t start_offset,
                                     std::span<const uint32_t> blockstate_offsets) {
    return impl_->write(handle, [&](Palette& palette) {
        auto packet =
            decode_palette_packet(bytes, start_offset, blockstate_offsets, impl_->directory, palette.id_list());
        for (const auto& entry : packet.entries) {
            palette.add(entry.host, entry.key);
        }
        BLOCKBRIDGE_LOG_TRACE(PALETTE, "Decoded {} entries into {} ({} bytes)", packet.entries.size(), handle,
                              packet.bytes_consumed);
        return packet.bytes_consumed;
    });
}

size_t PaletteStorage::size(PaletteHandle handle) const {
    return impl_->read(handle, [](const Palette& palette) { return palette.size(); });
}

PaletteEntry PaletteStorage::get(PaletteHandle handle, size_t position) const {
    return impl_->read(handle, [position](const Palette& palette) { return palette.get(position); });
}

bool PaletteStorage::has_any(PaletteHandle handle, const std::function<bool(HostHandle)>& predicate) const {
    // The predicate runs outside the locks, so it may call back into the storage
    auto hosts = impl_->read(handle, [](const Palette& palette) {
        std::vector<HostHandle> snapshot;
        snapshot.reserve(palette.size());
        for (const auto& entry : palette.entries()) {
            snapshot.push_back(entry.host);
        }
        return snapshot;
    });
    return std::any_of(hosts.begin(), hosts.end(), predicate);
}

void PaletteStorage::debug_dump(PaletteHandle handle) const {
    impl_->read(handle, [handle](const Palette& palette) {
        BLOCKBRIDGE_LOG_INFO(PALETTE, "{} holds {} entries", handle, palette.size());
        for (size_t i = 0; i < palette.size(); ++i) {
            const auto& entry = palette.entries()[i];
            BLOCKBRIDGE_LOG_INFO(PALETTE, "  [{}] {} -> {}", i, entry.host, entry.key);
        }
    });
}

bool PaletteStorage::is_valid(PaletteHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(impl_->registry_mutex);
    return impl_->find(handle) != nullptr;
}

size_t PaletteStorage::palette_count() const {
    std::shared_lock<std::shared_mutex> lock(impl_->registry_mutex);
    return impl_->live_count;
}

size_t PaletteStorage::slot_capacity() const {
    std::shared_lock<std::shared_mutex> lock(impl_->registry_mutex);
    return impl_->slots.capacity();
}

}  // namespace blockbridge::world
