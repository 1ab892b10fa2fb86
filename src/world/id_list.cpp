// blockbridge World
// id_list.cpp - Host id-list directory implementation

#include <blockbridge/core/logger.hpp>
#include <blockbridge/world/errors.hpp>
#include <blockbridge/world/id_list.hpp>

#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace blockbridge::world {

struct IdListStorage::Impl {
    std::unordered_map<uint64_t, std::unordered_map<int32_t, HostHandle>> lists;
    uint64_t next_id = 1;
    mutable std::shared_mutex mutex;

    const std::unordered_map<int32_t, HostHandle>& find(IdListHandle list) const {
        auto it = lists.find(list.value);
        if (it == lists.end()) {
            throw InvalidHandleError(fmt::format("unknown id list {}", list));
        }
        return it->second;
    }
};

IdListStorage::IdListStorage() : impl_(std::make_unique<Impl>()) {}

IdListStorage::~IdListStorage() = default;

IdListHandle IdListStorage::create() {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    IdListHandle handle{impl_->next_id++};
    impl_->lists.emplace(handle.value, std::unordered_map<int32_t, HostHandle>{});
    return handle;
}

void IdListStorage::destroy(IdListHandle list) {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    if (impl_->lists.erase(list.value) == 0) {
        throw InvalidHandleError(fmt::format("unknown id list {}", list));
    }
}

void IdListStorage::put(IdListHandle list, int32_t key, HostHandle host) {
    std::unique_lock<std::shared_mutex> lock(impl_->mutex);
    auto it = impl_->lists.find(list.value);
    if (it == impl_->lists.end()) {
        throw InvalidHandleError(fmt::format("unknown id list {}", list));
    }
    it->second[key] = host;
}

std::optional<HostHandle> IdListStorage::resolve(IdListHandle list, int32_t key) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    const auto& entries = impl_->find(list);
    auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t IdListStorage::size(IdListHandle list) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    return impl_->find(list).size();
}

size_t IdListStorage::list_count() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex);
    return impl_->lists.size();
}

}  // namespace blockbridge::world
