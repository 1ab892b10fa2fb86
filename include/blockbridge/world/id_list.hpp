// blockbridge World
// id_list.hpp - Host id-list directory (wire key -> host object)

#pragma once

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace blockbridge::world {

// Handle to one host id list; zero is never a valid list
struct IdListHandle {
    uint64_t value = 0;

    [[nodiscard]] constexpr bool is_null() const { return value == 0; }

    constexpr bool operator==(const IdListHandle&) const = default;
};

// Resolves directory keys read off the wire to host object handles
class IdDirectory {
public:
    virtual ~IdDirectory() = default;

    IdDirectory(const IdDirectory&) = delete;
    IdDirectory& operator=(const IdDirectory&) = delete;

    // nullopt if the key is not present; throws InvalidHandleError for an unknown list
    [[nodiscard]] virtual std::optional<HostHandle> resolve(IdListHandle list, int32_t key) const = 0;

protected:
    IdDirectory() = default;
};

// In-process id-list registry. Thread-safe.
class IdListStorage : public IdDirectory {
public:
    IdListStorage();
    ~IdListStorage() override;

    [[nodiscard]] IdListHandle create();
    void destroy(IdListHandle list);

    // Insert or replace the mapping for key
    void put(IdListHandle list, int32_t key, HostHandle host);

    [[nodiscard]] std::optional<HostHandle> resolve(IdListHandle list, int32_t key) const override;

    [[nodiscard]] size_t size(IdListHandle list) const;
    [[nodiscard]] size_t list_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace blockbridge::world

template <>
struct fmt::formatter<blockbridge::world::IdListHandle> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const blockbridge::world::IdListHandle& handle, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "idlist#{}", handle.value);
    }
};
