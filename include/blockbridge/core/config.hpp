// blockbridge Core
// config.hpp - JSON-based configuration system

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace blockbridge::core {

// Configuration store with JSON file persistence
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters with defaults
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    void notify_change(std::string_view section, std::string_view key);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Pre-defined section names for consistency
namespace config_section {
    inline constexpr const char* LOGGING = "logging";
    inline constexpr const char* PALETTE = "palette";
    inline constexpr const char* GL = "gl";
}  // namespace config_section

// Pre-defined key names for consistency
namespace config_key {
    // Logging section
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* FILE_ENABLED = "file_enabled";

    // Palette section
    inline constexpr const char* INITIAL_SLOT_CAPACITY = "initial_slot_capacity";
    inline constexpr const char* INITIAL_ENTRY_CAPACITY = "initial_entry_capacity";

    // GL section
    inline constexpr const char* FRAME_ARENA_RESERVE = "frame_arena_reserve";
}  // namespace config_key

}  // namespace blockbridge::core
