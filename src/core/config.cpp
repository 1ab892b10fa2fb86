// blockbridge Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <blockbridge/core/config.hpp>
#include <blockbridge/core/logger.hpp>
#include <blockbridge/core/settings.hpp>
#include <blockbridge/platform/file_io.hpp>

namespace blockbridge::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    template <typename T>
    T lookup(std::string_view section, std::string_view key, T default_value) const {
        try {
            auto section_it = data.find(std::string(section));
            if (section_it == data.end() || !section_it->is_object()) {
                return default_value;
            }
            auto key_it = section_it->find(std::string(key));
            if (key_it == section_it->end()) {
                return default_value;
            }
            return key_it->get<T>();
        } catch (const json::exception& e) {
            BLOCKBRIDGE_LOG_WARN(log_category::CONFIG, "Config value {}.{} has wrong type: {}", section, key,
                                 e.what());
        }
        return default_value;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
    impl_->dirty = false;
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    BLOCKBRIDGE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        auto parsed = json::parse(content);
        if (!parsed.is_object()) {
            BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        impl_->data = std::move(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    BLOCKBRIDGE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        BLOCKBRIDGE_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (save(path)) {
        impl_->dirty = false;
    } else {
        BLOCKBRIDGE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->lookup<int>(section, key, default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->lookup<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->lookup<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_change(section, key);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_change(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    notify_change(section, key);
}

bool Config::has(std::string_view section, std::string_view key) const {
    auto section_it = impl_->data.find(std::string(section));
    return section_it != impl_->data.end() && section_it->is_object() && section_it->contains(std::string(key));
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    const BridgeSettings defaults;
    impl_->data = json{{config_section::LOGGING,
                        {{config_key::LEVEL, log_level_name(defaults.log_level)},
                         {config_key::FILE_ENABLED, defaults.log_file_enabled}}},
                       {config_section::PALETTE,
                        {{config_key::INITIAL_SLOT_CAPACITY, defaults.palette_slot_capacity},
                         {config_key::INITIAL_ENTRY_CAPACITY, defaults.palette_entry_capacity}}},
                       {config_section::GL, {{config_key::FRAME_ARENA_RESERVE, defaults.frame_arena_reserve}}}};
    impl_->dirty = true;
}

void Config::notify_change(std::string_view section, std::string_view key) {
    impl_->dirty = true;
    if (impl_->change_callback) {
        impl_->change_callback(section, key);
    }
}

}  // namespace blockbridge::core
