// blockbridge Core
// settings.cpp - Typed runtime settings implementation

#include <blockbridge/core/config.hpp>
#include <blockbridge/core/settings.hpp>

namespace blockbridge::core {

namespace {

int positive_or(const Config& config, const char* section, const char* key, int fallback) {
    int value = config.get_int(section, key, fallback);
    if (value <= 0) {
        BLOCKBRIDGE_LOG_WARN(log_category::CONFIG, "Ignoring non-positive {}.{} = {}, using {}", section, key, value,
                             fallback);
        return fallback;
    }
    return value;
}

}  // namespace

BridgeSettings BridgeSettings::from_config(const Config& config) {
    BridgeSettings settings;

    auto level_name = config.get_string(config_section::LOGGING, config_key::LEVEL,
                                        log_level_name(settings.log_level));
    if (auto level = parse_log_level(level_name)) {
        settings.log_level = *level;
    } else {
        BLOCKBRIDGE_LOG_WARN(log_category::CONFIG, "Unknown log level '{}', using '{}'", level_name,
                             log_level_name(settings.log_level));
    }
    settings.log_file_enabled =
        config.get_bool(config_section::LOGGING, config_key::FILE_ENABLED, settings.log_file_enabled);

    settings.palette_slot_capacity = positive_or(config, config_section::PALETTE, config_key::INITIAL_SLOT_CAPACITY,
                                                 settings.palette_slot_capacity);
    settings.palette_entry_capacity = positive_or(config, config_section::PALETTE, config_key::INITIAL_ENTRY_CAPACITY,
                                                  settings.palette_entry_capacity);
    settings.frame_arena_reserve =
        positive_or(config, config_section::GL, config_key::FRAME_ARENA_RESERVE, settings.frame_arena_reserve);

    return settings;
}

LoggerConfig BridgeSettings::logger_config() const {
    LoggerConfig logger;
    logger.console_level = log_level;
    logger.file_enabled = log_file_enabled;
    return logger;
}

}  // namespace blockbridge::core
