// blockbridge Core
// settings.hpp - Typed runtime settings extracted from Config

#pragma once

#include <blockbridge/core/logger.hpp>

namespace blockbridge::core {

class Config;

struct BridgeSettings {
    // Logging
    LogLevel log_level = LogLevel::Info;
    bool log_file_enabled = true;

    // Palette registry sizing
    int palette_slot_capacity = 4096;
    int palette_entry_capacity = 5;

    // Transient GPU objects reserved per render pass
    int frame_arena_reserve = 256;

    // Invalid or non-positive values fall back to the defaults above
    [[nodiscard]] static BridgeSettings from_config(const Config& config);

    [[nodiscard]] LoggerConfig logger_config() const;
};

}  // namespace blockbridge::core
