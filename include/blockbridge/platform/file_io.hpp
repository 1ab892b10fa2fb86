// blockbridge Platform Layer
// file_io.hpp - File helpers backing config files and the log directory

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace blockbridge::platform {

namespace fs = std::filesystem;

// Static helpers; failures are logged and reported through the return value
class FileSystem {
public:
    // $XDG_DATA_HOME/blockbridge, else ~/.local/share/blockbridge
    static fs::path get_user_data_directory();

    static std::optional<std::string> read_text(const fs::path& path);

    // Creates missing parent directories first
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace blockbridge::platform
