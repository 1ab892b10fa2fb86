// blockbridge Platform Layer
// file_io.cpp - File helpers implementation

#include <blockbridge/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <pwd.h>
#include <unistd.h>

// Logs through spdlog directly: Logger::initialize calls these while holding its lock

namespace blockbridge::platform {

namespace {

fs::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home);
    }
    if (const passwd* entry = getpwuid(getuid())) {
        return fs::path(entry->pw_dir);
    }
    return fs::current_path();
}

}  // namespace

fs::path FileSystem::get_user_data_directory() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
        return fs::path(xdg_data) / "blockbridge";
    }
    return home_directory() / ".local" / "share" / "blockbridge";
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Cannot open '{}' for reading", path.string());
        return std::nullopt;
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        spdlog::warn("Read of '{}' failed", path.string());
        return std::nullopt;
    }
    return content;
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    if (path.has_parent_path() && !create_directories(path.parent_path())) {
        return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        spdlog::warn("Cannot open '{}' for writing", path.string());
        return false;
    }

    file << content;
    file.flush();
    if (!file) {
        spdlog::warn("Write to '{}' failed", path.string());
        return false;
    }
    return true;
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec || !fs::is_directory(path, ec)) {
        spdlog::error("Cannot create directory '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Cannot stat '{}': {}", path.string(), ec.message());
        return false;
    }
    return found;
}

}  // namespace blockbridge::platform
