// Brickfall Platform Layer
// file_io.cpp - File system helpers implementation

#include <brickfall/platform/file_io.hpp>

#include <brickfall/core/logger.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

#if defined(BRICKFALL_PLATFORM_MACOS) || defined(BRICKFALL_PLATFORM_LINUX)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace brickfall::platform {

namespace {

constexpr const char* APP_DIRECTORY = "brickfall";

fs::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home);
    }
#if defined(BRICKFALL_PLATFORM_MACOS) || defined(BRICKFALL_PLATFORM_LINUX)
    if (const struct passwd* pw = getpwuid(getuid())) {
        return fs::path(pw->pw_dir);
    }
#endif
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(BRICKFALL_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIRECTORY;
#else
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
        return fs::path(xdg_data) / APP_DIRECTORY;
    }
    return home_directory() / ".local" / "share" / APP_DIRECTORY;
#endif
}

fs::path FileSystem::get_user_levels_directory() {
    return get_user_data_directory() / "levels";
}

fs::path FileSystem::get_temp_directory() {
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    return (ec ? fs::path(".") : base) / APP_DIRECTORY;
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        BRICKFALL_LOG_WARN(core::log_category::FILE_IO, "Cannot open '{}' for reading", path.string());
        return std::nullopt;
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        BRICKFALL_LOG_WARN(core::log_category::FILE_IO, "Read error in '{}'", path.string());
        return std::nullopt;
    }
    return content;
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    if (path.has_parent_path() && !create_directories(path.parent_path())) {
        return false;
    }

    fs::path staging = path;
    staging += ".tmp";
    {
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) {
            BRICKFALL_LOG_WARN(core::log_category::FILE_IO, "Cannot open '{}' for writing", staging.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file.flush()) {
            BRICKFALL_LOG_WARN(core::log_category::FILE_IO, "Write error in '{}'", staging.string());
            std::error_code ignored;
            fs::remove(staging, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        BRICKFALL_LOG_ERROR(core::log_category::FILE_IO, "Cannot replace '{}': {}", path.string(), ec.message());
        fs::remove(staging, ec);
        return false;
    }
    return true;
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        BRICKFALL_LOG_ERROR(core::log_category::FILE_IO, "Cannot create '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        BRICKFALL_LOG_ERROR(core::log_category::FILE_IO, "Cannot remove '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

std::vector<fs::path> FileSystem::list_files(const fs::path& path, std::string_view extension) {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        BRICKFALL_LOG_DEBUG(core::log_category::FILE_IO, "Cannot list '{}': {}", path.string(), ec.message());
        return files;
    }

    for (const fs::directory_entry& entry : it) {
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        if (!extension.empty() && entry.path().extension() != extension) {
            continue;
        }
        files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace brickfall::platform
