// Brickfall Platform Layer
// file_io.hpp - File system helpers for levels, config and logs

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brickfall::platform {

namespace fs = std::filesystem;

class FileSystem {
public:
    // $XDG_DATA_HOME/brickfall, falling back to ~/.local/share/brickfall
    static fs::path get_user_data_directory();
    static fs::path get_user_levels_directory();
    static fs::path get_temp_directory();

    static std::optional<std::string> read_text(const fs::path& path);

    // Writes through a sibling temp file so readers never see a partial file
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);

    // Regular files directly under path, sorted by name
    static std::vector<fs::path> list_files(const fs::path& path, std::string_view extension = "");

private:
    FileSystem() = delete;
};

}  // namespace brickfall::platform
