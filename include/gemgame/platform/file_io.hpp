// GemGame Platform Layer
// file_io.hpp - File system operations used by persistence and config

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gemgame::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    // Standard paths
    static fs::path get_executable_directory();
    static fs::path get_user_data_directory();  // $XDG_DATA_HOME/GemGame or ~/.local/share/GemGame
    static fs::path get_temp_directory();

    static std::optional<std::vector<uint8_t>> read_binary(const fs::path& path);
    static std::optional<std::string> read_text(const fs::path& path);

    // Writes go to a sibling temporary file which is then renamed over the
    // target, so a reader never observes a partially written file.
    static bool write_binary(const fs::path& path, std::span<const uint8_t> data);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove(const fs::path& path);
    static bool remove_all(const fs::path& path);
    static std::vector<fs::path> list_files(const fs::path& path, std::string_view extension = "");

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace gemgame::platform
