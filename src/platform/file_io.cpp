// GemGame Platform Layer
// file_io.cpp - File system implementation

#include <gemgame/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <atomic>
#include <fstream>

#if defined(GEMGAME_PLATFORM_MACOS)
#include <mach-o/dyld.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#elif defined(GEMGAME_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#elif defined(GEMGAME_PLATFORM_LINUX)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace gemgame::platform {

namespace {

// Temporary sibling name unique per process and call
fs::path temporary_path_for(const fs::path& path) {
    static std::atomic<uint64_t> counter{0};
    auto name = path.filename().string();
    name += ".tmp";
    name += std::to_string(counter.fetch_add(1));
    return path.parent_path() / name;
}

bool replace_file(const fs::path& temporary, const fs::path& target) {
    std::error_code ec;
    fs::rename(temporary, target, ec);
    if (ec) {
        spdlog::warn("Failed to move '{}' into place as '{}': {}", temporary.string(), target.string(),
                     ec.message());
        fs::remove(temporary, ec);
        return false;
    }
    return true;
}

}  // namespace

fs::path FileSystem::get_executable_directory() {
#if defined(GEMGAME_PLATFORM_MACOS)
    char path[1024];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#elif defined(GEMGAME_PLATFORM_WINDOWS)
    wchar_t path[MAX_PATH];
    if (GetModuleFileNameW(nullptr, path, MAX_PATH) != 0) {
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#elif defined(GEMGAME_PLATFORM_LINUX)
    char path[1024];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#else
    return fs::current_path();
#endif
}

fs::path FileSystem::get_user_data_directory() {
#if defined(GEMGAME_PLATFORM_MACOS)
    const char* home = getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        home = pw->pw_dir;
    }
    return fs::path(home) / "Library" / "Application Support" / "GemGame";
#elif defined(GEMGAME_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / "GemGame";
        CoTaskMemFree(path);
        return result;
    }
    return get_executable_directory() / "data";
#elif defined(GEMGAME_PLATFORM_LINUX)
    const char* xdg_data = getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr) {
        return fs::path(xdg_data) / "GemGame";
    }
    const char* home = getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        home = pw->pw_dir;
    }
    return fs::path(home) / ".local" / "share" / "GemGame";
#else
    return get_executable_directory() / "data";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "GemGame";
}

std::optional<std::vector<uint8_t>> FileSystem::read_binary(const fs::path& path) {
    try {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) {
            return std::nullopt;
        }

        std::vector<uint8_t> data(static_cast<size_t>(size));
        file.seekg(0, std::ios::beg);
        file.read(reinterpret_cast<char*>(data.data()), size);

        if (!file) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return data;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_binary(const fs::path& path, std::span<const uint8_t> data) {
    try {
        if (path.has_parent_path()) {
            create_directories(path.parent_path());
        }

        const fs::path temporary = temporary_path_for(path);
        {
            std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                spdlog::warn("Failed to open file for writing: {}", temporary.string());
                return false;
            }

            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

            if (!file) {
                spdlog::warn("Error writing file: {}", temporary.string());
                return false;
            }
        }

        return replace_file(temporary, path);
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    return write_binary(path, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(content.data()),
                                                       content.size()));
}

bool FileSystem::create_directories(const fs::path& path) {
    try {
        return fs::create_directories(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::exists(const fs::path& path) {
    try {
        return fs::exists(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::is_file(const fs::path& path) {
    try {
        return fs::is_regular_file(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking if '{}' is file: {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove(const fs::path& path) {
    try {
        return fs::remove(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove_all(const fs::path& path) {
    try {
        fs::remove_all(path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove all '{}': {}", path.string(), e.what());
        return false;
    }
}

std::vector<fs::path> FileSystem::list_files(const fs::path& path, std::string_view extension) {
    std::vector<fs::path> result;
    try {
        if (!fs::exists(path) || !fs::is_directory(path)) {
            return result;
        }

        for (const auto& entry : fs::directory_iterator(path)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (extension.empty() || entry.path().extension() == extension) {
                result.push_back(entry.path());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Error listing files in '{}': {}", path.string(), e.what());
    }
    return result;
}

}  // namespace gemgame::platform
