// GemGame Core
// config.hpp - JSON-based configuration system

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <gemgame/core/logger.hpp>

namespace gemgame::core {

// Section/key configuration with JSON file persistence
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

    // Typed getters with defaults. A missing key or a type mismatch yields the default.
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] int64_t get_int64(std::string_view section, std::string_view key,
                                    int64_t default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] float get_float(std::string_view section, std::string_view key,
                                  float default_value = 0.0f) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_int64(std::string_view section, std::string_view key, int64_t value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_float(std::string_view section, std::string_view key, float value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* SERVER = "server";
    inline constexpr const char* CLIENT = "client";
    inline constexpr const char* LOGGING = "logging";
}  // namespace config_section

namespace config_key {
    // Server section
    inline constexpr const char* PORT = "port";
    inline constexpr const char* MAX_CLIENTS = "max_clients";
    inline constexpr const char* WORLD_DIRECTORY = "world_directory";
    inline constexpr const char* SEED = "seed";
    inline constexpr const char* VIEW_DISTANCE = "view_distance";
    inline constexpr const char* TICK_RATE = "tick_rate";

    // Client section (also uses PORT)
    inline constexpr const char* HOST = "host";
    inline constexpr const char* CLIENT_ID_FILE = "client_id_file";
    inline constexpr const char* MOVE_DURATION = "move_duration";
    inline constexpr const char* REMOTE_MOVE_DURATION = "remote_move_duration";

    // Logging section
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* DIRECTORY = "directory";
    inline constexpr const char* TO_FILE = "to_file";
}  // namespace config_key

inline constexpr uint16_t DEFAULT_PORT = 5678;

// Logger settings from the logging section
[[nodiscard]] LoggerConfig make_logger_config(const Config& config);

}  // namespace gemgame::core
