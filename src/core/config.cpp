// GemGame Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <algorithm>

#include <gemgame/core/config.hpp>
#include <gemgame/core/logger.hpp>
#include <gemgame/platform/file_io.hpp>

namespace gemgame::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    bool dirty = false;

    // Value at section/key, or nullptr when either level is absent
    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    template<typename T>
    [[nodiscard]] T get_or(std::string_view section, std::string_view key, T default_value) const {
        const json* value = find(section, key);
        if (value == nullptr) {
            return default_value;
        }
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            GEMGAME_LOG_WARN(log_category::CONFIG, "Config value {}.{} has the wrong type: {}", section, key,
                             e.what());
            return default_value;
        }
    }

    template<typename T>
    void put(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        GEMGAME_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    GEMGAME_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            GEMGAME_LOG_ERROR(log_category::CONFIG, "Config root must be an object");
            return false;
        }
        // Keys absent from the file keep their defaults
        set_defaults();
        impl_->data.merge_patch(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        GEMGAME_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            GEMGAME_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        GEMGAME_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    GEMGAME_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        GEMGAME_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
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

    if (!save(path)) {
        GEMGAME_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->get_or<int>(section, key, default_value);
}

int64_t Config::get_int64(std::string_view section, std::string_view key, int64_t default_value) const {
    return impl_->get_or<int64_t>(section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->get_or<double>(section, key, default_value);
}

float Config::get_float(std::string_view section, std::string_view key, float default_value) const {
    return static_cast<float>(get_double(section, key, static_cast<double>(default_value)));
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->get_or<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    return impl_->get_or<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->put(section, key, value);
}

void Config::set_int64(std::string_view section, std::string_view key, int64_t value) {
    impl_->put(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->put(section, key, value);
}

void Config::set_float(std::string_view section, std::string_view key, float value) {
    set_double(section, key, static_cast<double>(value));
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->put(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->put(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::SERVER,
                        {{config_key::PORT, DEFAULT_PORT},
                         {config_key::MAX_CLIENTS, 32},
                         {config_key::WORLD_DIRECTORY, "world"},
                         {config_key::SEED, 1},
                         {config_key::VIEW_DISTANCE, 3},
                         {config_key::TICK_RATE, 60}}},
                       {config_section::CLIENT,
                        {{config_key::HOST, "127.0.0.1"},
                         {config_key::PORT, DEFAULT_PORT},
                         {config_key::CLIENT_ID_FILE, "client_id"},
                         {config_key::MOVE_DURATION, 0.2},
                         {config_key::REMOTE_MOVE_DURATION, 0.2}}},
                       {config_section::LOGGING,
                        {{config_key::LEVEL, "info"}, {config_key::DIRECTORY, ""}, {config_key::TO_FILE, false}}}};
    impl_->dirty = true;
}

LoggerConfig make_logger_config(const Config& config) {
    LoggerConfig logger_config;
    const auto level = parse_log_level(config.get_string(config_section::LOGGING, config_key::LEVEL, "info"));
    logger_config.console_level = level;
    logger_config.file_level = std::min(level, LogLevel::Debug);
    logger_config.log_to_file = config.get_bool(config_section::LOGGING, config_key::TO_FILE, false);
    logger_config.log_directory = config.get_string(config_section::LOGGING, config_key::DIRECTORY, "");
    return logger_config;
}

}  // namespace gemgame::core
