// GemGame Server
// server_settings.cpp - Server options from the configuration

#include <gemgame/core/logger.hpp>
#include <gemgame/server/server_settings.hpp>

#include <algorithm>

namespace gemgame::server {

namespace {

int clamped(int value, int low, int high, const char* key) {
    const int result = std::clamp(value, low, high);
    if (result != value) {
        GEMGAME_LOG_WARN(core::log_category::CONFIG, "server.{} = {} out of range, using {}", key, value, result);
    }
    return result;
}

}  // namespace

ServerSettings ServerSettings::from_config(const core::Config& config) {
    using namespace core::config_key;
    const char* section = core::config_section::SERVER;
    const ServerSettings defaults;

    ServerSettings settings;
    settings.port = static_cast<uint16_t>(clamped(config.get_int(section, PORT, defaults.port), 1, 65535, PORT));
    settings.max_clients = static_cast<size_t>(
        clamped(config.get_int(section, MAX_CLIENTS, static_cast<int>(defaults.max_clients)), 1, 4095, MAX_CLIENTS));
    settings.world_directory = config.get_string(section, WORLD_DIRECTORY, defaults.world_directory.string());
    settings.seed = static_cast<uint32_t>(config.get_int64(section, SEED, defaults.seed));
    settings.view_distance = clamped(config.get_int(section, VIEW_DISTANCE, defaults.view_distance), 1, 32,
                                     VIEW_DISTANCE);
    settings.tick_rate = clamped(config.get_int(section, TICK_RATE, defaults.tick_rate), 1, 1000, TICK_RATE);
    return settings;
}

}  // namespace gemgame::server
