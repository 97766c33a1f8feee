// GemGame Client
// client_settings.cpp - Client options and the persistent client id

#include <gemgame/client/client_settings.hpp>
#include <gemgame/core/logger.hpp>
#include <gemgame/platform/file_io.hpp>

#include <algorithm>

namespace gemgame::client {

ClientSettings ClientSettings::from_config(const core::Config& config) {
    using namespace core::config_key;
    const char* section = core::config_section::CLIENT;
    const ClientSettings defaults;

    ClientSettings settings;
    settings.host = config.get_string(section, HOST, defaults.host);

    const int port = config.get_int(section, PORT, defaults.port);
    if (port < 1 || port > 65535) {
        GEMGAME_LOG_WARN(core::log_category::CONFIG, "client.port = {} out of range, using {}", port, defaults.port);
        settings.port = defaults.port;
    } else {
        settings.port = static_cast<uint16_t>(port);
    }

    settings.client_id_file = config.get_string(section, CLIENT_ID_FILE, defaults.client_id_file.string());
    settings.move_duration = std::max(0.0f, config.get_float(section, MOVE_DURATION, defaults.move_duration));
    settings.remote_move_duration =
        std::max(0.0f, config.get_float(section, REMOTE_MOVE_DURATION, defaults.remote_move_duration));
    return settings;
}

std::optional<world::ClientId> load_or_create_client_id(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        if (auto text = platform::FileSystem::read_text(path)) {
            if (auto id = world::ClientId::from_string(*text)) {
                return id;
            }
        }
        GEMGAME_LOG_WARN(core::log_category::CLIENT, "Client id file {} is unreadable, generating a new id",
                         path.string());
    }

    const world::ClientId id = world::ClientId::generate();
    if (!platform::FileSystem::write_text(path, id.to_string())) {
        GEMGAME_LOG_ERROR(core::log_category::CLIENT, "Failed to save client id to {}", path.string());
        return std::nullopt;
    }
    GEMGAME_LOG_INFO(core::log_category::CLIENT, "Generated client id {}", id.to_string());
    return id;
}

}  // namespace gemgame::client
