// GemGame Client
// client_settings.hpp - Client options read from the configuration

#pragma once

#include <gemgame/core/config.hpp>
#include <gemgame/world/id.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gemgame::client {

struct ClientSettings {
    std::string host = "127.0.0.1";
    uint16_t port = core::DEFAULT_PORT;
    std::filesystem::path client_id_file = "client_id";
    // Seconds one step takes on screen
    float move_duration = 0.2f;
    float remote_move_duration = 0.2f;

    [[nodiscard]] static ClientSettings from_config(const core::Config& config);
};

/// Reads the persistent client id from the file, or generates one and writes
/// it. nullopt only when a new id cannot be saved.
[[nodiscard]] std::optional<world::ClientId> load_or_create_client_id(const std::filesystem::path& path);

}  // namespace gemgame::client
