// GemGame Server
// server_settings.hpp - Server options read from the configuration

#pragma once

#include "session.hpp"

#include <gemgame/core/config.hpp>

#include <cstdint>
#include <filesystem>

namespace gemgame::server {

struct ServerSettings {
    uint16_t port = core::DEFAULT_PORT;
    size_t max_clients = 32;
    std::filesystem::path world_directory = "world";
    uint32_t seed = 1;
    int32_t view_distance = 3;
    // Server loop iterations per second
    int tick_rate = 60;

    // Out-of-range values are clamped with a warning
    [[nodiscard]] static ServerSettings from_config(const core::Config& config);

    [[nodiscard]] SessionConfig session_config() const { return SessionConfig{view_distance}; }
};

}  // namespace gemgame::server
