// GemGame Server
// server_main.cpp - Dedicated server entry point

#include <gemgame/core/config.hpp>
#include <gemgame/core/logger.hpp>
#include <gemgame/net/net_error.hpp>
#include <gemgame/net/net_server.hpp>
#include <gemgame/platform/timer.hpp>
#include <gemgame/server/broadcast.hpp>
#include <gemgame/server/server_settings.hpp>
#include <gemgame/server/world_state.hpp>
#include <gemgame/world/terrain_generator.hpp>
#include <gemgame/world/world_store.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_CONFIG_PATH = "server.json";

// Seconds between writes of changed chunks
constexpr double AUTOSAVE_INTERVAL = 30.0;

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace gemgame;

    const std::filesystem::path config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    core::Config config;
    const bool config_loaded = config.load_or_create_default(config_path);
    core::Logger::initialize(core::make_logger_config(config));
    if (!config_loaded) {
        GEMGAME_LOG_WARN(core::log_category::CONFIG, "Using default configuration, {} could not be read",
                         config_path.string());
    }

    GEMGAME_LOG_INFO(core::log_category::SERVER, "GemGame server {}", VERSION);

    const server::ServerSettings settings = server::ServerSettings::from_config(config);

    world::TerrainConfig terrain;
    terrain.seed = settings.seed;

    auto store = std::make_shared<world::FileWorldStore>(settings.world_directory);
    auto generator = std::make_shared<const world::TerrainGenerator>(terrain);
    server::BroadcastChannel channel;
    server::WorldState world_state(store, generator, channel);

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    int exit_code = 0;
    try {
        net::NetServerConfig net_config;
        net_config.port = settings.port;
        net_config.max_clients = settings.max_clients;
        net_config.session = settings.session_config();

        net::NetServer net_server(world_state, channel, net_config);
        net_server.start();

        platform::TickClock clock(settings.tick_rate);
        platform::Stopwatch since_save;
        while (!g_stop_requested.load()) {
            (void)clock.tick();
            if (since_save.elapsed_seconds() >= AUTOSAVE_INTERVAL) {
                world_state.flush_dirty_chunks();
                since_save.reset();
            }
            clock.sleep_until_next_tick();
        }

        GEMGAME_LOG_INFO(core::log_category::SERVER, "Shutting down");
        net_server.stop();
    } catch (const net::NetworkError& e) {
        GEMGAME_LOG_CRITICAL(core::log_category::NETWORK, "{}", e.what());
        exit_code = 1;
    }

    world_state.save_all();
    core::Logger::shutdown();
    return exit_code;
}
