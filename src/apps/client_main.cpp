// GemGame Client
// client_main.cpp - Headless client that wanders the world

#include <gemgame/client/client_settings.hpp>
#include <gemgame/client/game_client.hpp>
#include <gemgame/core/config.hpp>
#include <gemgame/core/logger.hpp>
#include <gemgame/net/client_connection.hpp>
#include <gemgame/net/net_error.hpp>
#include <gemgame/platform/timer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <random>
#include <thread>

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_CONFIG_PATH = "client.json";

constexpr double FRAME_RATE = 60.0;
constexpr auto CONNECT_TIMEOUT = std::chrono::milliseconds(5000);
constexpr auto RECONNECT_DELAY = std::chrono::seconds(3);

// Chance per frame of picking a new direction
constexpr float TURN_CHANCE = 0.05f;

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

// Plays until stopped or the connection fails
void play(gemgame::net::ClientConnection& connection, const gemgame::client::ClientSettings& settings,
          const gemgame::protocol::to_client::Welcome& welcome) {
    using namespace gemgame;

    client::GameClient game(connection, welcome, settings.move_duration, settings.remote_move_duration);

    std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<float> chance(0.0f, 1.0f);
    std::uniform_int_distribution<int> pick_direction(0, 3);
    auto direction = static_cast<world::Direction>(pick_direction(rng));

    platform::TickClock clock(FRAME_RATE);
    while (!g_stop_requested.load()) {
        const float delta = clock.tick();
        if (chance(rng) < TURN_CHANCE) {
            direction = static_cast<world::Direction>(pick_direction(rng));
        }
        game.update(delta, direction);
        clock.sleep_until_next_tick();
    }
    connection.disconnect();
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

    GEMGAME_LOG_INFO(core::log_category::CLIENT, "GemGame client {}", VERSION);

    const client::ClientSettings settings = client::ClientSettings::from_config(config);
    const auto client_id = client::load_or_create_client_id(settings.client_id_file);
    if (!client_id) {
        core::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    while (!g_stop_requested.load()) {
        try {
            net::ClientConnection connection(settings.host, settings.port, CONNECT_TIMEOUT);
            auto welcome = client::perform_handshake(connection, *client_id, CONNECT_TIMEOUT);
            if (welcome) {
                play(connection, settings, *welcome);
            } else {
                connection.disconnect();
            }
        } catch (const net::NetworkError& e) {
            GEMGAME_LOG_ERROR(core::log_category::NETWORK, "{}", e.what());
        }

        if (!g_stop_requested.load()) {
            GEMGAME_LOG_INFO(core::log_category::CLIENT, "Reconnecting in {} s", RECONNECT_DELAY.count());
            std::this_thread::sleep_for(RECONNECT_DELAY);
        }
    }

    core::Logger::shutdown();
    return 0;
}
