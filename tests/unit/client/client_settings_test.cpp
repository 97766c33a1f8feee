// GemGame Client Tests
// client_settings_test.cpp - Client options and client id unit tests

#include <gtest/gtest.h>
#include <gemgame/client/client_settings.hpp>
#include <gemgame/platform/file_io.hpp>

#include <string>

using namespace gemgame::client;
using gemgame::core::Config;
using gemgame::platform::FileSystem;

class ClientSettingsTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() /
                    (std::string("client_settings_") +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
        FileSystem::remove_all(test_dir_);
        FileSystem::create_directories(test_dir_);
    }

    void TearDown() override {
        FileSystem::remove_all(test_dir_);
    }
};

TEST_F(ClientSettingsTest, ReadsClientSection) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({
        "client": { "host": "game.example", "port": 6000, "move_duration": 0.5 }
    })"));

    const ClientSettings settings = ClientSettings::from_config(config);
    EXPECT_EQ(settings.host, "game.example");
    EXPECT_EQ(settings.port, 6000);
    EXPECT_FLOAT_EQ(settings.move_duration, 0.5f);
    EXPECT_FLOAT_EQ(settings.remote_move_duration, 0.2f);
}

TEST_F(ClientSettingsTest, InvalidPortFallsBackToDefault) {
    Config config;
    config.set_int(gemgame::core::config_section::CLIENT, gemgame::core::config_key::PORT, 0);

    EXPECT_EQ(ClientSettings::from_config(config).port, gemgame::core::DEFAULT_PORT);
}

TEST_F(ClientSettingsTest, ClientIdIsCreatedOnceAndReused) {
    const auto path = test_dir_ / "client_id";

    auto first = load_or_create_client_id(path);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(FileSystem::exists(path));

    auto second = load_or_create_client_id(path);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST_F(ClientSettingsTest, UnreadableClientIdIsReplaced) {
    const auto path = test_dir_ / "client_id";
    ASSERT_TRUE(FileSystem::write_text(path, "not an id"));

    auto id = load_or_create_client_id(path);
    ASSERT_TRUE(id.has_value());

    auto text = FileSystem::read_text(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, id->to_string());
}
