#include "huddle/core/application.hpp"
#include "huddle/core/event_bus.hpp"
#include "huddle/core/events.hpp"
#include "huddle/utils/yaml_config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

using namespace std::chrono_literals;
using namespace huddle::core;
using huddle::utils::YamlConfigHelper;

namespace {

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("huddle-test-" + std::to_string(rd()) + "-" + std::to_string(s_counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    static inline std::atomic<int> s_counter{0};
    std::filesystem::path m_path;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

}

TEST(YamlConfigTest, ParsesDurationsAndVoiceSettings) {
    auto node = YAML::Load(R"(
log_level: debug
presence:
  grace_period: 10s
  idle_timeout: 2m
  agent_inactivity_timeout: 750ms
voice:
  stun_urls: ["stun:a.example.org", "stun:b.example.org"]
  turn_url: turn:relay.example.org
  turn_username: user
  turn_credential: pass
timers:
  worker_threads: 4
)");

    auto config = YamlConfigHelper::from_yaml(node);

    EXPECT_EQ(config.log_level, huddle::utils::LogLevel::Debug);
    EXPECT_EQ(config.presence.grace_period, 10s);
    EXPECT_EQ(config.presence.idle_timeout, 2min);
    EXPECT_EQ(config.presence.agent_inactivity_timeout, 750ms);
    EXPECT_EQ(config.voice.stun_urls.size(), 2u);
    EXPECT_EQ(config.voice.turn_url, "turn:relay.example.org");
    EXPECT_EQ(config.voice.turn_username, "user");
    EXPECT_EQ(config.timers.worker_threads, 4u);
}

TEST(YamlConfigTest, MissingKeysKeepDefaults) {
    auto config = YamlConfigHelper::from_yaml(YAML::Load("presence:\n  grace_period: 45\n"));

    EXPECT_EQ(config.presence.grace_period, 45s);
    EXPECT_EQ(config.presence.idle_timeout, PresenceConfig{}.idle_timeout);
    EXPECT_EQ(config.voice, VoiceConfig{});
    EXPECT_EQ(config.log_level, huddle::utils::LogLevel::Info);
}

TEST(YamlConfigTest, EmptyStunListDisablesStun) {
    auto config = YamlConfigHelper::from_yaml(YAML::Load("voice:\n  stun_urls: []\n"));
    EXPECT_TRUE(config.voice.stun_urls.empty());
}

TEST(YamlConfigTest, BadDurationThrowsYamlException) {
    EXPECT_THROW(YamlConfigHelper::from_yaml(YAML::Load("presence:\n  idle_timeout: soon\n")),
                 YAML::Exception);
}

TEST(YamlConfigTest, OversizedDurationThrowsYamlException) {
    EXPECT_THROW(YamlConfigHelper::from_yaml(YAML::Load("presence:\n  idle_timeout: 3000000h\n")),
                 YAML::Exception);
}

TEST(YamlConfigTest, SaveThenLoadPreservesValues) {
    TempDir dir;
    const auto path = dir.path() / "nested" / "config.yaml";

    ApplicationConfig config;
    config.presence.grace_period = 1500ms;
    config.presence.idle_timeout = 10min;
    config.voice.stun_urls = {"stun:stun.example.org:3478"};
    config.voice.turn_url = "turns:turn.example.org:5349";
    config.voice.turn_username = "huddle";
    config.voice.turn_credential = "secret";
    config.timers.worker_threads = 3;
    config.log_level = huddle::utils::LogLevel::Warning;
    config.log_file = "/tmp/huddle.log";

    ASSERT_TRUE(YamlConfigHelper::save_to_file(config, path).has_value());

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->presence, config.presence);
    EXPECT_EQ(loaded->voice, config.voice);
    EXPECT_EQ(loaded->timers, config.timers);
    EXPECT_EQ(loaded->log_level, config.log_level);
    EXPECT_EQ(loaded->log_file, config.log_file);
}

TEST(YamlConfigTest, LoadReportsMissingAndMalformedFiles) {
    TempDir dir;

    auto missing = YamlConfigHelper::load_from_file(dir.path() / "absent.yaml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ConfigError::FileNotFound);

    const auto broken = dir.path() / "broken.yaml";
    write_file(broken, "presence: [unclosed\n");
    auto malformed = YamlConfigHelper::load_from_file(broken);
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error(), ConfigError::InvalidFormat);
}

TEST(ConfigManagerTest, FirstLoadWritesDocumentedDefaults) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";
    ConfigManager manager(path);

    ASSERT_TRUE(manager.load().has_value());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(manager.get().presence, PresenceConfig{});

    std::ifstream in(path);
    std::string first_line;
    std::getline(in, first_line);
    EXPECT_EQ(first_line.rfind("#", 0), 0u);

    // The documented file parses back to the same configuration
    ConfigManager reloaded(path);
    ASSERT_TRUE(reloaded.load().has_value());
    EXPECT_EQ(reloaded.get().presence, PresenceConfig{});
    EXPECT_EQ(reloaded.get().voice, VoiceConfig{});
}

TEST(ConfigManagerTest, InvalidFileFailsValidation) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";
    write_file(path, "timers:\n  worker_threads: 0\n");

    auto bus = std::make_shared<EventBus>();
    huddle::testing::EventRecorder<events::ConfigurationError> errors(bus);

    ConfigManager manager(path);
    manager.set_event_bus(bus);

    auto result = manager.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ConfigError::ValidationError);
    EXPECT_EQ(errors.size(), 1u);
}

TEST(ConfigManagerTest, UpdatePersistsAndPublishes) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";

    auto bus = std::make_shared<EventBus>();
    huddle::testing::EventRecorder<events::ConfigurationUpdated> updates(bus);

    ConfigManager manager(path);
    manager.set_event_bus(bus);
    ASSERT_TRUE(manager.load().has_value());

    auto config = manager.get();
    config.presence.idle_timeout = 2min;
    ASSERT_TRUE(manager.update(config).has_value());

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates.events()[0].previous_config.presence.idle_timeout, PresenceConfig{}.idle_timeout);
    EXPECT_EQ(updates.events()[0].new_config.presence.idle_timeout, 2min);

    ConfigManager reloaded(path);
    ASSERT_TRUE(reloaded.load().has_value());
    EXPECT_EQ(reloaded.get().presence.idle_timeout, 2min);
}

TEST(ConfigManagerTest, UpdateRejectsInvalidConfiguration) {
    TempDir dir;
    ConfigManager manager(dir.path() / "config.yaml");
    ASSERT_TRUE(manager.load().has_value());

    auto config = manager.get();
    config.presence.grace_period = 0ms;

    auto result = manager.update(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ConfigError::ValidationError);
    EXPECT_EQ(manager.get().presence.grace_period, PresenceConfig{}.grace_period);
}
