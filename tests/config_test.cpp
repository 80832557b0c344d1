#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace std::chrono_literals;

namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_dir = fs::temp_directory_path() / ("wheel-smoother-config-" + std::to_string(getpid()));
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    std::string path(const char* name) const {
        return (m_dir / name).string();
    }

    fs::path m_dir;
};

TEST(ConfigTest, EmptySourceGivesDefaults) {
    const auto config = parseConfigString("# nothing here\n");

    EXPECT_EQ(config.wheel.debounceTime, 50ms);
    EXPECT_EQ(config.wheel.hDebounceTime, 50ms);
    EXPECT_EQ(config.wheel.debounceTimeout, 300ms);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.file.empty());
    EXPECT_TRUE(config.device.path.empty());
    EXPECT_TRUE(config.device.nameFilter.empty());
}

TEST(ConfigTest, ValuesAreRead) {
    const auto config = parseConfigString("device {\n"
                                          "    path = /dev/input/event7\n"
                                          "    name_filter = Logitech\n"
                                          "}\n"
                                          "wheel {\n"
                                          "    debounce_time_ms = 80\n"
                                          "    h_debounce_time_ms = 120\n"
                                          "    debounce_timeout_ms = 250\n"
                                          "}\n"
                                          "logging {\n"
                                          "    level = debug\n"
                                          "}\n");

    EXPECT_EQ(config.device.path, "/dev/input/event7");
    EXPECT_EQ(config.device.nameFilter, "Logitech");
    EXPECT_EQ(config.wheel.debounceTime, 80ms);
    EXPECT_EQ(config.wheel.hDebounceTime, 120ms);
    EXPECT_EQ(config.wheel.debounceTimeout, 250ms);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigTest, ColonKeysWork) {
    const auto config = parseConfigString("wheel:debounce_timeout_ms = 500\n");

    EXPECT_EQ(config.wheel.debounceTimeout, 500ms);
    EXPECT_EQ(config.wheel.debounceTime, 50ms);
}

TEST(ConfigTest, UnknownKeyIsRejected) {
    EXPECT_THROW(parseConfigString("wheel {\n    speed = 3\n}\n"), std::runtime_error);
}

TEST(ConfigTest, NegativeDurationIsRejected) {
    EXPECT_THROW(parseConfigString("wheel {\n    debounce_time_ms = -5\n}\n"), std::runtime_error);
}

TEST(ConfigTest, ShippedDefaultsParseToDefaults) {
    const auto config = parseConfigString(defaultConfigText());

    EXPECT_EQ(config.wheel.debounceTime, 50ms);
    EXPECT_EQ(config.wheel.hDebounceTime, 50ms);
    EXPECT_EQ(config.wheel.debounceTimeout, 300ms);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    const auto config = loadConfig(path("absent.conf"));

    EXPECT_EQ(config.wheel.debounceTimeout, 300ms);
}

TEST_F(ConfigFileTest, LoadsFromDisk) {
    {
        std::ofstream file(path("smoother.conf"));
        file << "wheel {\n    h_debounce_time_ms = 70\n}\n";
    }

    const auto config = loadConfig(path("smoother.conf"));
    EXPECT_EQ(config.wheel.hDebounceTime, 70ms);
}

TEST_F(ConfigFileTest, CreateDefaultWritesOnce) {
    const auto target = path("created.conf");

    writeDefaultConfig(target);
    ASSERT_TRUE(fs::exists(target));
    EXPECT_EQ(loadConfig(target).wheel.debounceTime, 50ms);

    {
        std::ofstream file(target, std::ios::trunc);
        file << "wheel {\n    debounce_time_ms = 90\n}\n";
    }

    writeDefaultConfig(target);
    EXPECT_EQ(loadConfig(target).wheel.debounceTime, 90ms);
}
