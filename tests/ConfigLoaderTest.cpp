#include "input/utils/ConfigLoader.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace padmap::input;
using padmap::input::utils::ConfigLoader;
using padmap::input::utils::PadmapConfig;

TEST(ConfigLoader, EmptyObjectKeepsDefaults) {
    ConfigLoader loader;
    const auto config = loader.loadFromString("{}");
    ASSERT_TRUE(config.has_value()) << loader.getLastError();

    EXPECT_EQ(config->platform, nativePlatform());
    EXPECT_EQ(config->mappingsFile, "data/gamepad_mappings.tsv");
    EXPECT_FLOAT_EQ(config->pressThreshold, DEFAULT_AXIS_PRESS_THRESHOLD);
    ASSERT_EQ(config->devices.size(), 1u);
    EXPECT_EQ(config->devices[0].id, 1);
    EXPECT_EQ(config->logging.level, debug::LogLevel::INFO);
    EXPECT_EQ(config->logging.format, debug::LogFormat::TEXT);
    EXPECT_EQ(config->sample.button, GamepadButton::SOUTH);
    EXPECT_FALSE(loader.hasErrors());
}

TEST(ConfigLoader, ReadsEveryKey) {
    const std::string json = R"({
        "platform": "Windows",
        "mappingsFile": "custom.tsv",
        "pressThreshold": 0.5,
        "devices": [ { "id": 2, "type": "PS5" }, { "id": 4, "type": "SwitchPro" } ],
        "logging": { "level": "VERBOSE", "format": "CSV", "console": false, "file": true, "filePath": "out.log",
                     "timestamps": false, "frameNumbers": false, "flushEachEntry": true },
        "sample": { "button": "LeftStick_Up", "axis": "RightTrigger", "stick": "DPad",
                    "frames": 120, "frameDelayMs": 8 }
    })";

    ConfigLoader loader;
    const auto config = loader.loadFromString(json);
    ASSERT_TRUE(config.has_value()) << loader.getLastError();

    EXPECT_EQ(config->platform, GamepadPlatform::WINDOWS);
    EXPECT_EQ(config->mappingsFile, "custom.tsv");
    EXPECT_FLOAT_EQ(config->pressThreshold, 0.5f);
    ASSERT_EQ(config->devices.size(), 2u);
    EXPECT_EQ(config->devices[0].id, 2);
    EXPECT_EQ(config->devices[0].type, GamepadType::PS5);
    EXPECT_EQ(config->devices[1].type, GamepadType::SWITCH_PRO);
    EXPECT_EQ(config->logging.level, debug::LogLevel::VERBOSE);
    EXPECT_FALSE(config->logging.console);
    EXPECT_TRUE(config->logging.file);
    EXPECT_EQ(config->logging.filePath, "out.log");
    EXPECT_EQ(config->sample.button, GamepadButton::LEFT_STICK_UP);
    EXPECT_EQ(config->sample.axis, GamepadAxis::RIGHT_TRIGGER);
    EXPECT_EQ(config->sample.stick, GamepadStick::DPAD);
    EXPECT_EQ(config->sample.frames, 120u);
    EXPECT_EQ(config->sample.frameDelayMs, 8u);

    const auto logger = config->toLoggerConfig();
    EXPECT_EQ(logger.minLevel, debug::LogLevel::VERBOSE);
    EXPECT_FALSE(logger.logToConsole);
    EXPECT_TRUE(logger.logToFile);
    EXPECT_EQ(logger.logFilePath, "out.log");
    EXPECT_EQ(logger.format, debug::LogFormat::CSV);
    EXPECT_FALSE(logger.includeTimestamp);
    EXPECT_FALSE(logger.includeFrameNumber);
    EXPECT_TRUE(logger.flushImmediately);
}

TEST(ConfigLoader, UnknownEnumNameIsAnError) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.loadFromString(R"({ "devices": [ { "id": 1, "type": "Dreamcast" } ] })").has_value());
    EXPECT_NE(loader.getLastError().find("Dreamcast"), std::string::npos);

    EXPECT_FALSE(loader.loadFromString(R"({ "platform": "Amiga" })").has_value());
    EXPECT_FALSE(loader.loadFromString(R"({ "logging": { "level": "LOUD" } })").has_value());
    EXPECT_FALSE(loader.loadFromString(R"({ "logging": { "format": "XML" } })").has_value());
    EXPECT_NE(loader.getLastError().find("format"), std::string::npos);
    EXPECT_EQ(loader.getErrors().size(), 4u);
}

TEST(ConfigLoader, RejectsInvalidValues) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.loadFromString(R"({ "devices": [ { "id": 5 } ] })").has_value());
    EXPECT_FALSE(loader.loadFromString(R"({ "pressThreshold": 0 })").has_value());
    EXPECT_FALSE(loader.loadFromString(R"({ "pressThreshold": "high" })").has_value());
    EXPECT_FALSE(loader.loadFromString("[1, 2]").has_value());
    EXPECT_FALSE(loader.loadFromString("{ not json").has_value());
    EXPECT_EQ(loader.getErrors().size(), 5u);

    loader.clearErrors();
    EXPECT_FALSE(loader.hasErrors());
    EXPECT_TRUE(loader.getLastError().empty());
}

TEST(ConfigLoader, SaveAndReload) {
    const auto path = std::filesystem::temp_directory_path() / "padmap_config_test.json";
    std::filesystem::remove(path);

    PadmapConfig config;
    config.platform = GamepadPlatform::MACOS;
    config.pressThreshold = 0.25f;
    config.devices = {{3, GamepadType::XBOX_SERIES}};
    config.logging.level = debug::LogLevel::WARNING;
    config.logging.format = debug::LogFormat::JSON;
    config.logging.frameNumbers = false;
    config.sample.stick = GamepadStick::RIGHT_STICK;

    ConfigLoader loader;
    ASSERT_TRUE(loader.saveToFile(config, path, false));

    const auto loaded = loader.loadFromFile(path);
    ASSERT_TRUE(loaded.has_value()) << loader.getLastError();
    EXPECT_EQ(loaded->platform, GamepadPlatform::MACOS);
    EXPECT_FLOAT_EQ(loaded->pressThreshold, 0.25f);
    ASSERT_EQ(loaded->devices.size(), 1u);
    EXPECT_EQ(loaded->devices[0].id, 3);
    EXPECT_EQ(loaded->devices[0].type, GamepadType::XBOX_SERIES);
    EXPECT_EQ(loaded->logging.level, debug::LogLevel::WARNING);
    EXPECT_EQ(loaded->logging.format, debug::LogFormat::JSON);
    EXPECT_FALSE(loaded->logging.frameNumbers);
    EXPECT_TRUE(loaded->logging.timestamps);
    EXPECT_EQ(loaded->sample.stick, GamepadStick::RIGHT_STICK);

    // A second save keeps the previous file as a backup
    ASSERT_TRUE(loader.saveToFile(config, path));
    auto backup = path;
    backup += ".backup";
    EXPECT_TRUE(std::filesystem::exists(backup));

    std::filesystem::remove(path);
    std::filesystem::remove(backup);
}

TEST(ConfigLoader, MissingFileIsAnError) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.loadFromFile("no/such/config.json").has_value());
    EXPECT_NE(loader.getLastError().find("no/such/config.json"), std::string::npos);
}
