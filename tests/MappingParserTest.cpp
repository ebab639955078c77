#include "DefinitionBuilder.h"

#include "input/debug/InputLogger.h"
#include "input/mapping/MappingParser.h"

#include <gtest/gtest.h>

#include <string>

using namespace padmap::input;
using padmap::input::mapping::MappingParser;
using padmap::input::test::DefinitionBuilder;

TEST(MappingParser, ExpectedShape) {
    EXPECT_EQ(MappingParser::EXPECTED_ROWS, 34u);
    EXPECT_EQ(MappingParser::EXPECTED_COLUMNS, 36u);
    EXPECT_EQ(MappingParser::columnFor(GamepadType::XBOX_360, GamepadPlatform::WINDOWS), 0u);
    EXPECT_EQ(MappingParser::columnFor(GamepadType::PS4, GamepadPlatform::LINUX), 17u);
    EXPECT_EQ(MappingParser::columnFor(GamepadType::SWITCH_JOYCON_R, GamepadPlatform::LINUX), 35u);
}

TEST(MappingParser, PlacesBindingsInTheirColumn) {
    const std::string definition = DefinitionBuilder()
        .axis(GamepadType::XBOX_ONE, GamepadPlatform::LINUX, GamepadAxis::LEFT_X, "3", "-1_1")
        .axis(GamepadType::XBOX_ONE, GamepadPlatform::LINUX, GamepadAxis::LEFT_Y, "4", "1_-1")
        .button(GamepadType::PS4, GamepadPlatform::WINDOWS, GamepadButton::SOUTH, "1")
        .button(GamepadType::PS4, GamepadPlatform::WINDOWS, GamepadButton::SPECIAL, "13")
        .build();

    MappingParser parser;
    const auto table = parser.parse(definition);
    ASSERT_TRUE(table.has_value()) << parser.getLastError();
    EXPECT_TRUE(parser.getLastError().empty());

    const auto& xbox = table->getMapping(GamepadPlatform::LINUX, GamepadType::XBOX_ONE);
    EXPECT_EQ(xbox.getName(), "XboxOne");
    EXPECT_EQ(xbox.getAxisIndex(GamepadAxis::LEFT_X), 3);
    EXPECT_EQ(xbox.getAxisRange(GamepadAxis::LEFT_X), AxisRange(-1.0f, 1.0f));
    EXPECT_EQ(xbox.getAxisIndex(GamepadAxis::LEFT_Y), 4);
    EXPECT_EQ(xbox.getAxisRange(GamepadAxis::LEFT_Y), AxisRange(1.0f, -1.0f));
    EXPECT_FALSE(xbox.hasAxis(GamepadAxis::RIGHT_X));

    const auto& ps4 = table->getMapping(GamepadPlatform::WINDOWS, GamepadType::PS4);
    EXPECT_EQ(ps4.getButtonIndex(GamepadButton::SOUTH), 1);
    EXPECT_EQ(ps4.getButtonIndex(GamepadButton::SPECIAL), 13);
    EXPECT_EQ(ps4.getButtonIndex(GamepadButton::EAST), UNMAPPED_INDEX);

    // Same family on another platform stays unmapped
    EXPECT_FALSE(table->getMapping(GamepadPlatform::WINDOWS, GamepadType::XBOX_ONE).hasAxis(GamepadAxis::LEFT_X));
    EXPECT_FALSE(table->getMapping(GamepadPlatform::LINUX, GamepadType::PS4).hasButton(GamepadButton::SOUTH));

    EXPECT_EQ(table->countBindings(), 4u);
}

TEST(MappingParser, NonIntegerCellsAreUnmapped) {
    EXPECT_EQ(MappingParser::parseIndexCell("7"), 7);
    EXPECT_EQ(MappingParser::parseIndexCell(" 7 "), 7);
    EXPECT_EQ(MappingParser::parseIndexCell("+2"), 2);
    EXPECT_EQ(MappingParser::parseIndexCell("-1"), -1);
    EXPECT_EQ(MappingParser::parseIndexCell(""), UNMAPPED_INDEX);
    EXPECT_EQ(MappingParser::parseIndexCell("-"), UNMAPPED_INDEX);
    EXPECT_EQ(MappingParser::parseIndexCell("abc"), UNMAPPED_INDEX);
    EXPECT_EQ(MappingParser::parseIndexCell("1.5"), UNMAPPED_INDEX);
    EXPECT_EQ(MappingParser::parseIndexCell("2x"), UNMAPPED_INDEX);
    EXPECT_EQ(MappingParser::parseIndexCell("99999999999"), UNMAPPED_INDEX);
}

TEST(MappingParser, UnknownRangeLeavesAxisUnmapped) {
    const std::string definition = DefinitionBuilder()
        .axis(GamepadType::PS5, GamepadPlatform::MACOS, GamepadAxis::RIGHT_TRIGGER, "6", "bogus")
        .build();

    MappingParser parser;
    const auto table = parser.parse(definition);
    ASSERT_TRUE(table.has_value());

    const auto& mapping = table->getMapping(GamepadPlatform::MACOS, GamepadType::PS5);
    EXPECT_EQ(mapping.getAxisIndex(GamepadAxis::RIGHT_TRIGGER), 6);
    EXPECT_FALSE(mapping.getAxisRange(GamepadAxis::RIGHT_TRIGGER).has_value());
    EXPECT_FALSE(mapping.hasAxis(GamepadAxis::RIGHT_TRIGGER));
}

TEST(MappingParser, RejectsMissingRow) {
    MappingParser parser;
    EXPECT_FALSE(parser.parse(DefinitionBuilder().removeRow(33).build()).has_value());
    EXPECT_EQ(parser.getLastError(), "Incorrect number of rows (want 34, have 33)");
}

TEST(MappingParser, RejectsExtraRow) {
    MappingParser parser;
    EXPECT_FALSE(parser.parse(DefinitionBuilder().appendRow().build()).has_value());
    EXPECT_EQ(parser.getLastError(), "Incorrect number of rows (want 34, have 35)");
}

TEST(MappingParser, RejectsShortRow) {
    MappingParser parser;
    EXPECT_FALSE(parser.parse(DefinitionBuilder().removeCell(5).build()).has_value());
    EXPECT_EQ(parser.getLastError(), "Incorrect number of columns (want 36, have 35), line 5");
}

TEST(MappingParser, AcceptsWindowsLineEndingsAndBlankLines) {
    const std::string definition = "\n\n" + DefinitionBuilder()
        .button(GamepadType::STEAM_CONTROLLER, GamepadPlatform::LINUX, GamepadButton::START, "9")
        .build("\r\n") + "\r\n";

    MappingParser parser;
    const auto table = parser.parse(definition);
    ASSERT_TRUE(table.has_value()) << parser.getLastError();
    EXPECT_EQ(table->getMapping(GamepadPlatform::LINUX, GamepadType::STEAM_CONTROLLER)
              .getButtonIndex(GamepadButton::START), 9);
}

TEST(MappingParser, MissingFileReportsPath) {
    MappingParser parser;
    EXPECT_FALSE(parser.parseFile("does/not/exist.tsv").has_value());
    EXPECT_NE(parser.getLastError().find("does/not/exist.tsv"), std::string::npos);
}

TEST(MappingParser, ShippedDefinitionParses) {
    MappingParser parser;
    const auto table = parser.parseFile(std::string(PADMAP_DATA_DIR) + "/gamepad_mappings.tsv");
    ASSERT_TRUE(table.has_value()) << parser.getLastError();

    const auto& xbox = table->getMapping(GamepadPlatform::LINUX, GamepadType::XBOX_360);
    EXPECT_TRUE(xbox.hasButton(GamepadButton::SOUTH));
    EXPECT_TRUE(xbox.hasAxis(GamepadAxis::LEFT_X));
    EXPECT_GT(table->countBindings(), 0u);
}

TEST(MappingParser, ReportsErrorsToLogger) {
    debug::LoggerConfig config;
    config.logToConsole = false;
    config.logToMemory = true;
    config.minLevel = debug::LogLevel::DEBUG;

    debug::InputLogger logger;
    ASSERT_TRUE(logger.initialize(config));

    MappingParser parser(&logger);
    EXPECT_FALSE(parser.parse(DefinitionBuilder().removeRow(0).build()).has_value());

    const auto entries = logger.getMemoryLog();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, debug::LogLevel::ERROR);
    EXPECT_EQ(entries[0].category, "Mapping");
    EXPECT_EQ(entries[0].details, parser.getLastError());
}
