/**
 * @file MappingParser.cpp
 * @brief Parser for tab-separated gamepad mapping definitions
 * @author Andrés Guerrero
 * @date 15-09-2025
 */

#include "MappingParser.h"

#include "../debug/InputLogger.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace padmap::input::mapping {
    MappingParser::MappingParser(debug::InputLogger* logger) noexcept
        : logger_(logger) {
    }

    std::optional<MappingTable> MappingParser::parse(const std::string_view text) {
        lastError_.clear();

        const auto lines = splitLines(text);
        if (lines.size() != EXPECTED_ROWS) {
            recordError("Incorrect number of rows (want " + std::to_string(EXPECTED_ROWS) +
                ", have " + std::to_string(lines.size()) + ")");
            return std::nullopt;
        }

        std::vector<Row> cells;
        cells.reserve(lines.size());
        for (std::size_t i = 0; i < lines.size(); ++i) {
            Row row = splitCells(lines[i]);
            if (row.size() != EXPECTED_COLUMNS) {
                recordError("Incorrect number of columns (want " + std::to_string(EXPECTED_COLUMNS) +
                    ", have " + std::to_string(row.size()) + "), line " + std::to_string(i));
                return std::nullopt;
            }
            cells.push_back(std::move(row));
        }

        MappingTable table;
        for (std::size_t p = 0; p < NUM_PLATFORMS; ++p) {
            const auto platform = static_cast<GamepadPlatform>(p);

            for (std::size_t t = 0; t < NUM_GAMEPAD_TYPES; ++t) {
                const auto type = static_cast<GamepadType>(t);
                const std::size_t column = columnFor(type, platform);

                GamepadMapping::AxisIndexArray axisIndices{};
                GamepadMapping::AxisRangeArray axisRanges{};
                GamepadMapping::ButtonIndexArray buttonIndices{};

                for (std::size_t i = 0; i < NUM_MAPPED_AXES; ++i) {
                    axisIndices[i] = parseIndexCell(cells[i][column]);
                }
                for (std::size_t i = 0; i < NUM_MAPPED_AXES; ++i) {
                    axisRanges[i] = axisRangeFromToken(cells[i + NUM_MAPPED_AXES][column]);
                }
                for (std::size_t i = 0; i < NUM_MAPPED_BUTTONS; ++i) {
                    buttonIndices[i] = parseIndexCell(cells[i + 2 * NUM_MAPPED_AXES][column]);
                }

                table.getMapping(platform, type) = GamepadMapping(
                    gamepadTypeToString(type), axisIndices, axisRanges, buttonIndices);
            }
        }

        if (logger_) {
            logger_->log(debug::LogLevel::DEBUG, debug::LogEntryType::MAPPING,
                         "Parsed mapping definition with " + std::to_string(table.countBindings()) + " bindings",
                         "Mapping");
        }

        return table;
    }

    std::optional<MappingTable> MappingParser::parseFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            recordError("Failed to open mapping file: " + path.string());
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            recordError("Failed to read mapping file: " + path.string());
            return std::nullopt;
        }

        const std::string text = buffer.str();
        auto table = parse(text);
        if (!table) {
            lastError_ = path.string() + ": " + lastError_;
        }
        return table;
    }

    RawIndex MappingParser::parseIndexCell(std::string_view cell) noexcept {
        while (!cell.empty() && std::isspace(static_cast<unsigned char>(cell.front()))) {
            cell.remove_prefix(1);
        }
        while (!cell.empty() && std::isspace(static_cast<unsigned char>(cell.back()))) {
            cell.remove_suffix(1);
        }
        if (!cell.empty() && cell.front() == '+') {
            cell.remove_prefix(1);
        }
        if (cell.empty()) {
            return UNMAPPED_INDEX;
        }

        RawIndex value = UNMAPPED_INDEX;
        const char* end = cell.data() + cell.size();
        const auto [ptr, ec] = std::from_chars(cell.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            return UNMAPPED_INDEX;
        }
        return value;
    }

    std::vector<std::string_view> MappingParser::splitLines(const std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (start <= text.size()) {
            const std::size_t end = text.find_first_of("\r\n", start);
            const std::size_t stop = end == std::string_view::npos ? text.size() : end;
            if (stop > start) {
                lines.push_back(text.substr(start, stop - start));
            }
            if (end == std::string_view::npos) {
                break;
            }
            start = end + 1;
        }
        return lines;
    }

    MappingParser::Row MappingParser::splitCells(const std::string_view line) {
        Row row;
        std::size_t start = 0;
        while (true) {
            const std::size_t tab = line.find('\t', start);
            if (tab == std::string_view::npos) {
                row.push_back(line.substr(start));
                break;
            }
            row.push_back(line.substr(start, tab - start));
            start = tab + 1;
        }
        return row;
    }

    void MappingParser::recordError(std::string message) {
        lastError_ = std::move(message);
        if (logger_) {
            logger_->log(debug::LogLevel::ERROR, debug::LogEntryType::MAPPING,
                         "Mapping definition rejected", "Mapping", lastError_);
        }
    }
} // namespace padmap::input::mapping
