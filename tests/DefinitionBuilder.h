/**
 * @file DefinitionBuilder.h
 * @brief Builds tab-separated mapping definitions for tests
 */

#pragma once

#include "input/mapping/MappingParser.h"

#include <string>
#include <vector>

namespace padmap::input::test {
    /**
     * @brief Definition with every cell unmapped until set
     */
    class DefinitionBuilder {
    public:
        using Parser = mapping::MappingParser;

        DefinitionBuilder()
            : rows_(Parser::EXPECTED_ROWS, std::vector<std::string>(Parser::EXPECTED_COLUMNS, "-")) {
        }

        DefinitionBuilder& axis(const GamepadType type, const GamepadPlatform platform, const GamepadAxis axis,
                                const std::string& index, const std::string& range) {
            const auto column = Parser::columnFor(type, platform);
            rows_[toIndex(axis)][column] = index;
            rows_[NUM_MAPPED_AXES + toIndex(axis)][column] = range;
            return *this;
        }

        DefinitionBuilder& button(const GamepadType type, const GamepadPlatform platform,
                                  const GamepadButton button, const std::string& index) {
            rows_[2 * NUM_MAPPED_AXES + toIndex(button)][Parser::columnFor(type, platform)] = index;
            return *this;
        }

        DefinitionBuilder& removeRow(const std::size_t row) {
            rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(row));
            return *this;
        }

        DefinitionBuilder& appendRow() {
            rows_.emplace_back(Parser::EXPECTED_COLUMNS, "-");
            return *this;
        }

        DefinitionBuilder& removeCell(const std::size_t row) {
            rows_[row].pop_back();
            return *this;
        }

        [[nodiscard]] std::string build(const std::string& newline = "\n") const {
            std::string text;
            for (const auto& row : rows_) {
                for (std::size_t i = 0; i < row.size(); ++i) {
                    if (i > 0) text += '\t';
                    text += row[i];
                }
                text += newline;
            }
            return text;
        }

    private:
        std::vector<std::vector<std::string>> rows_;
    };
} // namespace padmap::input::test
