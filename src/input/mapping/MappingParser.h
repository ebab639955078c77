/**
 * @file MappingParser.h
 * @brief Parser for tab-separated gamepad mapping definitions
 * @author Andrés Guerrero
 * @date 15-09-2025
 *
 * Definition layout, one row per line and one column per tab:
 * - NUM_MAPPED_AXES rows of raw axis indices
 * - NUM_MAPPED_AXES rows of axis range encodings ("-1_1", "1_0", ...)
 * - NUM_MAPPED_BUTTONS rows of raw button indices
 * Column c holds controller family c / NUM_PLATFORMS on platform
 * c % NUM_PLATFORMS. Cells that are not integers mean "unmapped".
 */

#pragma once

#include "GamepadMapping.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace padmap::input::debug {
    class InputLogger;
}

namespace padmap::input::mapping {
    /**
     * @brief Converts mapping definitions into MappingTable instances
     *
     * Shape errors abort the parse and no table is produced. The error is kept
     * for getLastError() and reported to the logger when one is attached.
     */
    class MappingParser {
    public:
        static constexpr std::size_t EXPECTED_ROWS = 2 * NUM_MAPPED_AXES + NUM_MAPPED_BUTTONS;
        static constexpr std::size_t EXPECTED_COLUMNS = NUM_GAMEPAD_TYPES * NUM_PLATFORMS;

        /**
         * @brief Constructor
         * @param logger Optional logger for parse diagnostics
         */
        explicit MappingParser(debug::InputLogger* logger = nullptr) noexcept;

        /**
         * @brief Parse a definition held in memory
         * @param text Tab-separated definition
         * @return Table, or nullopt on a shape error
         */
        [[nodiscard]] std::optional<MappingTable> parse(std::string_view text);

        /**
         * @brief Read and parse a definition file
         * @param path File path
         * @return Table, or nullopt when unreadable or malformed
         */
        [[nodiscard]] std::optional<MappingTable> parseFile(const std::filesystem::path& path);

        /**
         * @brief Get the error of the last failed parse, empty after success
         */
        [[nodiscard]] const std::string& getLastError() const noexcept { return lastError_; }

        /**
         * @brief Column holding a family/platform pair
         */
        [[nodiscard]] static constexpr std::size_t columnFor(const GamepadType type,
                                                             const GamepadPlatform platform) noexcept {
            return toIndex(type) * NUM_PLATFORMS + toIndex(platform);
        }

        /**
         * @brief Parse a raw index cell
         * @return Integer value, or UNMAPPED_INDEX when the cell is not an integer
         */
        [[nodiscard]] static RawIndex parseIndexCell(std::string_view cell) noexcept;

    private:
        using Row = std::vector<std::string_view>;

        debug::InputLogger* logger_;
        std::string lastError_;

        [[nodiscard]] static std::vector<std::string_view> splitLines(std::string_view text);
        [[nodiscard]] static Row splitCells(std::string_view line);

        void recordError(std::string message);
    };
} // namespace padmap::input::mapping
