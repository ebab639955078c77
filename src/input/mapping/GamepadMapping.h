/**
 * @file GamepadMapping.h
 * @brief Raw-to-logical mapping tables for gamepad layouts
 * @author Andrés Guerrero
 * @date 15-09-2025
 *
 * A GamepadMapping translates one controller family on one platform.
 * PlatformMappings groups every family for a platform and MappingTable
 * groups every platform. Tables are built once and never mutated while
 * installed; a reload builds a new table.
 */

#pragma once

#include "../core/InputConstants.h"

#include "../../math/core/MathTypes.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace padmap::input {
    /**
     * @brief Native range of a raw axis
     * min is the raw value that maps to the canonical start, max to the
     * canonical end. Inverted axes have min > max.
     */
    using AxisRange = math::Range;

    /**
     * @brief Look up an axis range encoding such as "-1_1" (from -1 to 1)
     * @param token Encoding, surrounding whitespace ignored
     * @return Range, or nullopt for unrecognized encodings
     */
    [[nodiscard]] std::optional<AxisRange> axisRangeFromToken(std::string_view token) noexcept;

    /**
     * @brief Get the encoding of a range, "invalid" when absent
     */
    [[nodiscard]] std::string axisRangeToToken(const std::optional<AxisRange>& range);

    /**
     * @brief Canonical output range of a logical axis
     * [-1, 1] for sticks and d-pad, [0, 1] for triggers.
     */
    [[nodiscard]] constexpr AxisRange canonicalRange(const GamepadAxis axis) noexcept {
        return isTriggerAxis(axis) ? AxisRange(0.0f, 1.0f) : AxisRange(-1.0f, 1.0f);
    }

    /**
     * @brief Mapping of one controller family on one platform
     */
    class GamepadMapping {
    public:
        using AxisIndexArray = std::array<RawIndex, NUM_MAPPED_AXES>;
        using AxisRangeArray = std::array<std::optional<AxisRange>, NUM_MAPPED_AXES>;
        using ButtonIndexArray = std::array<RawIndex, NUM_MAPPED_BUTTONS>;

        /**
         * @brief Construct with everything unmapped
         */
        GamepadMapping() noexcept;

        GamepadMapping(std::string name,
                       const AxisIndexArray& axisIndices,
                       const AxisRangeArray& axisRanges,
                       const ButtonIndexArray& buttonIndices);

        [[nodiscard]] const std::string& getName() const noexcept { return name_; }

        /**
         * @brief Get raw button index
         * @return Raw index, or UNMAPPED_INDEX for unmapped and synthetic buttons
         */
        [[nodiscard]] RawIndex getButtonIndex(GamepadButton button) const noexcept;

        /**
         * @brief Get raw axis index
         * @return Raw index, or UNMAPPED_INDEX
         */
        [[nodiscard]] RawIndex getAxisIndex(GamepadAxis axis) const noexcept;

        /**
         * @brief Get native range of a raw axis
         * @return Range, or nullopt when the encoding was not recognized
         */
        [[nodiscard]] std::optional<AxisRange> getAxisRange(GamepadAxis axis) const noexcept;

        /**
         * @brief Check if a button reads straight from a valid raw button
         */
        [[nodiscard]] bool hasButton(GamepadButton button) const noexcept;

        /**
         * @brief Check if an axis reads straight from a valid raw axis
         * An axis without a recognized range counts as unmapped.
         */
        [[nodiscard]] bool hasAxis(GamepadAxis axis) const noexcept;

        // Builders, used by the parser and by tests
        void setName(std::string name) { name_ = std::move(name); }
        void setButtonIndex(GamepadButton button, RawIndex rawButton) noexcept;
        void setAxis(GamepadAxis axis, RawIndex rawAxis, std::optional<AxisRange> range) noexcept;

    private:
        std::string name_;
        AxisIndexArray axisIndices_{};
        AxisRangeArray axisRanges_{};
        ButtonIndexArray buttonIndices_{};
    };

    /**
     * @brief Mappings of every controller family on one platform
     */
    struct PlatformMappings {
        std::string name;
        std::array<GamepadMapping, NUM_GAMEPAD_TYPES> mappings;

        [[nodiscard]] const GamepadMapping& get(const GamepadType type) const noexcept {
            return mappings[toIndex(type)];
        }

        [[nodiscard]] GamepadMapping& get(const GamepadType type) noexcept {
            return mappings[toIndex(type)];
        }
    };

    /**
     * @brief Complete mapping data for every platform and controller family
     */
    class MappingTable {
    public:
        /**
         * @brief Construct an empty table
         * Platforms and entries are named, every entry is unmapped.
         */
        MappingTable();

        [[nodiscard]] const GamepadMapping& getMapping(GamepadPlatform platform, GamepadType type) const noexcept {
            return platforms_[toIndex(platform)].get(type);
        }

        [[nodiscard]] GamepadMapping& getMapping(GamepadPlatform platform, GamepadType type) noexcept {
            return platforms_[toIndex(platform)].get(type);
        }

        [[nodiscard]] const PlatformMappings& getPlatform(GamepadPlatform platform) const noexcept {
            return platforms_[toIndex(platform)];
        }

        /**
         * @brief Count raw bindings across the table
         * Used for load diagnostics.
         */
        [[nodiscard]] std::size_t countBindings() const noexcept;

    private:
        std::array<PlatformMappings, NUM_PLATFORMS> platforms_;
    };
} // namespace padmap::input
