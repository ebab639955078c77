/**
 * @file GamepadMapping.cpp
 * @brief Raw-to-logical mapping tables implementation
 * @author Andrés Guerrero
 * @date 15-09-2025
 */

#include "GamepadMapping.h"

#include <cctype>

namespace padmap::input {
    namespace {
        struct RangeToken {
            std::string_view token;
            AxisRange range;
        };

        // The six orderings of two distinct values from {-1, 0, 1}
        constexpr std::array<RangeToken, 6> RANGE_TOKENS = {{
            {"-1_0", AxisRange(-1.0f, 0.0f)},
            {"-1_1", AxisRange(-1.0f, 1.0f)},
            {"0_-1", AxisRange(0.0f, -1.0f)},
            {"0_1", AxisRange(0.0f, 1.0f)},
            {"1_-1", AxisRange(1.0f, -1.0f)},
            {"1_0", AxisRange(1.0f, 0.0f)}
        }};

        std::string_view trim(std::string_view text) noexcept {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
                text.remove_suffix(1);
            }
            return text;
        }
    }

    std::optional<AxisRange> axisRangeFromToken(const std::string_view token) noexcept {
        const std::string_view key = trim(token);
        for (const auto& entry : RANGE_TOKENS) {
            if (entry.token == key) {
                return entry.range;
            }
        }
        return std::nullopt;
    }

    std::string axisRangeToToken(const std::optional<AxisRange>& range) {
        if (range) {
            for (const auto& entry : RANGE_TOKENS) {
                if (entry.range == *range) {
                    return std::string(entry.token);
                }
            }
        }
        return "invalid";
    }

    // ============================================================================
    // GamepadMapping
    // ============================================================================

    GamepadMapping::GamepadMapping() noexcept {
        axisIndices_.fill(UNMAPPED_INDEX);
        axisRanges_.fill(std::nullopt);
        buttonIndices_.fill(UNMAPPED_INDEX);
    }

    GamepadMapping::GamepadMapping(std::string name,
                                   const AxisIndexArray& axisIndices,
                                   const AxisRangeArray& axisRanges,
                                   const ButtonIndexArray& buttonIndices)
        : name_(std::move(name))
          , axisIndices_(axisIndices)
          , axisRanges_(axisRanges)
          , buttonIndices_(buttonIndices) {
    }

    RawIndex GamepadMapping::getButtonIndex(const GamepadButton button) const noexcept {
        if (!isMappableButton(button)) {
            return UNMAPPED_INDEX;
        }
        return buttonIndices_[toIndex(button)];
    }

    RawIndex GamepadMapping::getAxisIndex(const GamepadAxis axis) const noexcept {
        const auto index = toIndex(axis);
        return index < axisIndices_.size() ? axisIndices_[index] : UNMAPPED_INDEX;
    }

    std::optional<AxisRange> GamepadMapping::getAxisRange(const GamepadAxis axis) const noexcept {
        const auto index = toIndex(axis);
        return index < axisRanges_.size() ? axisRanges_[index] : std::nullopt;
    }

    bool GamepadMapping::hasButton(const GamepadButton button) const noexcept {
        return isValidRawButton(getButtonIndex(button));
    }

    bool GamepadMapping::hasAxis(const GamepadAxis axis) const noexcept {
        return isValidRawAxis(getAxisIndex(axis)) && getAxisRange(axis).has_value();
    }

    void GamepadMapping::setButtonIndex(const GamepadButton button, const RawIndex rawButton) noexcept {
        if (isMappableButton(button)) {
            buttonIndices_[toIndex(button)] = rawButton;
        }
    }

    void GamepadMapping::setAxis(const GamepadAxis axis,
                                 const RawIndex rawAxis,
                                 const std::optional<AxisRange> range) noexcept {
        const auto index = toIndex(axis);
        if (index < axisIndices_.size()) {
            axisIndices_[index] = rawAxis;
            axisRanges_[index] = range;
        }
    }

    // ============================================================================
    // MappingTable
    // ============================================================================

    MappingTable::MappingTable() {
        for (std::size_t p = 0; p < NUM_PLATFORMS; ++p) {
            auto& platform = platforms_[p];
            platform.name = gamepadPlatformToString(static_cast<GamepadPlatform>(p));
            for (std::size_t t = 0; t < NUM_GAMEPAD_TYPES; ++t) {
                platform.mappings[t].setName(gamepadTypeToString(static_cast<GamepadType>(t)));
            }
        }
    }

    std::size_t MappingTable::countBindings() const noexcept {
        std::size_t count = 0;
        for (const auto& platform : platforms_) {
            for (const auto& mapping : platform.mappings) {
                for (std::size_t a = 0; a < NUM_MAPPED_AXES; ++a) {
                    if (mapping.hasAxis(static_cast<GamepadAxis>(a))) ++count;
                }
                for (std::size_t b = 0; b < NUM_MAPPED_BUTTONS; ++b) {
                    if (mapping.hasButton(static_cast<GamepadButton>(b))) ++count;
                }
            }
        }
        return count;
    }
} // namespace padmap::input
