/**
 * @file FrameHistory.h
 * @brief Double-buffered raw gamepad state for edge detection
 * @author Andrés Guerrero
 * @date 13-09-2025
 *
 * Holds the current and previous raw state of every gamepad slot. The history
 * advances at most once per frame: the first query of a frame triggers it and
 * later queries reuse the captured data until the next frame boundary.
 */

#pragma once

#include "../devices/base/IRawInputBackend.h"
#include "../devices/gamepad/GamepadState.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <shared_mutex>

namespace padmap::input::debug {
    class InputLogger;
}

namespace padmap::input::processing {
    /**
     * @brief Two-bank raw state history
     *
     * Banks are swapped by index, so an advance never allocates. An advance
     * holds the state lock exclusively while it captures and swaps banks.
     * Readers take it shared and receive copies, so a frame-driver thread may
     * call advance() while query threads read.
     */
    class FrameHistory {
    public:
        using Bank = std::array<GamepadRawState, NUM_GAMEPAD_SLOTS>;

        /**
         * @brief Previous and current state of one slot, read under one lock
         */
        struct SlotFrames {
            GamepadRawState previous;
            GamepadRawState current;
        };

        /**
         * @brief Constructor, captures the initial state of every slot
         * @param backend Raw input source, must outlive the history
         * @param logger Optional logger for advance tracing
         */
        explicit FrameHistory(const IRawInputBackend& backend,
                              debug::InputLogger* logger = nullptr);

        // Disable copy and move, the mutex and backend reference pin the object
        FrameHistory(const FrameHistory&) = delete;
        FrameHistory& operator=(const FrameHistory&) = delete;
        FrameHistory(FrameHistory&&) = delete;
        FrameHistory& operator=(FrameHistory&&) = delete;

        // ============================================================================
        // Frame Control
        // ============================================================================

        /**
         * @brief Signal a frame boundary
         * The next ensureFresh() call advances the history.
         */
        void beginFrame() noexcept;

        /**
         * @brief Advance if not yet advanced this frame
         * @return True if this call performed the advance
         */
        bool ensureFresh();

        /**
         * @brief Advance unconditionally and mark the frame fresh
         * For frame drivers that capture input at a fixed point of the loop.
         */
        void advance();

        [[nodiscard]] bool isFresh() const noexcept {
            return fresh_.load(std::memory_order_acquire);
        }

        // ============================================================================
        // State Access
        // ============================================================================

        /**
         * @brief Get the state captured by the latest advance
         * Invalid ids return the reserved slot 0, which is always neutral.
         */
        [[nodiscard]] GamepadRawState getCurrent(GamepadID gamepadId) const;

        /**
         * @brief Get the state captured by the advance before the latest one
         */
        [[nodiscard]] GamepadRawState getPrevious(GamepadID gamepadId) const;

        /**
         * @brief Get both states of a slot from the same advance
         * Edge queries use this so an advance on another thread cannot fall
         * between the two reads.
         */
        [[nodiscard]] SlotFrames getFrames(GamepadID gamepadId) const;

        // ============================================================================
        // Statistics
        // ============================================================================

        [[nodiscard]] std::uint64_t getAdvanceCount() const noexcept {
            return advanceCount_.load(std::memory_order_acquire);
        }

        [[nodiscard]] std::uint64_t getFrameNumber() const noexcept {
            return frameNumber_.load(std::memory_order_acquire);
        }

    private:
        const IRawInputBackend& backend_;
        debug::InputLogger* logger_;

        static constexpr std::size_t BANK_COUNT = 2;
        std::array<Bank, BANK_COUNT> banks_;
        std::uint8_t currentBank_ = 0;

        std::atomic<bool> fresh_{false};
        std::atomic<std::uint64_t> advanceCount_{0};
        std::atomic<std::uint64_t> frameNumber_{0};

        mutable std::shared_mutex stateMutex_;

        void advanceLocked();
        void captureBank(Bank& bank) const;
        void captureSlot(GamepadID gamepadId, GamepadRawState& state) const;

        [[nodiscard]] static std::size_t slotIndex(GamepadID gamepadId) noexcept;
    };
} // namespace padmap::input::processing
