/**
 * @file FrameHistory.cpp
 * @brief Double-buffered raw gamepad state implementation
 * @author Andrés Guerrero
 * @date 13-09-2025
 */

#include "FrameHistory.h"

#include "../debug/InputLogger.h"

namespace padmap::input::processing {
    FrameHistory::FrameHistory(const IRawInputBackend& backend, debug::InputLogger* logger)
        : backend_(backend)
          , logger_(logger) {
        // Both banks start from the same capture so the first frame has no edges
        captureBank(banks_[currentBank_]);
        banks_[currentBank_ ^ 1] = banks_[currentBank_];
    }

    // ============================================================================
    // Frame Control
    // ============================================================================

    void FrameHistory::beginFrame() noexcept {
        fresh_.store(false, std::memory_order_release);
        frameNumber_.fetch_add(1, std::memory_order_acq_rel);
    }

    bool FrameHistory::ensureFresh() {
        if (fresh_.load(std::memory_order_acquire)) {
            return false;
        }

        std::unique_lock lock(stateMutex_);

        // Another caller may have advanced while we waited
        if (fresh_.load(std::memory_order_acquire)) {
            return false;
        }

        advanceLocked();
        return true;
    }

    void FrameHistory::advance() {
        std::unique_lock lock(stateMutex_);
        advanceLocked();
    }

    // ============================================================================
    // State Access
    // ============================================================================

    GamepadRawState FrameHistory::getCurrent(const GamepadID gamepadId) const {
        std::shared_lock lock(stateMutex_);
        return banks_[currentBank_][slotIndex(gamepadId)];
    }

    GamepadRawState FrameHistory::getPrevious(const GamepadID gamepadId) const {
        std::shared_lock lock(stateMutex_);
        return banks_[currentBank_ ^ 1][slotIndex(gamepadId)];
    }

    FrameHistory::SlotFrames FrameHistory::getFrames(const GamepadID gamepadId) const {
        const std::size_t slot = slotIndex(gamepadId);

        std::shared_lock lock(stateMutex_);
        return {banks_[currentBank_ ^ 1][slot], banks_[currentBank_][slot]};
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    void FrameHistory::advanceLocked() {
        // The old current bank becomes previous, the other bank is overwritten
        currentBank_ ^= 1;
        captureBank(banks_[currentBank_]);

        advanceCount_.fetch_add(1, std::memory_order_acq_rel);
        fresh_.store(true, std::memory_order_release);

        if (logger_ && logger_->isLevelEnabled(debug::LogLevel::VERBOSE)) {
            logger_->setFrameNumber(frameNumber_.load(std::memory_order_acquire));
            for (GamepadID id = MIN_GAMEPAD_ID; id <= MAX_GAMEPAD_ID; ++id) {
                logger_->logRawState(banks_[currentBank_][static_cast<std::size_t>(id)]);
            }
        }
    }

    void FrameHistory::captureBank(Bank& bank) const {
        bank[0].reset();
        bank[0].gamepadId = ANY_GAMEPAD_ID;

        for (GamepadID id = MIN_GAMEPAD_ID; id <= MAX_GAMEPAD_ID; ++id) {
            captureSlot(id, bank[static_cast<std::size_t>(id)]);
        }
    }

    void FrameHistory::captureSlot(const GamepadID gamepadId, GamepadRawState& state) const {
        state.gamepadId = gamepadId;

        for (RawIndex button = MIN_RAW_BUTTON_ID; button <= MAX_RAW_BUTTON_ID; ++button) {
            state.buttons[static_cast<std::size_t>(button)] = backend_.isButtonDown(gamepadId, button);
        }

        for (RawIndex axis = MIN_RAW_AXIS_ID; axis <= MAX_RAW_AXIS_ID; ++axis) {
            state.axes[static_cast<std::size_t>(axis)] = backend_.getAxisRaw(gamepadId, axis);
        }
    }

    std::size_t FrameHistory::slotIndex(const GamepadID gamepadId) noexcept {
        return isValidGamepadId(gamepadId) ? static_cast<std::size_t>(gamepadId) : 0;
    }
} // namespace padmap::input::processing
