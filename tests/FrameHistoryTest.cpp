#include "StubRawInputBackend.h"

#include "input/debug/InputLogger.h"
#include "input/processing/FrameHistory.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace padmap::input;
using padmap::input::processing::FrameHistory;
using padmap::input::test::StubRawInputBackend;

namespace {
    constexpr std::size_t READ_SLOTS = MAX_GAMEPAD_ID - MIN_GAMEPAD_ID + 1;

    /**
     * Every axis reports the number of the capture in progress, so a state
     * captured in one piece has all axes equal.
     */
    class CaptureCountingBackend final : public IRawInputBackend {
    public:
        [[nodiscard]] bool isButtonDown(const GamepadID gamepadId, const RawIndex rawButton) const override {
            if (gamepadId == MIN_GAMEPAD_ID && rawButton == MIN_RAW_BUTTON_ID) {
                captures_.fetch_add(1, std::memory_order_relaxed);
            }
            return false;
        }

        [[nodiscard]] float getAxisRaw(GamepadID, RawIndex) const override {
            return static_cast<float>(captures_.load(std::memory_order_relaxed));
        }

        [[nodiscard]] const char* getName() const noexcept override { return "CaptureCounting"; }

    private:
        mutable std::atomic<int> captures_{0};
    };

    bool isWholeCapture(const GamepadRawState& state) {
        for (const float value : state.axes) {
            if (value != state.axes[0]) {
                return false;
            }
        }
        return true;
    }
}

TEST(FrameHistory, ConstructionCapturesEverySlotOnce) {
    StubRawInputBackend backend;
    backend.setButton(2, 5, true);
    backend.setAxis(3, 12, -0.75f);

    const FrameHistory history(backend);

    EXPECT_EQ(backend.getButtonReads(), READ_SLOTS * NUM_RAW_BUTTONS);
    EXPECT_EQ(backend.getAxisReads(), READ_SLOTS * NUM_RAW_AXES);
    EXPECT_EQ(backend.getInvalidSlotReads(), 0u);

    // No edges before the first advance
    EXPECT_TRUE(history.getCurrent(2).isButtonDown(5));
    EXPECT_TRUE(history.getPrevious(2).isButtonDown(5));
    EXPECT_FLOAT_EQ(history.getCurrent(3).getAxis(12), -0.75f);
    EXPECT_FALSE(history.isFresh());
    EXPECT_EQ(history.getAdvanceCount(), 0u);
}

TEST(FrameHistory, AdvancesOncePerFrame) {
    StubRawInputBackend backend;
    FrameHistory history(backend);
    backend.resetCounters();

    EXPECT_TRUE(history.ensureFresh());
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(history.ensureFresh());
    }

    EXPECT_EQ(history.getAdvanceCount(), 1u);
    EXPECT_EQ(backend.getButtonReads(), READ_SLOTS * NUM_RAW_BUTTONS);
    EXPECT_EQ(backend.getAxisReads(), READ_SLOTS * NUM_RAW_AXES);

    history.beginFrame();
    EXPECT_FALSE(history.isFresh());
    EXPECT_TRUE(history.ensureFresh());
    EXPECT_EQ(history.getAdvanceCount(), 2u);
    EXPECT_EQ(history.getFrameNumber(), 1u);
}

TEST(FrameHistory, AdvanceShiftsCurrentToPrevious) {
    StubRawInputBackend backend;
    FrameHistory history(backend);

    backend.setButton(1, 0, true);
    backend.setAxis(1, 4, 0.5f);
    history.advance();

    EXPECT_TRUE(history.getCurrent(1).isButtonDown(0));
    EXPECT_FALSE(history.getPrevious(1).isButtonDown(0));
    EXPECT_FLOAT_EQ(history.getCurrent(1).getAxis(4), 0.5f);
    EXPECT_FLOAT_EQ(history.getPrevious(1).getAxis(4), 0.0f);

    history.advance();
    EXPECT_TRUE(history.getCurrent(1).isButtonDown(0));
    EXPECT_TRUE(history.getPrevious(1).isButtonDown(0));

    backend.setButton(1, 0, false);
    history.advance();
    EXPECT_FALSE(history.getCurrent(1).isButtonDown(0));
    EXPECT_TRUE(history.getPrevious(1).isButtonDown(0));
}

TEST(FrameHistory, ExplicitAdvanceSatisfiesTheFrame) {
    StubRawInputBackend backend;
    FrameHistory history(backend);

    history.beginFrame();
    history.advance();
    EXPECT_TRUE(history.isFresh());
    EXPECT_FALSE(history.ensureFresh());
    EXPECT_EQ(history.getAdvanceCount(), 1u);
}

TEST(FrameHistory, SlotsAreKeptApart) {
    StubRawInputBackend backend;
    backend.setButton(4, 19, true);
    FrameHistory history(backend);

    EXPECT_TRUE(history.getCurrent(4).isButtonDown(19));
    for (GamepadID id = MIN_GAMEPAD_ID; id < MAX_GAMEPAD_ID; ++id) {
        EXPECT_FALSE(history.getCurrent(id).isButtonDown(19)) << id;
    }
    EXPECT_EQ(history.getCurrent(4).gamepadId, 4);
}

TEST(FrameHistory, InvalidIdsReadNeutralState) {
    StubRawInputBackend backend;
    backend.setButton(1, 0, true);
    backend.setAxis(1, 1, 1.0f);
    FrameHistory history(backend);

    for (const GamepadID id : {ANY_GAMEPAD_ID, GamepadID{5}, GamepadID{-3}}) {
        EXPECT_TRUE(history.getCurrent(id).buttons.none()) << id;
        EXPECT_FLOAT_EQ(history.getCurrent(id).getAxis(1), 0.0f) << id;
        EXPECT_TRUE(history.getPrevious(id).buttons.none()) << id;
    }
}

TEST(FrameHistory, TracesAdvancesAtVerbose) {
    debug::LoggerConfig config;
    config.logToConsole = false;
    config.logToMemory = true;
    config.minLevel = debug::LogLevel::VERBOSE;

    debug::InputLogger logger;
    ASSERT_TRUE(logger.initialize(config));

    StubRawInputBackend backend;
    FrameHistory history(backend, &logger);
    history.advance();

    const auto entries = logger.getMemoryLog();
    ASSERT_EQ(entries.size(), READ_SLOTS);
    EXPECT_EQ(entries.front().type, debug::LogEntryType::FRAME);
    EXPECT_EQ(entries.front().message, "Gamepad 1 raw state");
}

TEST(FrameHistory, ReadersNeverSeeHalfCapturedState) {
    constexpr int ADVANCES = 2000;

    CaptureCountingBackend backend;
    FrameHistory history(backend);

    std::atomic<bool> done{false};
    std::thread driver([&history, &done] {
        for (int i = 0; i < ADVANCES; ++i) {
            history.advance();
        }
        done.store(true, std::memory_order_release);
    });

    int torn = 0;
    int unordered = 0;
    while (!done.load(std::memory_order_acquire)) {
        const auto frames = history.getFrames(2);
        torn += isWholeCapture(frames.current) && isWholeCapture(frames.previous) ? 0 : 1;
        torn += isWholeCapture(history.getCurrent(4)) ? 0 : 1;

        // Consecutive captures, except before the first advance
        const float gap = frames.current.axes[0] - frames.previous.axes[0];
        unordered += gap == 1.0f || (gap == 0.0f && frames.current.axes[0] == 1.0f) ? 0 : 1;
    }
    driver.join();

    EXPECT_EQ(torn, 0);
    EXPECT_EQ(unordered, 0);
    EXPECT_EQ(history.getAdvanceCount(), static_cast<std::uint64_t>(ADVANCES));
    EXPECT_FLOAT_EQ(history.getCurrent(1).getAxis(0), static_cast<float>(ADVANCES + 1));
}

TEST(FrameHistory, FramesMatchSeparateReads) {
    StubRawInputBackend backend;
    FrameHistory history(backend);

    backend.setButton(3, 7, true);
    history.advance();

    const auto frames = history.getFrames(3);
    EXPECT_FALSE(frames.previous.isButtonDown(7));
    EXPECT_TRUE(frames.current.isButtonDown(7));
    EXPECT_EQ(frames.current.buttons, history.getCurrent(3).buttons);
    EXPECT_EQ(frames.previous.buttons, history.getPrevious(3).buttons);
}
