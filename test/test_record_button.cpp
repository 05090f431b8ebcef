/*
 * Record Button Unit Tests
 * Tests short press (toggle), long press (shutdown) and feedback
 */

#include "utils/record_button.hpp"
#include "utils/button_debounce.hpp"
#include "config.h"
#include <gtest/gtest.h>

class RecordButtonTest : public ::testing::Test {
protected:
    RecordButtonState state = {};
    static constexpr uint32_t FEEDBACK_MS = 1500;
    static constexpr uint32_t SHUTDOWN_MS = 3000;

    RecordAction update(uint32_t t, bool pressed) {
        return record_button_update(t, pressed, FEEDBACK_MS, SHUTDOWN_MS, state);
    }
};

TEST_F(RecordButtonTest, NoPressAlwaysNone) {
    for (uint32_t t = 0; t < 5000; t += 100) {
        EXPECT_EQ(update(t, false), RecordAction::None);
    }
}

TEST_F(RecordButtonTest, ShortPressTogglesOnRelease) {
    EXPECT_EQ(update(0, true), RecordAction::None);
    EXPECT_EQ(update(500, true), RecordAction::None);
    EXPECT_EQ(update(600, false), RecordAction::Toggle);
}

TEST_F(RecordButtonTest, HoldPastFeedbackShowsFeedbackOnce) {
    EXPECT_EQ(update(0, true), RecordAction::None);
    EXPECT_EQ(update(1499, true), RecordAction::None);
    EXPECT_EQ(update(1500, true), RecordAction::ShowFeedback);
    EXPECT_EQ(update(1600, true), RecordAction::None);
}

TEST_F(RecordButtonTest, ReleaseAfterFeedbackHidesInsteadOfToggling) {
    EXPECT_EQ(update(0, true), RecordAction::None);
    EXPECT_EQ(update(1500, true), RecordAction::ShowFeedback);
    EXPECT_EQ(update(2500, false), RecordAction::HideFeedback);
}

TEST_F(RecordButtonTest, ShutdownFiresOncePerHold) {
    EXPECT_EQ(update(0, true), RecordAction::None);
    EXPECT_EQ(update(1500, true), RecordAction::ShowFeedback);
    EXPECT_EQ(update(2999, true), RecordAction::None);
    EXPECT_EQ(update(3000, true), RecordAction::Shutdown);
    EXPECT_EQ(update(3100, true), RecordAction::None);
    EXPECT_EQ(update(5000, true), RecordAction::None);
    /* Releasing after shutdown must not toggle recording back on */
    EXPECT_EQ(update(5100, false), RecordAction::None);
}

TEST_F(RecordButtonTest, CyclesResetState) {
    EXPECT_EQ(update(0, true), RecordAction::None);
    EXPECT_EQ(update(1500, true), RecordAction::ShowFeedback);
    EXPECT_EQ(update(2000, false), RecordAction::HideFeedback);

    EXPECT_EQ(update(2500, true), RecordAction::None);
    EXPECT_EQ(update(2700, false), RecordAction::Toggle);

    EXPECT_EQ(update(3000, true), RecordAction::None);
    EXPECT_EQ(update(4500, true), RecordAction::ShowFeedback);
}

TEST_F(RecordButtonTest, TimestampWrapAround) {
    uint32_t near_max = UINT32_MAX - 500;
    EXPECT_EQ(update(near_max, true), RecordAction::None);
    EXPECT_EQ(update(near_max + 1600, true), RecordAction::ShowFeedback);
    EXPECT_EQ(update(near_max + 3100, true), RecordAction::Shutdown);
}

TEST_F(RecordButtonTest, ReleaseBeforeFeedbackAlwaysToggles) {
    const uint32_t release_points[] = {10, 100, 500, 1000, 1499};
    for (uint32_t release_time : release_points) {
        RecordButtonState s = {};
        EXPECT_EQ(record_button_update(0, true, FEEDBACK_MS, SHUTDOWN_MS, s), RecordAction::None);
        EXPECT_EQ(record_button_update(release_time - 1, true, FEEDBACK_MS, SHUTDOWN_MS, s),
                  RecordAction::None);
        EXPECT_EQ(record_button_update(release_time, false, FEEDBACK_MS, SHUTDOWN_MS, s),
                  RecordAction::Toggle)
            << "release_time=" << release_time;
    }
}

TEST_F(RecordButtonTest, DebouncedBounceTogglesOnce) {
    /* Raw contact bounce goes through the debouncer first, as on the device */
    DebounceState db = {};
    int toggles = 0;
    const bool raw[] = {true, false, true, true, true, true, true, true, true, true,
                        false, true, false, false, false, false, false, false, false, false};
    uint32_t t = 0;
    for (bool level : raw) {
        debounce_update(t, level, BUTTON_DEBOUNCE_MS, db);
        if (update(t, db.stable_state) == RecordAction::Toggle) {
            toggles++;
        }
        t += 10;
    }
    EXPECT_EQ(toggles, 1);
}
