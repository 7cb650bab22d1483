#include "recording_session.h"
#include "test_utils.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace test_utils;

class RecordingSessionTest : public ::testing::Test {
protected:
    void Install(bool available = true, float amplitude = 0.0f, int rate = 48000) {
        auto src = std::make_unique<FakeCaptureSource>(stats, available, amplitude, rate);
        source = src.get();
        session.set_capture_source(std::move(src));
    }

    std::shared_ptr<CaptureStats> stats = std::make_shared<CaptureStats>();
    FakeScheduler      scheduler;
    RecordingBridge    bridge;
    RecordingSession   session{scheduler, bridge};
    FakeCaptureSource* source = nullptr;
};

static void ExpectBarsAtFloor(const LevelBars& bars)
{
    for (int i = 0; i < LevelBars::BAR_COUNT; i++)
        EXPECT_EQ(bars[i], LevelBars::FLOOR) << "bar " << i;
}

TEST_F(RecordingSessionTest, StartsIdle) {
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(session.elapsed_seconds(), 0u);
    EXPECT_EQ(session.recorded_blob(), nullptr);
    ExpectBarsAtFloor(session.levels());
}

TEST_F(RecordingSessionTest, StartStopSubmitReturnsToIdle) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_EQ(session.state(), SessionState::Recording);
    EXPECT_EQ(session.recorded_blob(), nullptr);

    source->last->Emit({0x01, 0x02, 0x03});
    source->last->Emit({0x04});
    scheduler.AdvanceMs(2000);

    session.stop();
    ASSERT_EQ(session.state(), SessionState::Complete);
    ASSERT_NE(session.recorded_blob(), nullptr);
    EXPECT_EQ(session.recorded_blob()->bytes,
              (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0xEE, 0xFF}));
    EXPECT_EQ(session.recorded_blob()->mime_type, "audio/webm");
    EXPECT_EQ(session.elapsed_seconds(), 2u);

    EXPECT_TRUE(session.submit());
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(session.recorded_blob(), nullptr);
    EXPECT_EQ(session.elapsed_seconds(), 0u);

    ASSERT_EQ(bridge.blobs.size(), 1u);
    EXPECT_EQ(bridge.blobs[0].bytes.size(), 6u);
    EXPECT_EQ(bridge.sample_rates[0], 48000);
}

TEST_F(RecordingSessionTest, StartStopDiscardReturnsToIdle) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    scheduler.AdvanceMs(1500);
    session.stop();
    ASSERT_NE(session.recorded_blob(), nullptr);

    EXPECT_TRUE(session.discard());
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(session.recorded_blob(), nullptr);
    EXPECT_EQ(session.elapsed_seconds(), 0u);
    EXPECT_TRUE(bridge.blobs.empty());
}

TEST_F(RecordingSessionTest, StopWhileIdleIsNoop) {
    Install();
    int state_changes = 0;
    session.set_on_state_changed([&](SessionState) { state_changes++; });

    session.stop();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(state_changes, 0);
    EXPECT_EQ(stats->stopped, 0);
}

TEST_F(RecordingSessionTest, SubmitAndDiscardOutsideCompleteAreNoops) {
    Install();
    EXPECT_FALSE(session.submit());
    EXPECT_FALSE(session.discard());

    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_FALSE(session.submit());
    EXPECT_FALSE(session.discard());
    EXPECT_EQ(session.state(), SessionState::Recording);
    EXPECT_TRUE(bridge.blobs.empty());
}

TEST_F(RecordingSessionTest, StartWhileRecordingIsRejected) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_EQ(session.start(), StartResult::AlreadyRecording);
    EXPECT_EQ(stats->acquired, 1);
    EXPECT_EQ(scheduler.ActiveCount(), 2u);
}

TEST_F(RecordingSessionTest, StartWhileCompleteIsRejected) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    session.stop();
    EXPECT_EQ(session.start(), StartResult::NotIdle);
    EXPECT_EQ(stats->acquired, 1);
    EXPECT_EQ(session.state(), SessionState::Complete);
}

TEST_F(RecordingSessionTest, DeviceUnavailableStaysIdle) {
    Install(false);
    std::string error;
    session.set_on_error([&](const std::string& msg) { error = msg; });

    EXPECT_EQ(session.start(), StartResult::DeviceUnavailable);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_FALSE(session.has_capture());
    EXPECT_FALSE(session.frame_scheduled());
    EXPECT_FALSE(session.timer_scheduled());
    EXPECT_EQ(scheduler.ActiveCount(), 0u);
    EXPECT_FALSE(error.empty());
}

TEST_F(RecordingSessionTest, NoCaptureSourceIsDeviceUnavailable) {
    EXPECT_EQ(session.start(), StartResult::DeviceUnavailable);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(scheduler.ActiveCount(), 0u);
}

TEST_F(RecordingSessionTest, LoudInputRaisesBarsAndStopResetsThem) {
    Install(true, 1.0f);
    ASSERT_EQ(session.start(), StartResult::Started);

    scheduler.RunFrames(10);
    EXPECT_GT(session.current_level(), 0.0f);
    for (int i = 0; i < LevelBars::BAR_COUNT; i++) {
        EXPECT_GT(session.levels()[i], LevelBars::FLOOR);
        EXPECT_LE(session.levels()[i], 1.0f + 1e-5f);
    }

    session.stop();
    ExpectBarsAtFloor(session.levels());
    EXPECT_EQ(session.current_level(), 0.0f);
}

TEST_F(RecordingSessionTest, SilentInputKeepsBarsAtFloor) {
    Install(true, 0.0f);
    ASSERT_EQ(session.start(), StartResult::Started);
    scheduler.RunFrames(5);
    EXPECT_EQ(session.current_level(), 0.0f);
    ExpectBarsAtFloor(session.levels());
}

TEST_F(RecordingSessionTest, TimerCountsWholeSeconds) {
    Install();
    std::vector<unsigned> ticks;
    session.set_on_elapsed([&](unsigned s) { ticks.push_back(s); });

    ASSERT_EQ(session.start(), StartResult::Started);
    scheduler.AdvanceMs(3400);
    session.stop();
    EXPECT_EQ(session.elapsed_seconds(), 3u);
    EXPECT_EQ(ticks, (std::vector<unsigned>{0, 1, 2, 3}));

    // frozen after stop
    scheduler.AdvanceMs(5000);
    EXPECT_EQ(session.elapsed_seconds(), 3u);
}

TEST_F(RecordingSessionTest, TimerNeverTicksWhileIdle) {
    Install();
    scheduler.AdvanceMs(5000);
    EXPECT_EQ(session.elapsed_seconds(), 0u);
}

TEST_F(RecordingSessionTest, ElapsedResetsOnEveryStart) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    scheduler.AdvanceMs(2100);
    session.stop();
    ASSERT_TRUE(session.discard());

    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_EQ(session.elapsed_seconds(), 0u);
    scheduler.AdvanceMs(1000);
    EXPECT_EQ(session.elapsed_seconds(), 1u);
    EXPECT_EQ(stats->acquired, 2);
}

TEST_F(RecordingSessionTest, StopCancelsBothSchedules) {
    Install(true, 1.0f);
    int level_updates = 0;
    session.set_on_levels([&](const LevelBars&) { level_updates++; });

    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_TRUE(session.frame_scheduled());
    EXPECT_TRUE(session.timer_scheduled());

    session.stop();
    EXPECT_FALSE(session.frame_scheduled());
    EXPECT_FALSE(session.timer_scheduled());
    EXPECT_EQ(scheduler.ActiveCount(), 0u);

    int after_stop = level_updates;
    scheduler.RunFrames(3);
    scheduler.AdvanceMs(3000);
    EXPECT_EQ(level_updates, after_stop);
    ExpectBarsAtFloor(session.levels());
}

TEST_F(RecordingSessionTest, CaptureReleasedExactlyOnce) {
    Install();
    ASSERT_EQ(session.start(), StartResult::Started);
    session.stop();
    EXPECT_FALSE(session.has_capture());
    EXPECT_EQ(stats->stopped, 1);
    EXPECT_EQ(stats->destroyed, 1);
}

TEST_F(RecordingSessionTest, BlobPresentOnlyWhenComplete) {
    Install();
    EXPECT_EQ(session.recorded_blob(), nullptr);
    ASSERT_EQ(session.start(), StartResult::Started);
    EXPECT_EQ(session.recorded_blob(), nullptr);
    session.stop();
    EXPECT_NE(session.recorded_blob(), nullptr);
    session.submit();
    EXPECT_EQ(session.recorded_blob(), nullptr);
}

TEST_F(RecordingSessionTest, StateListenerSeesFullCycle) {
    Install();
    std::vector<SessionState> states;
    session.set_on_state_changed([&](SessionState s) { states.push_back(s); });

    session.start();
    session.stop();
    session.submit();
    EXPECT_EQ(states, (std::vector<SessionState>{
        SessionState::Recording, SessionState::Complete, SessionState::Idle}));
}

TEST_F(RecordingSessionTest, DisposeWhileRecordingReleasesEverything) {
    Install(true, 1.0f);
    ASSERT_EQ(session.start(), StartResult::Started);
    scheduler.RunFrames(2);

    session.dispose();
    EXPECT_EQ(scheduler.ActiveCount(), 0u);
    EXPECT_FALSE(session.has_capture());
    EXPECT_EQ(stats->stopped, 1);
    EXPECT_EQ(stats->destroyed, 1);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(session.recorded_blob(), nullptr);
}

TEST_F(RecordingSessionTest, DestructorCancelsSchedules) {
    FakeScheduler sched;
    RecordingBridge br;
    auto st = std::make_shared<CaptureStats>();
    {
        RecordingSession s(sched, br);
        s.set_capture_source(std::make_unique<FakeCaptureSource>(st));
        ASSERT_EQ(s.start(), StartResult::Started);
        EXPECT_EQ(sched.ActiveCount(), 2u);
    }
    EXPECT_EQ(sched.ActiveCount(), 0u);
    EXPECT_EQ(st->stopped, 1);
}

TEST_F(RecordingSessionTest, DeadStreamEndsRecording) {
    Install(true, 0.5f);
    std::string error;
    session.set_on_error([&](const std::string& msg) { error = msg; });

    ASSERT_EQ(session.start(), StartResult::Started);
    source->last->Emit({0x10, 0x20});
    source->last->Fail();
    scheduler.RunFrame();

    EXPECT_EQ(session.state(), SessionState::Complete);
    ASSERT_NE(session.recorded_blob(), nullptr);
    EXPECT_EQ(session.recorded_blob()->bytes.size(), 4u);
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(scheduler.ActiveCount(), 0u);
    EXPECT_EQ(stats->stopped, 1);
    ExpectBarsAtFloor(session.levels());
}

TEST_F(RecordingSessionTest, UnknownSampleRateFallsBackTo44100) {
    Install(true, 0.0f, 0);
    ASSERT_EQ(session.start(), StartResult::Started);
    session.stop();
    session.submit();
    ASSERT_EQ(bridge.sample_rates.size(), 1u);
    EXPECT_EQ(bridge.sample_rates[0], RecordingSession::DEFAULT_SAMPLE_RATE);
}
