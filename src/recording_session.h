#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "audio_backend.h"
#include "audio_blob.h"
#include "elapsed_timer.h"
#include "level_analyzer.h"
#include "level_bars.h"
#include "scheduler.h"

class SubmissionBridge;

enum class SessionState { Idle, Recording, Complete };

enum class StartResult {
    Started,
    AlreadyRecording,    // a capture handle is already live
    NotIdle,             // a finished recording awaits submit/discard
    DeviceUnavailable,
};

const char* session_state_name(SessionState state);

/* ── RecordingSession ──────────────────────────────────────────────────────
 *
 *  Idle ──start()──▶ Recording ──stop()──▶ Complete ──submit()/discard()──▶ Idle
 *
 *  While recording, two repeating tasks run on the scheduler: the frame tick
 *  (analyzer → bars) and the 1 s elapsed tick.  Both are removed before any
 *  other stop work, and each tick re-checks its id and the state, so nothing
 *  mutates the session after stop() has begun.  The capture handle is owned
 *  here and released on stop, on a dead stream and on dispose().
 *
 *  All methods must be called on the UI thread.
 * ──────────────────────────────────────────────────────────────────────── */

class RecordingSession {
public:
    static constexpr int DEFAULT_SAMPLE_RATE = 44100;

    RecordingSession(Scheduler& scheduler, SubmissionBridge& bridge);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    void set_capture_source(std::unique_ptr<CaptureSource> source);

    /* lifecycle -------------------------------------------------------------- */
    StartResult start();
    void        stop();
    bool        submit();
    bool        discard();
    void        dispose();

    /* observers (UI thread) -------------------------------------------------- */
    void set_on_state_changed(std::function<void(SessionState)> cb) { on_state_   = std::move(cb); }
    void set_on_levels(std::function<void(const LevelBars&)> cb)    { on_levels_  = std::move(cb); }
    void set_on_elapsed(std::function<void(unsigned)> cb)           { on_elapsed_ = std::move(cb); }
    void set_on_error(std::function<void(const std::string&)> cb)   { on_error_   = std::move(cb); }

    /* queries ---------------------------------------------------------------- */
    SessionState     state()           const { return state_; }
    bool             is_recording()    const { return state_ == SessionState::Recording; }
    unsigned         elapsed_seconds() const { return timer_.seconds(); }
    const AudioBlob* recorded_blob()   const { return blob_.get(); }
    const LevelBars& levels()          const { return bars_; }
    float            current_level()   const { return current_level_; }
    int              sample_rate()     const { return sample_rate_; }
    bool             has_capture()     const { return capture_ != nullptr; }
    bool             frame_scheduled() const { return frame_id_ != 0; }
    bool             timer_scheduled() const { return timer_id_ != 0; }

private:
    bool on_frame();
    bool on_timer_tick();
    void on_capture_stopped();

    void cancel_schedules();
    void release_capture();
    void reset_to_idle();
    void set_state(SessionState s);
    void report_error(const std::string& msg);

    Scheduler&                     scheduler_;
    SubmissionBridge&              bridge_;
    std::unique_ptr<CaptureSource> source_;

    SessionState                   state_ = SessionState::Idle;
    std::unique_ptr<CaptureHandle> capture_;
    std::unique_ptr<LevelAnalyzer> analyzer_;
    std::vector<std::vector<uint8_t>> chunks_;
    std::unique_ptr<AudioBlob>     blob_;
    std::string                    mime_type_;

    LevelBars    bars_;
    ElapsedTimer timer_;
    float        current_level_ = 0.0f;
    int          sample_rate_   = DEFAULT_SAMPLE_RATE;

    Scheduler::SourceId frame_id_ = 0;
    Scheduler::SourceId timer_id_ = 0;

    std::function<void(SessionState)>       on_state_;
    std::function<void(const LevelBars&)>   on_levels_;
    std::function<void(unsigned)>           on_elapsed_;
    std::function<void(const std::string&)> on_error_;
};
