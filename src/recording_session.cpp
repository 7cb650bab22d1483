#include "recording_session.h"
#include "classifier_client.h"

#include <cstdio>

const char* session_state_name(SessionState state)
{
    switch (state) {
    case SessionState::Idle:      return "idle";
    case SessionState::Recording: return "recording";
    case SessionState::Complete:  return "complete";
    }
    return "unknown";
}

/* ── construction / destruction ──────────────────────────────────────── */

RecordingSession::RecordingSession(Scheduler& scheduler, SubmissionBridge& bridge)
    : scheduler_(scheduler), bridge_(bridge)
{
}

RecordingSession::~RecordingSession() { dispose(); }

void RecordingSession::set_capture_source(std::unique_ptr<CaptureSource> source)
{
    source_ = std::move(source);
}

/* ── start / stop ────────────────────────────────────────────────────── */

StartResult RecordingSession::start()
{
    if (state_ == SessionState::Recording) return StartResult::AlreadyRecording;
    if (state_ == SessionState::Complete)  return StartResult::NotIdle;

    std::unique_ptr<CaptureHandle> handle;
    if (source_) handle = source_->acquire();
    if (!handle) {
        report_error("Microphone unavailable");
        return StartResult::DeviceUnavailable;
    }

    chunks_.clear();
    blob_.reset();
    handle->set_on_data([this](const std::vector<uint8_t>& chunk) {
        chunks_.push_back(chunk);
    });
    handle->set_on_stopped([this]() { on_capture_stopped(); });

    capture_     = std::move(handle);
    mime_type_   = capture_->mime_type();
    sample_rate_ = capture_->sample_rate() > 0 ? capture_->sample_rate()
                                               : DEFAULT_SAMPLE_RATE;
    analyzer_ = std::make_unique<LevelAnalyzer>(*capture_);

    timer_.reset();
    bars_.reset();
    current_level_ = 0.0f;

    set_state(SessionState::Recording);

    frame_id_ = scheduler_.add_frame([this]() { return on_frame(); });
    timer_id_ = scheduler_.add_interval(ElapsedTimer::INTERVAL_MS,
                                        [this]() { return on_timer_tick(); });

    if (on_elapsed_) on_elapsed_(timer_.seconds());
    if (on_levels_)  on_levels_(bars_);
    return StartResult::Started;
}

void RecordingSession::stop()
{
    if (state_ != SessionState::Recording || !capture_) return;

    cancel_schedules();
    analyzer_.reset();

    capture_->stop();          // flushes chunks, then on_capture_stopped()
    release_capture();

    if (!blob_) on_capture_stopped();

    bars_.reset();
    current_level_ = 0.0f;

    fprintf(stderr, "Recording finished: %zu bytes, %u s\n",
            blob_->bytes.size(), timer_.seconds());

    set_state(SessionState::Complete);
    if (on_levels_) on_levels_(bars_);
}

/* ── submit / discard ────────────────────────────────────────────────── */

bool RecordingSession::submit()
{
    if (state_ != SessionState::Complete || !blob_) return false;

    bridge_.submit(*blob_, sample_rate_);
    reset_to_idle();
    return true;
}

bool RecordingSession::discard()
{
    if (state_ != SessionState::Complete) return false;

    reset_to_idle();
    return true;
}

void RecordingSession::dispose()
{
    cancel_schedules();
    analyzer_.reset();

    if (capture_) {
        capture_->set_on_data(nullptr);
        capture_->set_on_stopped(nullptr);
        capture_->stop();
        release_capture();
    }

    chunks_.clear();
    blob_.reset();
    bars_.reset();
    current_level_ = 0.0f;
    state_ = SessionState::Idle;
}

/* ── scheduled ticks ─────────────────────────────────────────────────── */

bool RecordingSession::on_frame()
{
    if (state_ != SessionState::Recording || frame_id_ == 0 || !analyzer_)
        return false;

    if (!capture_->is_active()) {
        /* stream died under us; finish what was captured */
        frame_id_ = 0;
        report_error("Audio capture stopped unexpectedly");
        stop();
        return false;
    }

    current_level_ = analyzer_->next_level();
    bars_.update(current_level_);
    if (on_levels_) on_levels_(bars_);
    return true;
}

bool RecordingSession::on_timer_tick()
{
    if (state_ != SessionState::Recording || timer_id_ == 0)
        return false;

    timer_.tick();
    if (on_elapsed_) on_elapsed_(timer_.seconds());
    return true;
}

void RecordingSession::on_capture_stopped()
{
    blob_ = std::make_unique<AudioBlob>(assemble_blob(chunks_, mime_type_));
    chunks_.clear();
}

/* ── helpers ─────────────────────────────────────────────────────────── */

void RecordingSession::cancel_schedules()
{
    if (frame_id_ != 0) {
        Scheduler::SourceId id = frame_id_;
        frame_id_ = 0;
        scheduler_.remove(id);
    }
    if (timer_id_ != 0) {
        Scheduler::SourceId id = timer_id_;
        timer_id_ = 0;
        scheduler_.remove(id);
    }
}

void RecordingSession::release_capture()
{
    capture_.reset();
}

void RecordingSession::reset_to_idle()
{
    blob_.reset();
    chunks_.clear();
    timer_.reset();
    set_state(SessionState::Idle);
    if (on_elapsed_) on_elapsed_(timer_.seconds());
}

void RecordingSession::set_state(SessionState s)
{
    state_ = s;
    if (on_state_) on_state_(s);
}

void RecordingSession::report_error(const std::string& msg)
{
    fprintf(stderr, "%s\n", msg.c_str());
    if (on_error_) on_error_(msg);
}
