#pragma once

#include "audio_backend.h"
#include "classifier_client.h"
#include "scheduler.h"

#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace test_utils {

// Manual clock: frames run on demand, intervals fire as virtual time advances
class FakeScheduler : public Scheduler {
public:
    SourceId add_frame(Task task) override {
        SourceId id = next_id_++;
        frames_[id] = std::move(task);
        return id;
    }

    SourceId add_interval(unsigned interval_ms, Task task) override {
        SourceId id = next_id_++;
        intervals_[id] = Interval{interval_ms, now_ms_ + interval_ms, std::move(task)};
        return id;
    }

    void remove(SourceId id) override {
        frames_.erase(id);
        intervals_.erase(id);
    }

    void RunFrame() {
        std::vector<SourceId> ids;
        for (const auto& kv : frames_) ids.push_back(kv.first);
        for (SourceId id : ids) {
            auto it = frames_.find(id);
            if (it == frames_.end()) continue;   // removed by an earlier task
            Task task = it->second;
            if (!task()) frames_.erase(id);
        }
    }

    void RunFrames(int n) {
        for (int i = 0; i < n; i++) RunFrame();
    }

    void AdvanceMs(unsigned ms) {
        unsigned long target = now_ms_ + ms;
        while (true) {
            auto due = intervals_.end();
            for (auto it = intervals_.begin(); it != intervals_.end(); ++it)
                if (it->second.due_ms <= target &&
                    (due == intervals_.end() || it->second.due_ms < due->second.due_ms))
                    due = it;
            if (due == intervals_.end()) break;

            SourceId id = due->first;
            now_ms_ = due->second.due_ms;
            Task task = due->second.task;
            bool keep = task();

            auto it = intervals_.find(id);
            if (it == intervals_.end()) continue;
            if (keep) it->second.due_ms += it->second.period_ms;
            else      intervals_.erase(it);
        }
        now_ms_ = target;
    }

    size_t ActiveCount() const { return frames_.size() + intervals_.size(); }

private:
    struct Interval {
        unsigned      period_ms;
        unsigned long due_ms;
        Task          task;
    };

    SourceId                     next_id_ = 1;
    unsigned long                now_ms_  = 0;
    std::map<SourceId, Task>     frames_;
    std::map<SourceId, Interval> intervals_;
};

struct CaptureStats {
    int acquired  = 0;
    int stopped   = 0;
    int destroyed = 0;
};

// Sine tap with chunk injection; stop() emits a final chunk like a real encoder
class FakeCaptureHandle : public CaptureHandle {
public:
    FakeCaptureHandle(std::shared_ptr<CaptureStats> stats, float amplitude, int rate)
        : stats_(std::move(stats)), amplitude_(amplitude), rate_(rate) {}

    ~FakeCaptureHandle() override {
        on_data_    = nullptr;
        on_stopped_ = nullptr;
        stop();
        stats_->destroyed++;
    }

    void set_on_data(ChunkCallback cb) override      { on_data_ = std::move(cb); }
    void set_on_stopped(StoppedCallback cb) override { on_stopped_ = std::move(cb); }

    void stop() override {
        if (stopped_) return;
        stopped_ = true;
        stats_->stopped++;
        Emit(final_chunk);
        if (on_stopped_) on_stopped_();
    }

    bool is_active()   const override { return !stopped_ && !failed_; }
    int  sample_rate() const override { return rate_; }
    std::string mime_type() const override { return "audio/webm"; }

    void read_latest(float* out, int n) const override {
        // 32 cycles per 256 samples lands on one FFT bin
        for (int i = 0; i < n; i++)
            out[i] = amplitude_ * std::sin(2.0f * static_cast<float>(M_PI) * 32.0f * i / 256.0f);
    }

    void Emit(const std::vector<uint8_t>& chunk) {
        if (on_data_ && !chunk.empty()) on_data_(chunk);
    }

    void Fail() { failed_ = true; }

    std::vector<uint8_t> final_chunk {0xEE, 0xFF};

private:
    std::shared_ptr<CaptureStats> stats_;
    float           amplitude_;
    int             rate_;
    bool            stopped_ = false;
    bool            failed_  = false;
    ChunkCallback   on_data_;
    StoppedCallback on_stopped_;
};

class FakeCaptureSource : public CaptureSource {
public:
    explicit FakeCaptureSource(std::shared_ptr<CaptureStats> stats,
                               bool available = true, float amplitude = 0.0f,
                               int rate = 48000)
        : stats_(std::move(stats)), available_(available),
          amplitude_(amplitude), rate_(rate) {}

    std::unique_ptr<CaptureHandle> acquire() override {
        if (!available_) return nullptr;
        stats_->acquired++;
        auto handle = std::make_unique<FakeCaptureHandle>(stats_, amplitude_, rate_);
        last = handle.get();
        return handle;
    }

    FakeCaptureHandle* last = nullptr;   // valid while the session holds it

private:
    std::shared_ptr<CaptureStats> stats_;
    bool  available_;
    float amplitude_;
    int   rate_;
};

class RecordingBridge : public SubmissionBridge {
public:
    void submit(const AudioBlob& blob, int sample_rate) override {
        blobs.push_back(blob);
        sample_rates.push_back(sample_rate);
    }

    std::vector<AudioBlob> blobs;
    std::vector<int>       sample_rates;
};

} // namespace test_utils
