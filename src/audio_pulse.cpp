#include "audio_pulse.h"
#include "audio_backend.h"
#include "webm_encoder.h"

#include <pulse/pulseaudio.h>
#include <pulse/simple.h>
#include <pulse/error.h>
#include <glib.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <thread>

/* ── shared state between capture thread and UI thread ───────────────────
 *
 *  The capture thread only appends to `pending` and writes the analysis
 *  ring.  Chunks reach the UI thread through an idle callback that holds a
 *  weak reference, so an idle firing after the handle is gone does nothing.
 * ──────────────────────────────────────────────────────────────────────── */

static constexpr int CAPTURE_RATE     = 48000;           // Opus native rate
static constexpr int CAPTURE_CHANNELS = 1;
static constexpr int READ_FRAMES      = 1024;            // ~21 ms per read
static constexpr int FLUSH_READS      = 12;              // ~250 ms per chunk
static constexpr int RING_SIZE        = 4096;
static constexpr int POLL_MS          = 5;

bool pulse_block_ready(uint64_t buffered_usec, int block_frames, int sample_rate)
{
    if (sample_rate <= 0) return false;
    return buffered_usec * static_cast<uint64_t>(sample_rate) >=
           static_cast<uint64_t>(block_frames) * 1000000u;
}

struct PulseShared {
    std::mutex                        mutex;
    std::vector<std::vector<uint8_t>> pending;           // guarded by mutex
    bool                              idle_queued = false;
    float                             ring[RING_SIZE] = {};
    int                               ring_pos    = 0;

    /* UI thread only */
    CaptureHandle::ChunkCallback      on_data;
    bool                              delivering  = true;

    void deliver_pending() {
        std::vector<std::vector<uint8_t>> chunks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            chunks.swap(pending);
            idle_queued = false;
        }
        if (!delivering || !on_data) return;
        for (const auto& c : chunks) on_data(c);
    }
};

/* ── PulseAudio capture handle ───────────────────────────────────────── */

class PulseCaptureHandle : public CaptureHandle {
public:
    PulseCaptureHandle(pa_simple* pa, std::unique_ptr<WebmOpusEncoder> encoder,
                       const std::string& device_name)
        : pa_(pa), encoder_(std::move(encoder)), device_name_(device_name),
          shared_(std::make_shared<PulseShared>())
    {
        running_ = true;
        thread_  = std::thread(&PulseCaptureHandle::capture_loop, this);
    }

    ~PulseCaptureHandle() override {
        on_stopped_ = nullptr;
        shared_->on_data = nullptr;
        stop();
    }

    void set_on_data(ChunkCallback cb) override      { shared_->on_data = std::move(cb); }
    void set_on_stopped(StoppedCallback cb) override { on_stopped_ = std::move(cb); }

    /* The capture thread only calls pa_simple_read once the stream reports
     * a full block buffered, so the join is not held up by a suspended or
     * silent source. */
    void stop() override {
        if (stopped_) return;
        stopped_ = true;

        running_ = false;
        if (thread_.joinable()) thread_.join();

        if (pa_) { pa_simple_free(pa_); pa_ = nullptr; }
        fprintf(stderr, "PulseAudio capture closed: %s\n",
                device_name_.empty() ? "(default)" : device_name_.c_str());

        /* finalize: the encoder tail, then the stopped event */
        if (encoder_ && !encoder_->finish(partial_))
            fprintf(stderr, "WebM stream may be truncated\n");
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            if (!partial_.empty()) {
                shared_->pending.push_back(std::move(partial_));
                partial_.clear();
            }
        }
        shared_->deliver_pending();
        shared_->delivering = false;

        if (on_stopped_) on_stopped_();
    }

    bool is_active()   const override { return !stopped_ && !failed_.load(std::memory_order_relaxed); }
    int  sample_rate() const override { return CAPTURE_RATE; }
    std::string mime_type() const override { return WebmOpusEncoder::MIME_TYPE; }

    void read_latest(float* out, int n) const override {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        int count = n < RING_SIZE ? n : RING_SIZE;
        int pad   = n - count;
        for (int i = 0; i < pad; i++) out[i] = 0.0f;
        int start = (shared_->ring_pos - count + RING_SIZE) % RING_SIZE;
        for (int i = 0; i < count; i++)
            out[pad + i] = shared_->ring[(start + i) % RING_SIZE];
    }

private:
    void capture_loop();
    void queue_delivery();

    static gboolean on_idle_deliver(gpointer data);
    static void     on_idle_destroy(gpointer data);

    pa_simple*                       pa_;
    std::unique_ptr<WebmOpusEncoder> encoder_;   // capture thread until joined
    std::string                      device_name_;
    std::shared_ptr<PulseShared>     shared_;
    std::vector<uint8_t>             partial_;   // capture thread until joined

    std::thread       thread_;
    std::atomic<bool> running_ {false};
    std::atomic<bool> failed_  {false};
    bool              stopped_ = false;

    StoppedCallback   on_stopped_;
};

gboolean PulseCaptureHandle::on_idle_deliver(gpointer data)
{
    auto* weak = static_cast<std::weak_ptr<PulseShared>*>(data);
    if (auto shared = weak->lock())
        shared->deliver_pending();
    return G_SOURCE_REMOVE;
}

void PulseCaptureHandle::on_idle_destroy(gpointer data)
{
    delete static_cast<std::weak_ptr<PulseShared>*>(data);
}

/* caller must not hold shared_->mutex */
void PulseCaptureHandle::queue_delivery()
{
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->idle_queued) return;
        shared_->idle_queued = true;
    }
    g_idle_add_full(G_PRIORITY_DEFAULT_IDLE, on_idle_deliver,
                    new std::weak_ptr<PulseShared>(shared_), on_idle_destroy);
}

/* ── capture loop (dedicated thread) ─────────────────────────────────── */

void PulseCaptureHandle::capture_loop()
{
    int16_t buf[READ_FRAMES * CAPTURE_CHANNELS];
    int reads_since_flush = 0;

    while (running_.load(std::memory_order_relaxed)) {
        int pa_err = 0;

        /* only read what is already buffered, so stop() is never held up */
        pa_usec_t buffered = pa_simple_get_latency(pa_, &pa_err);
        if (buffered == static_cast<pa_usec_t>(-1)) {
            fprintf(stderr, "PulseAudio latency query failed: %s\n", pa_strerror(pa_err));
            failed_ = true;
            break;
        }
        if (!pulse_block_ready(buffered, READ_FRAMES, CAPTURE_RATE)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_MS));
            continue;
        }

        if (pa_simple_read(pa_, buf, sizeof(buf), &pa_err) < 0) {
            if (!running_.load(std::memory_order_relaxed)) break;
            fprintf(stderr, "PulseAudio read error: %s\n", pa_strerror(pa_err));
            failed_ = true;
            break;
        }

        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            for (int i = 0; i < READ_FRAMES; i++) {
                shared_->ring[shared_->ring_pos] = buf[i] / 32768.0f;
                shared_->ring_pos = (shared_->ring_pos + 1) % RING_SIZE;
            }
        }

        if (!encoder_->push(buf, READ_FRAMES)) {
            failed_ = true;
            break;
        }
        encoder_->drain(partial_);

        if (++reads_since_flush < FLUSH_READS || partial_.empty())
            continue;
        reads_since_flush = 0;
        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->pending.push_back(std::move(partial_));
            partial_.clear();
        }
        queue_delivery();
    }
}

/* ── PulseAudio capture source ───────────────────────────────────────── */

class PulseCaptureSource : public CaptureSource {
public:
    explicit PulseCaptureSource(const std::string& device_id) : device_id_(device_id) {}

    std::unique_ptr<CaptureHandle> acquire() override {
        pa_sample_spec spec{};
        spec.format   = PA_SAMPLE_S16LE;
        spec.rate     = CAPTURE_RATE;
        spec.channels = CAPTURE_CHANNELS;

        /* small fragments keep the meter responsive */
        pa_buffer_attr attr{};
        attr.maxlength = static_cast<uint32_t>(-1);
        attr.fragsize  = READ_FRAMES * CAPTURE_CHANNELS * sizeof(int16_t);
        attr.tlength   = static_cast<uint32_t>(-1);
        attr.prebuf    = static_cast<uint32_t>(-1);
        attr.minreq    = static_cast<uint32_t>(-1);

        int err = 0;
        const char* dev = device_id_.empty() ? nullptr : device_id_.c_str();
        pa_simple* pa = pa_simple_new(nullptr, "Genre Recorder", PA_STREAM_RECORD,
                                      dev, "Microphone", &spec, nullptr, &attr, &err);
        if (!pa) {
            fprintf(stderr, "PulseAudio capture open failed: %s\n", pa_strerror(err));
            return nullptr;
        }

        auto encoder = std::make_unique<WebmOpusEncoder>();
        if (!encoder->open(CAPTURE_RATE, CAPTURE_CHANNELS)) {
            pa_simple_free(pa);
            return nullptr;
        }

        fprintf(stderr, "PulseAudio capture: %s, %d Hz, s16le mono\n",
                device_id_.empty() ? "(default)" : device_id_.c_str(), CAPTURE_RATE);

        return std::make_unique<PulseCaptureHandle>(pa, std::move(encoder), device_id_);
    }

private:
    std::string device_id_;
};

/* ── Device enumeration ────────────────────────────────────────────── */

struct PulseEnumData {
    std::vector<AudioDevice> devices;
    pa_threaded_mainloop *ml;
};

static void source_info_cb(pa_context* /*ctx*/, const pa_source_info* info,
                           int eol, void* userdata)
{
    auto* data = static_cast<PulseEnumData*>(userdata);
    if (eol > 0) {
        pa_threaded_mainloop_signal(data->ml, 0);
        return;
    }
    if (!info) return;

    // Monitor sources capture playback output, not a microphone
    if (info->monitor_of_sink != PA_INVALID_INDEX)
        return;

    AudioDevice dev;
    dev.id = info->name;
    dev.description = info->description ? info->description : info->name;
    data->devices.push_back(std::move(dev));
}

static void context_state_cb(pa_context* ctx, void* userdata)
{
    auto* ml = static_cast<pa_threaded_mainloop*>(userdata);
    pa_context_state_t state = pa_context_get_state(ctx);
    if (state == PA_CONTEXT_READY || state == PA_CONTEXT_FAILED ||
        state == PA_CONTEXT_TERMINATED)
        pa_threaded_mainloop_signal(ml, 0);
}

std::vector<AudioDevice> audio_enumerate_inputs()
{
    PulseEnumData enum_data{};

    pa_threaded_mainloop* ml = pa_threaded_mainloop_new();
    if (!ml) return {};
    enum_data.ml = ml;

    pa_mainloop_api* api = pa_threaded_mainloop_get_api(ml);
    pa_context* ctx = pa_context_new(api, "Genre Recorder");
    if (!ctx) {
        pa_threaded_mainloop_free(ml);
        return {};
    }

    pa_context_set_state_callback(ctx, context_state_cb, ml);

    pa_threaded_mainloop_lock(ml);
    pa_threaded_mainloop_start(ml);

    if (pa_context_connect(ctx, nullptr, PA_CONTEXT_NOFLAGS, nullptr) < 0) {
        fprintf(stderr, "PulseAudio connect failed: %s\n",
                pa_strerror(pa_context_errno(ctx)));
        pa_context_unref(ctx);
        pa_threaded_mainloop_unlock(ml);
        pa_threaded_mainloop_stop(ml);
        pa_threaded_mainloop_free(ml);
        return {};
    }

    while (true) {
        pa_context_state_t state = pa_context_get_state(ctx);
        if (state == PA_CONTEXT_READY) break;
        if (state == PA_CONTEXT_FAILED || state == PA_CONTEXT_TERMINATED) {
            pa_context_unref(ctx);
            pa_threaded_mainloop_unlock(ml);
            pa_threaded_mainloop_stop(ml);
            pa_threaded_mainloop_free(ml);
            return {};
        }
        pa_threaded_mainloop_wait(ml);
    }

    pa_operation* op = pa_context_get_source_info_list(ctx, source_info_cb, &enum_data);
    if (op) {
        while (pa_operation_get_state(op) == PA_OPERATION_RUNNING)
            pa_threaded_mainloop_wait(ml);
        pa_operation_unref(op);
    }

    pa_context_disconnect(ctx);
    pa_context_unref(ctx);

    pa_threaded_mainloop_unlock(ml);
    pa_threaded_mainloop_stop(ml);
    pa_threaded_mainloop_free(ml);

    return enum_data.devices;
}

/* ── Factory ───────────────────────────────────────────────────────── */

std::unique_ptr<CaptureSource> audio_create_capture_source(const std::string& device_id)
{
    return std::make_unique<PulseCaptureSource>(device_id);
}
