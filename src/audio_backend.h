#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct AudioDevice {
    std::string id;           // PulseAudio source name
    std::string description;  // human-readable description
};

/* Time-domain view of the live signal, read once per analyzer tick. */
class SignalTap {
public:
    virtual ~SignalTap() = default;
    // copies the most recent n samples (oldest first), zero-padded if fewer
    virtual void read_latest(float* out, int n) const = 0;
};

/* ── CaptureHandle ─────────────────────────────────────────────────────────
 *
 *  One live capture: device stream, analysis tap and chunked recording sink.
 *  Chunks and the stopped event are always delivered on the UI thread.
 *  stop() delivers every outstanding chunk, then fires on_stopped, and
 *  releases the device.  Destroying an unstopped handle releases it too.
 * ──────────────────────────────────────────────────────────────────────── */

class CaptureHandle : public SignalTap {
public:
    using ChunkCallback   = std::function<void(const std::vector<uint8_t>&)>;
    using StoppedCallback = std::function<void()>;

    virtual void set_on_data(ChunkCallback cb)      = 0;
    virtual void set_on_stopped(StoppedCallback cb) = 0;

    virtual void stop() = 0;
    virtual bool is_active()   const = 0;
    virtual int  sample_rate() const = 0;
    virtual std::string mime_type() const = 0;
};

class CaptureSource {
public:
    virtual ~CaptureSource() = default;
    // nullptr means the device is unavailable (reason already logged)
    virtual std::unique_ptr<CaptureHandle> acquire() = 0;
};

std::vector<AudioDevice>       audio_enumerate_inputs();
std::unique_ptr<CaptureSource> audio_create_capture_source(const std::string& device_id);
