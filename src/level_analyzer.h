#pragma once

#include <cstdint>

class SignalTap;

/* ── LevelAnalyzer ─────────────────────────────────────────────────────────
 *
 *  Per-frame loudness estimate:
 *    tap → Blackman window → 256-point FFT → smoothed magnitudes
 *        → dB → bytes [0,255] (128 bins) → mean / 255
 *
 *  Smoothing and the byte mapping follow the Web Audio AnalyserNode
 *  defaults (0.8, -100..-30 dB).  One analyzer belongs to one capture
 *  handle; a new recording builds a new analyzer.
 * ──────────────────────────────────────────────────────────────────────── */

class LevelAnalyzer {
public:
    static constexpr int   FFT_SIZE  = 256;
    static constexpr int   BIN_COUNT = FFT_SIZE / 2;   // 128
    static constexpr float SMOOTHING = 0.8f;
    static constexpr float MIN_DB    = -100.0f;
    static constexpr float MAX_DB    = -30.0f;

    explicit LevelAnalyzer(const SignalTap& tap);

    /* one analyzer tick: snapshot the tap and return the normalized level */
    float next_level();

    /* byte snapshot of the current signal, BIN_COUNT entries */
    void get_byte_frequency_data(uint8_t* out);

    static float level_from_bins(const uint8_t* bins, int n);

private:
    const SignalTap& tap_;
    float window_[FFT_SIZE]       = {};
    float smoothed_[BIN_COUNT]    = {};   // linear magnitudes carried between ticks
};
