#include "level_analyzer.h"
#include "audio_backend.h"

#include <cmath>
#include <complex>
#include <algorithm>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

/* ── radix-2 Cooley-Tukey FFT (in-place, N must be power of 2) ────────── */

static void fft_radix2(std::complex<float>* x, int N)
{
    /* bit-reversal permutation */
    for (int i = 1, j = 0; i < N; i++) {
        int bit = N >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }
    /* butterfly passes */
    for (int len = 2; len <= N; len <<= 1) {
        float ang = -2.0f * static_cast<float>(M_PI) / len;
        std::complex<float> wlen(std::cos(ang), std::sin(ang));
        for (int i = 0; i < N; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (int j = 0; j < len / 2; j++) {
                auto u = x[i + j];
                auto v = x[i + j + len / 2] * w;
                x[i + j]             = u + v;
                x[i + j + len / 2]   = u - v;
                w *= wlen;
            }
        }
    }
}

LevelAnalyzer::LevelAnalyzer(const SignalTap& tap)
    : tap_(tap)
{
    /* Blackman window, alpha = 0.16 */
    const float a0 = 0.42f, a1 = 0.5f, a2 = 0.08f;
    for (int i = 0; i < FFT_SIZE; i++) {
        float x = static_cast<float>(i) / FFT_SIZE;
        window_[i] = a0 - a1 * std::cos(2.0f * static_cast<float>(M_PI) * x)
                        + a2 * std::cos(4.0f * static_cast<float>(M_PI) * x);
    }
}

void LevelAnalyzer::get_byte_frequency_data(uint8_t* out)
{
    float samples[FFT_SIZE];
    tap_.read_latest(samples, FFT_SIZE);

    std::complex<float> fft_buf[FFT_SIZE];
    for (int i = 0; i < FFT_SIZE; i++)
        fft_buf[i] = samples[i] * window_[i];

    fft_radix2(fft_buf, FFT_SIZE);

    const float scale    = 1.0f / FFT_SIZE;
    const float db_range = MAX_DB - MIN_DB;

    for (int i = 0; i < BIN_COUNT; i++) {
        float mag = std::abs(fft_buf[i]) * scale;
        smoothed_[i] = SMOOTHING * smoothed_[i] + (1.0f - SMOOTHING) * mag;

        float byte_val = 0.0f;
        if (smoothed_[i] > 0.0f) {
            float dB = 20.0f * std::log10(smoothed_[i]);
            byte_val = 255.0f * (dB - MIN_DB) / db_range;
        }
        out[i] = static_cast<uint8_t>(std::min(255.0f, std::max(0.0f, byte_val)));
    }
}

float LevelAnalyzer::level_from_bins(const uint8_t* bins, int n)
{
    if (n <= 0) return 0.0f;
    unsigned sum = 0;
    for (int i = 0; i < n; i++) sum += bins[i];
    float average = static_cast<float>(sum) / n;
    return average / 255.0f;
}

float LevelAnalyzer::next_level()
{
    uint8_t bins[BIN_COUNT];
    get_byte_frequency_data(bins);
    return level_from_bins(bins, BIN_COUNT);
}
