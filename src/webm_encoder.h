#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct AVCodecContext;
struct AVFormatContext;
struct AVFrame;
struct AVPacket;
struct AVStream;

/* ── WebmOpusEncoder ───────────────────────────────────────────────────────
 *
 *  Encodes S16 PCM to Opus with libavcodec and muxes it into WebM with
 *  libavformat, writing through a custom AVIOContext into memory.  The
 *  muxer runs in live mode (no seeking back to patch sizes), so everything
 *  drained from open() to finish() concatenates into a complete file.
 *
 *  Not thread safe; the capture thread owns it until it is joined.
 * ──────────────────────────────────────────────────────────────────────── */

class WebmOpusEncoder {
public:
    static constexpr const char* MIME_TYPE = "audio/webm";

    WebmOpusEncoder() = default;
    ~WebmOpusEncoder();

    WebmOpusEncoder(const WebmOpusEncoder&) = delete;
    WebmOpusEncoder& operator=(const WebmOpusEncoder&) = delete;

    /* false if no Opus encoder or WebM muxer is available, or libopus
     * rejects the rate (8, 12, 16, 24 or 48 kHz only); reason logged */
    bool open(int sample_rate, int channels);
    bool is_open() const { return fmt_ != nullptr; }

    bool push(const int16_t* samples, int frames);

    /* appends whatever the muxer has written so far */
    void drain(std::vector<uint8_t>& out);

    /* pads and flushes the last frame, writes the trailer, appends the rest
     * of the output and closes */
    bool finish(std::vector<uint8_t>& out);

private:
    bool encode(AVFrame* frame);
    bool encode_pending();
    void close();

    AVFormatContext* fmt_        = nullptr;
    AVCodecContext*  codec_      = nullptr;
    AVStream*        stream_     = nullptr;
    AVFrame*         frame_      = nullptr;
    AVPacket*        pkt_        = nullptr;
    int              channels_   = 0;
    int              frame_size_ = 0;
    int64_t          next_pts_   = 0;

    std::vector<int16_t> pending_;   // samples short of a full codec frame
    std::vector<uint8_t> written_;   // muxer output not yet drained
};
