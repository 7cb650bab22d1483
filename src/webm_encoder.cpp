#include "webm_encoder.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mem.h>
}

#include <cstdio>
#include <cstring>

static constexpr int IO_BUFFER_SIZE = 4096;
static constexpr int OPUS_BITRATE   = 64000;
static constexpr int OPUS_FRAME     = 960;    // 20 ms at 48 kHz

static void log_av_error(const char* what, int err)
{
    char msg[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, msg, sizeof(msg));
    fprintf(stderr, "WebM encoder: %s: %s\n", what, msg);
}

/* libavformat 61 made the write callback's buffer const */
#if LIBAVFORMAT_VERSION_MAJOR >= 61
static int avio_write_cb(void* opaque, const uint8_t* buf, int size)
#else
static int avio_write_cb(void* opaque, uint8_t* buf, int size)
#endif
{
    auto* out = static_cast<std::vector<uint8_t>*>(opaque);
    out->insert(out->end(), buf, buf + size);
    return size;
}

WebmOpusEncoder::~WebmOpusEncoder() { close(); }

bool WebmOpusEncoder::open(int sample_rate, int channels)
{
    close();
    if (sample_rate <= 0 || channels <= 0) return false;

    const AVCodec *codec = avcodec_find_encoder_by_name("libopus");
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_OPUS);
    if (!codec) {
        fprintf(stderr, "WebM encoder: libavcodec has no Opus encoder\n");
        return false;
    }

    int ret = avformat_alloc_output_context2(&fmt_, nullptr, "webm", nullptr);
    if (ret < 0 || !fmt_) {
        log_av_error("webm muxer", ret);
        fmt_ = nullptr;
        return false;
    }

    codec_ = avcodec_alloc_context3(codec);
    if (!codec_) { close(); return false; }
    codec_->sample_fmt  = AV_SAMPLE_FMT_S16;
    codec_->sample_rate = sample_rate;
    codec_->bit_rate    = OPUS_BITRATE;
    codec_->time_base   = AVRational{1, sample_rate};
    av_channel_layout_default(&codec_->ch_layout, channels);
    if (fmt_->oformat->flags & AVFMT_GLOBALHEADER)
        codec_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    ret = avcodec_open2(codec_, codec, nullptr);
    if (ret < 0) {
        log_av_error(codec->name, ret);
        close();
        return false;
    }

    stream_ = avformat_new_stream(fmt_, nullptr);
    if (!stream_) { close(); return false; }
    stream_->time_base = codec_->time_base;
    ret = avcodec_parameters_from_context(stream_->codecpar, codec_);
    if (ret < 0) {
        log_av_error("stream parameters", ret);
        close();
        return false;
    }

    auto *io_buf = static_cast<unsigned char*>(av_malloc(IO_BUFFER_SIZE));
    if (!io_buf) { close(); return false; }
    fmt_->pb = avio_alloc_context(io_buf, IO_BUFFER_SIZE, 1, &written_,
                                  nullptr, avio_write_cb, nullptr);
    if (!fmt_->pb) {
        av_free(io_buf);
        close();
        return false;
    }
    fmt_->flags |= AVFMT_FLAG_CUSTOM_IO;

    /* unseekable output: no cues, no size patching */
    AVDictionary *opts = nullptr;
    av_dict_set(&opts, "live", "1", 0);
    ret = avformat_write_header(fmt_, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        log_av_error("webm header", ret);
        close();
        return false;
    }

    frame_size_ = codec_->frame_size > 0 ? codec_->frame_size : OPUS_FRAME;
    frame_ = av_frame_alloc();
    pkt_   = av_packet_alloc();
    if (!frame_ || !pkt_) { close(); return false; }
    frame_->nb_samples  = frame_size_;
    frame_->format      = codec_->sample_fmt;
    frame_->sample_rate = sample_rate;
    av_channel_layout_copy(&frame_->ch_layout, &codec_->ch_layout);
    ret = av_frame_get_buffer(frame_, 0);
    if (ret < 0) {
        log_av_error("frame buffer", ret);
        close();
        return false;
    }

    channels_ = channels;
    next_pts_ = 0;
    fprintf(stderr, "WebM/Opus encoder: %s, %d Hz, %d ch, %d-sample frames\n",
            codec->name, sample_rate, channels, frame_size_);
    return true;
}

bool WebmOpusEncoder::push(const int16_t* samples, int frames)
{
    if (!fmt_ || frames <= 0) return false;
    pending_.insert(pending_.end(), samples, samples + static_cast<size_t>(frames) * channels_);
    return encode_pending();
}

bool WebmOpusEncoder::encode_pending()
{
    const size_t per_frame = static_cast<size_t>(frame_size_) * channels_;
    size_t offset = 0;
    bool ok = true;

    while (ok && pending_.size() - offset >= per_frame) {
        int ret = av_frame_make_writable(frame_);
        if (ret < 0) {
            log_av_error("frame", ret);
            ok = false;
            break;
        }
        memcpy(frame_->data[0], pending_.data() + offset, per_frame * sizeof(int16_t));
        frame_->pts = next_pts_;
        next_pts_ += frame_size_;
        offset += per_frame;
        ok = encode(frame_);
    }

    pending_.erase(pending_.begin(), pending_.begin() + static_cast<long>(offset));
    return ok;
}

/* frame == nullptr drains the encoder */
bool WebmOpusEncoder::encode(AVFrame* frame)
{
    int ret = avcodec_send_frame(codec_, frame);
    if (ret < 0) {
        log_av_error("encode", ret);
        return false;
    }

    for (;;) {
        ret = avcodec_receive_packet(codec_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return true;
        if (ret < 0) {
            log_av_error("encode", ret);
            return false;
        }
        av_packet_rescale_ts(pkt_, codec_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;
        ret = av_interleaved_write_frame(fmt_, pkt_);
        if (ret < 0) {
            log_av_error("mux", ret);
            return false;
        }
    }
}

void WebmOpusEncoder::drain(std::vector<uint8_t>& out)
{
    if (!fmt_) return;
    avio_flush(fmt_->pb);
    out.insert(out.end(), written_.begin(), written_.end());
    written_.clear();
}

bool WebmOpusEncoder::finish(std::vector<uint8_t>& out)
{
    if (!fmt_) return false;

    /* pad the tail to a whole frame with silence */
    const size_t per_frame = static_cast<size_t>(frame_size_) * channels_;
    bool ok = true;
    if (!pending_.empty()) {
        pending_.resize(per_frame, 0);
        ok = encode_pending();
    }
    ok = encode(nullptr) && ok;

    int ret = av_write_trailer(fmt_);
    if (ret < 0) {
        log_av_error("webm trailer", ret);
        ok = false;
    }

    drain(out);
    close();
    return ok;
}

void WebmOpusEncoder::close()
{
    if (fmt_) {
        if (fmt_->pb) {
            av_freep(&fmt_->pb->buffer);
            avio_context_free(&fmt_->pb);
        }
        avformat_free_context(fmt_);
        fmt_ = nullptr;
    }
    avcodec_free_context(&codec_);
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    stream_     = nullptr;
    frame_size_ = 0;
    pending_.clear();
    written_.clear();
}
