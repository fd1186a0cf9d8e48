/**
 * MixGraph - Audio Decoder Implementation
 *
 * Uses FFmpeg for decoding various audio formats.
 */

#include "decoder.h"
#include "../core/utils.h"
#include "../core/log.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

#include <cstring>

namespace mixgraph {

class Decoder::Impl {
public:
    Impl() = default;
    ~Impl() = default;

    Result<AudioBuffer> decode(const std::string& path, int target_sample_rate, int channels) {
        if (!utils::file_exists(path)) {
            return ResultError{ErrorCode::MissingInput, "File not found: " + path};
        }

        AVFormatContext* format_ctx = nullptr;
        AVCodecContext* codec_ctx = nullptr;
        SwrContext* swr_ctx = nullptr;
        AVPacket* packet = nullptr;
        AVFrame* frame = nullptr;

        AudioBuffer buffer;
        buffer.channels = channels == 1 ? 1 : 2;

        // Cleanup helper
        auto cleanup = [&]() {
            if (frame) av_frame_free(&frame);
            if (packet) av_packet_free(&packet);
            if (swr_ctx) swr_free(&swr_ctx);
            if (codec_ctx) avcodec_free_context(&codec_ctx);
            if (format_ctx) avformat_close_input(&format_ctx);
        };

        auto fail = [&](const std::string& message) -> Result<AudioBuffer> {
            cleanup();
            return ResultError{ErrorCode::DecodeError, message + ": " + path};
        };

        // Open file
        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            return fail("Failed to open file");
        }

        // Find stream info
        ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            return fail("Failed to find stream info");
        }

        // Find audio stream
        int audio_stream_idx = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (audio_stream_idx < 0) {
            return fail("No audio stream found");
        }

        AVStream* audio_stream = format_ctx->streams[audio_stream_idx];
        AVCodecParameters* codecpar = audio_stream->codecpar;

        // Find decoder
        const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
        if (!codec) {
            return fail("Unsupported codec");
        }

        // Allocate codec context
        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            return fail("Failed to allocate codec context");
        }

        ret = avcodec_parameters_to_context(codec_ctx, codecpar);
        if (ret < 0) {
            return fail("Failed to copy codec parameters");
        }

        // Open codec
        ret = avcodec_open2(codec_ctx, codec, nullptr);
        if (ret < 0) {
            return fail("Failed to open codec");
        }

        int in_sample_rate = codec_ctx->sample_rate > 0 ? codec_ctx->sample_rate : 44100;
        buffer.sample_rate = target_sample_rate > 0 ? target_sample_rate : in_sample_rate;

        // Setup resampler
        AVChannelLayout out_ch_layout;
        av_channel_layout_default(&out_ch_layout, buffer.channels);
        AVChannelLayout in_ch_layout;

        if (codec_ctx->ch_layout.nb_channels > 0) {
            av_channel_layout_copy(&in_ch_layout, &codec_ctx->ch_layout);
        } else {
            av_channel_layout_default(&in_ch_layout, codecpar->ch_layout.nb_channels > 0 ?
                codecpar->ch_layout.nb_channels : 2);
        }

        ret = swr_alloc_set_opts2(&swr_ctx,
            &out_ch_layout,
            AV_SAMPLE_FMT_FLT,
            buffer.sample_rate,
            &in_ch_layout,
            codec_ctx->sample_fmt,
            in_sample_rate,
            0, nullptr);
        av_channel_layout_uninit(&in_ch_layout);

        if (ret < 0 || !swr_ctx) {
            return fail("Failed to create resampler");
        }

        ret = swr_init(swr_ctx);
        if (ret < 0) {
            return fail("Failed to initialize resampler");
        }

        // Allocate packet and frame
        packet = av_packet_alloc();
        frame = av_frame_alloc();
        if (!packet || !frame) {
            return fail("Failed to allocate packet/frame");
        }

        // Estimate output size and reserve
        if (format_ctx->duration > 0) {
            int64_t duration_samples = av_rescale_q(format_ctx->duration,
                AV_TIME_BASE_Q, {1, buffer.sample_rate});
            buffer.samples.reserve(duration_samples * buffer.channels);
        }

        // Resample one decoded frame (or flush with nullptr) into the buffer
        auto append_converted = [&](const uint8_t** input, int input_samples) {
            int out_samples = static_cast<int>(av_rescale_rnd(
                swr_get_delay(swr_ctx, in_sample_rate) + input_samples,
                buffer.sample_rate, in_sample_rate, AV_ROUND_UP));
            if (out_samples <= 0) return;

            std::vector<float> out_buffer(static_cast<size_t>(out_samples) * buffer.channels);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out_buffer.data());

            int converted = swr_convert(swr_ctx, &out_ptr, out_samples, input, input_samples);
            if (converted > 0) {
                buffer.samples.insert(buffer.samples.end(),
                    out_buffer.begin(),
                    out_buffer.begin() + static_cast<size_t>(converted) * buffer.channels);
            }
        };

        auto drain_frames = [&]() {
            while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
                append_converted(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
                av_frame_unref(frame);
            }
        };

        // Decode loop
        while (av_read_frame(format_ctx, packet) >= 0) {
            if (packet->stream_index == audio_stream_idx) {
                if (avcodec_send_packet(codec_ctx, packet) >= 0) {
                    drain_frames();
                }
            }
            av_packet_unref(packet);
        }

        // Flush decoder
        avcodec_send_packet(codec_ctx, nullptr);
        drain_frames();

        // Flush resampler
        append_converted(nullptr, 0);

        cleanup();

        if (buffer.samples.empty()) {
            return ResultError{ErrorCode::DecodeError, "No audio data decoded: " + path};
        }

        log::debug("decoded {} ({:.2f}s @ {} Hz)", path, buffer.duration_seconds(), buffer.sample_rate);
        return buffer;
    }
};

Decoder::Decoder() : impl_(std::make_unique<Impl>()) {}
Decoder::~Decoder() = default;

Result<AudioBuffer> Decoder::decode(const std::string& path, int target_sample_rate, int channels) {
    return impl_->decode(path, target_sample_rate, channels);
}

Result<AudioBuffer> Decoder::decode_for_analysis(const std::string& path, int sample_rate) {
    return impl_->decode(path, sample_rate, 1);
}

} // namespace mixgraph
