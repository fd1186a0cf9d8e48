/**
 * MixGraph - Audio Decoder
 */

#ifndef MIXGRAPH_DECODER_H
#define MIXGRAPH_DECODER_H

#include "mixgraph/types.h"
#include <string>
#include <memory>

namespace mixgraph {

/**
 * Audio decoder that converts various formats to uniform float PCM.
 * Supported formats: anything FFmpeg demuxes (MP3, FLAC, AAC, M4A, OGG,
 * Opus, WAV, AIFF, WebM audio).
 */
class Decoder {
public:
    Decoder();
    ~Decoder();

    // Non-copyable
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * Decode an audio file to PCM buffer.
     *
     * @param path Path to audio file
     * @param target_sample_rate Target sample rate (0 = keep original)
     * @param channels Output channel count (1 = down-mix to mono)
     * @return AudioBuffer, or MissingInput / DecodeError
     */
    Result<AudioBuffer> decode(const std::string& path, int target_sample_rate = 44100, int channels = 2);

    /**
     * Decode for fingerprinting and beat tracking: mono at the analysis rate.
     */
    Result<AudioBuffer> decode_for_analysis(const std::string& path, int sample_rate = 22050);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mixgraph

#endif // MIXGRAPH_DECODER_H
