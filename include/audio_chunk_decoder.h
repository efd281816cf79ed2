#pragma once

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Decode standard (RFC 4648) base64, ignoring whitespace
 * @return Raw bytes, or DecodeError on an illegal character or bad padding
 */
Result<std::vector<uint8_t>> base64_decode(const std::string& encoded);

/**
 * @brief Decodes transport audio bytes into playable mono float buffers
 *
 * Accepts:
 * - Raw little-endian signed 16-bit PCM, mono, at source_sample_rate
 *   (the pcm_<rate> synthesis output formats)
 * - RIFF/WAVE containers: PCM 16-bit or IEEE float 32-bit, any channel
 *   count (channels are averaged down to mono), rate taken from the header
 *
 * The result is linearly resampled to target_sample_rate when rates differ.
 * Stateless apart from its two rates; safe to copy and call concurrently.
 */
class AudioChunkDecoder {
public:
    AudioChunkDecoder(int source_sample_rate, int target_sample_rate);

    Result<PcmBuffer> decode(const std::vector<uint8_t>& bytes) const;

    int source_sample_rate() const { return source_sample_rate_; }
    int target_sample_rate() const { return target_sample_rate_; }

    /// Linear-interpolation resampler
    static std::vector<float> resample(const std::vector<float>& input, int from_rate, int to_rate);

private:
    Result<PcmBuffer> decode_wav(const std::vector<uint8_t>& bytes) const;
    Result<PcmBuffer> decode_raw_pcm16(const std::vector<uint8_t>& bytes) const;
    PcmBuffer finish(std::vector<float> samples, int rate) const;

    int source_sample_rate_;
    int target_sample_rate_;
};

} // namespace parley
