#include "audio_chunk_decoder.h"
#include "logger.h"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace parley {

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 1;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

// Little-endian readers; callers bounds-check
uint16_t read_u16(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint32_t>(b[offset]) |
           (static_cast<uint32_t>(b[offset + 1]) << 8) |
           (static_cast<uint32_t>(b[offset + 2]) << 16) |
           (static_cast<uint32_t>(b[offset + 3]) << 24);
}

bool has_tag(const std::vector<uint8_t>& b, size_t offset, const char* tag) {
    return offset + 4 <= b.size() && std::memcmp(b.data() + offset, tag, 4) == 0;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // anonymous namespace

Result<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> out;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t accum = 0;
    int bits = 0;
    size_t padding = 0;
    size_t symbols = 0;

    for (char c : encoded) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) {
            return make_decode_error("base64: data after padding");
        }
        int v = base64_value(c);
        if (v < 0) {
            return make_decode_error(std::string("base64: illegal character '") + c + "'");
        }
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        symbols++;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    if (padding > 2 || symbols % 4 == 1) {
        return make_decode_error("base64: truncated input");
    }
    return out;
}

AudioChunkDecoder::AudioChunkDecoder(int source_sample_rate, int target_sample_rate)
    : source_sample_rate_(source_sample_rate), target_sample_rate_(target_sample_rate) {}

Result<PcmBuffer> AudioChunkDecoder::decode(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) {
        return make_decode_error("empty audio payload");
    }
    if (has_tag(bytes, 0, "RIFF")) {
        return decode_wav(bytes);
    }
    return decode_raw_pcm16(bytes);
}

Result<PcmBuffer> AudioChunkDecoder::decode_raw_pcm16(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() % 2 != 0) {
        return make_decode_error("raw PCM payload has odd byte count (" +
                                 std::to_string(bytes.size()) + ")");
    }
    if (source_sample_rate_ <= 0) {
        return make_decode_error("raw PCM payload with unknown source sample rate");
    }

    std::vector<float> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); i++) {
        int16_t s = static_cast<int16_t>(read_u16(bytes, i * 2));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }
    return finish(std::move(samples), source_sample_rate_);
}

Result<PcmBuffer> AudioChunkDecoder::decode_wav(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() < 12 || !has_tag(bytes, 8, "WAVE")) {
        return make_decode_error("RIFF payload is not WAVE");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;
    bool have_fmt = false;

    // Walk the chunk list; fmt and data may be separated by LIST/fact chunks
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        uint32_t chunk_size = read_u32(bytes, offset + 4);
        size_t body = offset + 8;

        if (has_tag(bytes, offset, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return make_decode_error("WAVE fmt chunk truncated");
            }
            format = read_u16(bytes, body);
            channels = read_u16(bytes, body + 2);
            rate = read_u32(bytes, body + 4);
            bits_per_sample = read_u16(bytes, body + 14);
            if (format == WAVE_FORMAT_EXTENSIBLE && chunk_size >= 26 && body + 26 <= bytes.size()) {
                // First two bytes of the subformat GUID carry the real format tag
                format = read_u16(bytes, body + 24);
            }
            have_fmt = true;
        } else if (has_tag(bytes, offset, "data")) {
            data_offset = body;
            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown
            data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            break;
        }

        offset = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) return make_decode_error("WAVE payload has no fmt chunk");
    if (data_offset == 0) return make_decode_error("WAVE payload has no data chunk");
    if (channels == 0 || rate == 0) return make_decode_error("WAVE fmt chunk has zero channels or rate");

    size_t bytes_per_sample = bits_per_sample / 8;
    bool pcm16 = format == WAVE_FORMAT_PCM && bits_per_sample == 16;
    bool float32 = format == WAVE_FORMAT_IEEE_FLOAT && bits_per_sample == 32;
    if (!pcm16 && !float32) {
        std::ostringstream oss;
        oss << "unsupported WAVE encoding (format " << format << ", " << bits_per_sample << " bits)";
        return make_decode_error(oss.str());
    }

    size_t frame_bytes = bytes_per_sample * channels;
    size_t frames = data_size / frame_bytes;

    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; f++) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < channels; ch++) {
            size_t pos = data_offset + f * frame_bytes + ch * bytes_per_sample;
            if (pcm16) {
                sum += static_cast<float>(static_cast<int16_t>(read_u16(bytes, pos))) / 32768.0f;
            } else {
                uint32_t raw = read_u32(bytes, pos);
                float value;
                std::memcpy(&value, &raw, sizeof(value));
                sum += value;
            }
        }
        mono[f] = sum / static_cast<float>(channels);
    }

    LOG_AUDIO("WAV chunk: " + std::to_string(rate) + "Hz, " + std::to_string(channels) +
              "ch, " + std::to_string(frames) + " frames");
    return finish(std::move(mono), static_cast<int>(rate));
}

PcmBuffer AudioChunkDecoder::finish(std::vector<float> samples, int rate) const {
    PcmBuffer buffer;
    if (target_sample_rate_ > 0 && rate != target_sample_rate_) {
        buffer.samples = resample(samples, rate, target_sample_rate_);
        buffer.sample_rate = target_sample_rate_;
    } else {
        buffer.samples = std::move(samples);
        buffer.sample_rate = rate;
    }
    return buffer;
}

std::vector<float> AudioChunkDecoder::resample(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(static_cast<double>(input.size()) / ratio);

    std::vector<float> output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        float t = static_cast<float>(input_pos - static_cast<double>(idx0));
        output.push_back(input[idx0] * (1.0f - t) + input[idx1] * t);
    }
    return output;
}

} // namespace parley
