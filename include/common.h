#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <optional>

namespace parley {

// Capture audio types (16-bit PCM from the microphone)
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Capture format constants (whisper expects 16 kHz mono)
constexpr int CAPTURE_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (CAPTURE_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

/// Decoded playback audio: mono float samples in [-1, 1]
struct PcmBuffer {
    std::vector<float> samples;
    int sample_rate = 0;

    size_t frames() const { return samples.size(); }
    bool empty() const { return samples.empty(); }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/// Per-character timing hints delivered alongside synthesized audio
struct Alignment {
    std::vector<std::string> chars;
    std::vector<int> char_start_times_ms;
    std::vector<int> char_durations_ms;

    bool empty() const { return chars.empty(); }
};

/// One unit of decoded synthesis audio awaiting playback
struct AudioChunk {
    uint64_t sequence = 0;
    PcmBuffer buffer;
    std::optional<Alignment> alignment;

    double duration_seconds() const { return buffer.duration_seconds(); }
};

/// Transcription of a captured segment
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;
};

} // namespace parley
