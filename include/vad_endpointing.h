#pragma once

#include "common.h"
#include "config.h"
#include <vector>
#include <memory>

namespace parley {

enum class VADEvent {
    None,
    SpeechStart,
    SpeechEnd,
    /// Silence ended a segment shorter than min_speech_ms
    SpeechDiscarded
};

/**
 * @brief Energy-based voice activity detection with endpointing
 *
 * Tracks an adaptive noise floor and moves through Silence, Speech and
 * Hangover states on 16 kHz frames. The caller owns the segment buffer
 * lifecycle: finalize_segment() after SpeechEnd or SpeechDiscarded.
 */
class VADEndpointing {
public:
    explicit VADEndpointing(const VADConfig& config);
    ~VADEndpointing();

    // Process a frame and return events
    VADEvent process(const AudioFrame& frame);

    // Get current segment buffer (since SpeechStart)
    AudioBuffer get_current_segment() const;

    // Finalize and return segment (on SpeechEnd)
    AudioBuffer finalize_segment();

    /// True between SpeechStart and the silence that ends the segment
    bool in_speech() const;

    /// Voiced audio accumulated in the current segment
    int64_t speech_ms() const;

    // Reset state
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
