#pragma once

/**
 * @file constants.h
 * @brief Default timing and tuning parameters
 *
 * Config structs take their defaults from here; every value can be
 * overridden from the JSON config.
 */

namespace parley {
namespace constants {

// =============================================================================
// Playback scheduling
// =============================================================================

namespace playback {
    /// Start playback once this many chunks are buffered
    constexpr int BUFFER_THRESHOLD = 2;

    /// Schedule chunks this far ahead of the device clock (s)
    constexpr double LOOKAHEAD_SECONDS = 0.1;

    /// Overlap between adjacent chunks (s)
    constexpr double CROSSFADE_SECONDS = 0.015;

    /// Delay between scheduling steps (ms)
    constexpr int SCHEDULING_INTERVAL_MS = 10;

    /// Gain floor for exponential ramps; exponential ramps are undefined at zero
    constexpr float MIN_GAIN = 0.0001f;

    /// Give up on a missing sequence number after this long (ms)
    constexpr int MAX_GAP_WAIT_MS = 1000;
}

// =============================================================================
// Recognition
// =============================================================================

namespace recognition {
    /// Synthesize a final transcript after this much silence following an interim (ms)
    constexpr int SILENCE_DURATION_MS = 1500;

    /// Re-transcribe the growing segment this often while the user speaks (ms)
    constexpr int INTERIM_INTERVAL_MS = 700;

    /// End a session with no-speech when nothing is heard for this long (ms)
    constexpr int NO_SPEECH_TIMEOUT_MS = 8000;

    /// Delay before relaunching a session that ended after an error (ms)
    constexpr int RESTART_DELAY_MS = 250;

    /// Segments shorter than this are not sent to the transcriber (ms)
    constexpr int MIN_SEGMENT_MS = 200;
}

// =============================================================================
// Synthesis
// =============================================================================

namespace synthesis {
    constexpr const char* DEFAULT_ENDPOINT = "wss://api.elevenlabs.io/v1/text-to-speech";
    constexpr const char* DEFAULT_VOICE_ID = "JBFqnCBsd6RMkjVDRZzb";
    constexpr const char* DEFAULT_MODEL_ID = "eleven_turbo_v2_5";

    /// Source rate requested through output_format=pcm_<rate>
    constexpr int DEFAULT_OUTPUT_SAMPLE_RATE = 24000;

    constexpr float DEFAULT_STABILITY = 0.5f;
    constexpr float DEFAULT_SIMILARITY_BOOST = 0.8f;

    /// Treat the stream as stalled after this long without an inbound frame (ms)
    constexpr int STALL_TIMEOUT_MS = 10000;

    /// Connect timeout for the socket handshake (ms)
    constexpr int CONNECT_TIMEOUT_MS = 5000;
}

} // namespace constants
} // namespace parley
