#pragma once

#include "core/constants.h"
#include <string>
#include <cstdint>
#include <vector>

namespace parley {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    /// Rate the output device is opened at; decoded chunks are resampled to it
    int output_sample_rate = 24000;
};

struct VADConfig {
    float threshold = 0.5f;
    /// Consecutive speech frames required to trigger SpeechStart (reduces false start on pops)
    int start_frames_required = 2;
    int end_of_utterance_silence_ms = 1000;  // Silence duration before ending utterance
    int min_speech_ms = 200;                  // Minimum speech duration to be valid
    int hangover_ms = 200;                    // Grace period after speech end
    bool debug_log_rms_each_frame = false;    // When true, log RMS and state every frame (verbose)
};

struct RecognitionConfig {
    std::string language = "en-US";
    std::string model_path;
    std::string blank_sentinel = "[BLANK_AUDIO]";  ///< Treat this exact string (after trim) as blank
    bool use_gpu = true;
    int silence_duration_ms = constants::recognition::SILENCE_DURATION_MS;
    int interim_interval_ms = constants::recognition::INTERIM_INTERVAL_MS;
    int no_speech_timeout_ms = constants::recognition::NO_SPEECH_TIMEOUT_MS;
    int restart_delay_ms = constants::recognition::RESTART_DELAY_MS;
};

struct SynthesisConfig {
    std::string api_key;
    std::string endpoint = constants::synthesis::DEFAULT_ENDPOINT;
    std::string voice_id = constants::synthesis::DEFAULT_VOICE_ID;
    std::string model_id = constants::synthesis::DEFAULT_MODEL_ID;
    int output_sample_rate = constants::synthesis::DEFAULT_OUTPUT_SAMPLE_RATE;
    float stability = constants::synthesis::DEFAULT_STABILITY;
    float similarity_boost = constants::synthesis::DEFAULT_SIMILARITY_BOOST;
    int stall_timeout_ms = constants::synthesis::STALL_TIMEOUT_MS;  ///< 0 = no stall detection
    int connect_timeout_ms = constants::synthesis::CONNECT_TIMEOUT_MS;

    /// Full stream-input URL for the configured voice, model and output format
    std::string stream_url() const;
};

struct PlaybackConfig {
    int buffer_threshold = constants::playback::BUFFER_THRESHOLD;
    double lookahead_seconds = constants::playback::LOOKAHEAD_SECONDS;
    double crossfade_seconds = constants::playback::CROSSFADE_SECONDS;
    int scheduling_interval_ms = constants::playback::SCHEDULING_INTERVAL_MS;
    float min_gain = constants::playback::MIN_GAIN;
    int max_gap_wait_ms = constants::playback::MAX_GAP_WAIT_MS;
    float volume = 1.0f;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AudioConfig audio;
    VADConfig vad;
    RecognitionConfig recognition;
    SynthesisConfig synthesis;
    PlaybackConfig playback;
    LoggingConfig logging;

    /**
     * @brief Load config from a JSON file
     *
     * Missing keys keep their defaults; an unreadable or malformed file logs
     * a warning and yields defaults. An empty synthesis.api_key is filled
     * from the ELEVENLABS_API_KEY environment variable.
     */
    static Config load_from_file(const std::string& path);

    /// Parse config from JSON text (same rules as load_from_file)
    static Config load_from_string(const std::string& json_text);

    void save_to_file(const std::string& path) const;
};

} // namespace parley
