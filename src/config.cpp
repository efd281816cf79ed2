#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Apply full JSON config (all sections) into cfg.
void apply_json_to_config(parley::Config& cfg, const json& j) {
    // Audio config
    if (j.contains("audio") && j["audio"].is_object()) {
        auto& a = j["audio"];
        if (a.contains("input_device") && a["input_device"].is_string()) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device") && a["output_device"].is_string()) cfg.audio.output_device = a["output_device"];
        if (a.contains("output_sample_rate")) cfg.audio.output_sample_rate = a["output_sample_rate"];
    }

    // VAD config
    if (j.contains("vad") && j["vad"].is_object()) {
        auto& v = j["vad"];
        if (v.contains("threshold")) cfg.vad.threshold = v["threshold"];
        if (v.contains("start_frames_required")) cfg.vad.start_frames_required = v["start_frames_required"];
        if (v.contains("end_of_utterance_silence_ms"))
            cfg.vad.end_of_utterance_silence_ms = v["end_of_utterance_silence_ms"];
        if (v.contains("min_speech_ms")) cfg.vad.min_speech_ms = v["min_speech_ms"];
        if (v.contains("hangover_ms")) cfg.vad.hangover_ms = v["hangover_ms"];
        if (v.contains("debug_log_rms_each_frame")) cfg.vad.debug_log_rms_each_frame = v["debug_log_rms_each_frame"];
    }

    // Recognition config
    if (j.contains("recognition") && j["recognition"].is_object()) {
        auto& r = j["recognition"];
        if (r.contains("language") && r["language"].is_string()) cfg.recognition.language = r["language"];
        if (r.contains("model_path") && r["model_path"].is_string()) cfg.recognition.model_path = r["model_path"];
        if (r.contains("blank_sentinel") && r["blank_sentinel"].is_string()) cfg.recognition.blank_sentinel = r["blank_sentinel"];
        if (r.contains("use_gpu")) cfg.recognition.use_gpu = r["use_gpu"];
        if (r.contains("silence_duration_ms")) cfg.recognition.silence_duration_ms = r["silence_duration_ms"];
        if (r.contains("interim_interval_ms")) cfg.recognition.interim_interval_ms = r["interim_interval_ms"];
        if (r.contains("no_speech_timeout_ms")) cfg.recognition.no_speech_timeout_ms = r["no_speech_timeout_ms"];
        if (r.contains("restart_delay_ms")) cfg.recognition.restart_delay_ms = r["restart_delay_ms"];
    }

    // Synthesis config
    if (j.contains("synthesis") && j["synthesis"].is_object()) {
        auto& s = j["synthesis"];
        if (s.contains("api_key") && s["api_key"].is_string()) cfg.synthesis.api_key = s["api_key"];
        if (s.contains("endpoint") && s["endpoint"].is_string()) cfg.synthesis.endpoint = s["endpoint"];
        if (s.contains("voice_id") && s["voice_id"].is_string()) cfg.synthesis.voice_id = s["voice_id"];
        if (s.contains("model_id") && s["model_id"].is_string()) cfg.synthesis.model_id = s["model_id"];
        if (s.contains("output_sample_rate")) cfg.synthesis.output_sample_rate = s["output_sample_rate"];
        if (s.contains("stability")) cfg.synthesis.stability = s["stability"];
        if (s.contains("similarity_boost")) cfg.synthesis.similarity_boost = s["similarity_boost"];
        if (s.contains("stall_timeout_ms")) cfg.synthesis.stall_timeout_ms = s["stall_timeout_ms"];
        if (s.contains("connect_timeout_ms")) cfg.synthesis.connect_timeout_ms = s["connect_timeout_ms"];
    }

    // Playback config
    if (j.contains("playback") && j["playback"].is_object()) {
        auto& p = j["playback"];
        if (p.contains("buffer_threshold")) cfg.playback.buffer_threshold = p["buffer_threshold"];
        if (p.contains("lookahead_seconds")) cfg.playback.lookahead_seconds = p["lookahead_seconds"];
        if (p.contains("crossfade_seconds")) cfg.playback.crossfade_seconds = p["crossfade_seconds"];
        if (p.contains("scheduling_interval_ms")) cfg.playback.scheduling_interval_ms = p["scheduling_interval_ms"];
        if (p.contains("min_gain")) cfg.playback.min_gain = p["min_gain"];
        if (p.contains("max_gap_wait_ms")) cfg.playback.max_gap_wait_ms = p["max_gap_wait_ms"];
        if (p.contains("volume")) cfg.playback.volume = p["volume"];
    }

    // Logging config
    if (j.contains("logging") && j["logging"].is_object()) {
        auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"];
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"];
    }
}

/// Clamp values that would break scheduling math back to safe defaults
void sanitize(parley::Config& cfg) {
    if (cfg.playback.buffer_threshold < 1) {
        parley::Logger::warn("playback.buffer_threshold must be >= 1; using 1");
        cfg.playback.buffer_threshold = 1;
    }
    if (cfg.playback.min_gain <= 0.0f) {
        parley::Logger::warn("playback.min_gain must be > 0; using default");
        cfg.playback.min_gain = parley::constants::playback::MIN_GAIN;
    }
    if (cfg.playback.crossfade_seconds < 0.0) cfg.playback.crossfade_seconds = 0.0;
    if (cfg.playback.lookahead_seconds < 0.0) cfg.playback.lookahead_seconds = 0.0;
    if (cfg.playback.scheduling_interval_ms < 1) cfg.playback.scheduling_interval_ms = 1;
    if (cfg.synthesis.output_sample_rate <= 0) {
        cfg.synthesis.output_sample_rate = parley::constants::synthesis::DEFAULT_OUTPUT_SAMPLE_RATE;
    }
    if (cfg.audio.output_sample_rate <= 0) {
        cfg.audio.output_sample_rate = cfg.synthesis.output_sample_rate;
    }
}

void finish_loading(parley::Config& cfg) {
    sanitize(cfg);
    if (cfg.synthesis.api_key.empty()) {
        const char* env_key = std::getenv("ELEVENLABS_API_KEY");
        if (env_key && *env_key) {
            cfg.synthesis.api_key = env_key;
        }
    }
    if (cfg.recognition.model_path.empty())
        cfg.recognition.model_path = parley::default_whisper_model_path();
    else
        cfg.recognition.model_path = parley::expand_path(cfg.recognition.model_path);
    if (!cfg.logging.file.empty()) cfg.logging.file = parley::expand_path(cfg.logging.file);
}

} // anonymous namespace

namespace parley {

std::string SynthesisConfig::stream_url() const {
    std::ostringstream oss;
    oss << endpoint;
    if (!endpoint.empty() && endpoint.back() != '/') oss << '/';
    oss << voice_id << "/stream-input?model_id=" << model_id
        << "&output_format=pcm_" << output_sample_rate
        << "&optimize_streaming_latency=0";
    return oss.str();
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        finish_loading(cfg);
        return cfg;
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        cfg = Config();
    }

    finish_loading(cfg);
    return cfg;
}

Config Config::load_from_string(const std::string& json_text) {
    Config cfg;
    try {
        apply_json_to_config(cfg, json::parse(json_text));
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        cfg = Config();
    }
    finish_loading(cfg);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["output_sample_rate"] = audio.output_sample_rate;

    j["vad"]["threshold"] = vad.threshold;
    j["vad"]["start_frames_required"] = vad.start_frames_required;
    j["vad"]["end_of_utterance_silence_ms"] = vad.end_of_utterance_silence_ms;
    j["vad"]["min_speech_ms"] = vad.min_speech_ms;
    j["vad"]["hangover_ms"] = vad.hangover_ms;
    j["vad"]["debug_log_rms_each_frame"] = vad.debug_log_rms_each_frame;

    j["recognition"]["language"] = recognition.language;
    j["recognition"]["model_path"] = recognition.model_path;
    j["recognition"]["blank_sentinel"] = recognition.blank_sentinel;
    j["recognition"]["use_gpu"] = recognition.use_gpu;
    j["recognition"]["silence_duration_ms"] = recognition.silence_duration_ms;
    j["recognition"]["interim_interval_ms"] = recognition.interim_interval_ms;
    j["recognition"]["no_speech_timeout_ms"] = recognition.no_speech_timeout_ms;
    j["recognition"]["restart_delay_ms"] = recognition.restart_delay_ms;

    // The API key is never written back; it belongs in the environment
    j["synthesis"]["endpoint"] = synthesis.endpoint;
    j["synthesis"]["voice_id"] = synthesis.voice_id;
    j["synthesis"]["model_id"] = synthesis.model_id;
    j["synthesis"]["output_sample_rate"] = synthesis.output_sample_rate;
    j["synthesis"]["stability"] = synthesis.stability;
    j["synthesis"]["similarity_boost"] = synthesis.similarity_boost;
    j["synthesis"]["stall_timeout_ms"] = synthesis.stall_timeout_ms;
    j["synthesis"]["connect_timeout_ms"] = synthesis.connect_timeout_ms;

    j["playback"]["buffer_threshold"] = playback.buffer_threshold;
    j["playback"]["lookahead_seconds"] = playback.lookahead_seconds;
    j["playback"]["crossfade_seconds"] = playback.crossfade_seconds;
    j["playback"]["scheduling_interval_ms"] = playback.scheduling_interval_ms;
    j["playback"]["min_gain"] = playback.min_gain;
    j["playback"]["max_gap_wait_ms"] = playback.max_gap_wait_ms;
    j["playback"]["volume"] = playback.volume;

    j["logging"]["level"] = logging.level;
    if (!logging.file.empty()) j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not write config file: " + path);
        return;
    }
    file << j.dump(2);
}

} // namespace parley
