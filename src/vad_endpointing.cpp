#include "vad_endpointing.h"
#include "common.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace parley {

namespace {

constexpr float NOISE_FLOOR_MIN = 0.005f;
constexpr float NOISE_FLOOR_MAX = 0.25f;

/// Frame RMS on a [-1, 1] scale
float frame_rms(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;
    float sum_sq = 0.0f;
    for (Sample s : frame) {
        float v = static_cast<float>(s) / 32768.0f;
        sum_sq += v * v;
    }
    return std::sqrt(sum_sq / frame.size());
}

int64_t ms_to_samples(int ms) {
    return static_cast<int64_t>(ms) * CAPTURE_SAMPLE_RATE / 1000;
}

int64_t samples_to_ms(int64_t samples) {
    return samples * 1000 / CAPTURE_SAMPLE_RATE;
}

} // anonymous namespace

class VADEndpointing::Impl {
public:
    explicit Impl(const VADConfig& config)
        : config_(config),
          min_speech_samples_(ms_to_samples(config.min_speech_ms)),
          end_silence_samples_(ms_to_samples(config.end_of_utterance_silence_ms)),
          max_hangover_samples_(ms_to_samples(config.hangover_ms)),
          start_frames_required_(std::max(1, config.start_frames_required)),
          noise_floor_(config.threshold * 0.3f) {}

    VADEvent process(const AudioFrame& frame) {
        float rms = frame_rms(frame);
        track_noise_floor(rms);
        Levels levels = levels_for(rms);

        if (config_.debug_log_rms_each_frame) {
            std::ostringstream oss;
            oss << "rms=" << rms << " noise_floor=" << noise_floor_
                << " start_thr=" << levels.start_threshold << " end_thr=" << levels.end_threshold
                << " state=" << mode_name(mode_);
            LOG_VAD(oss.str());
        }

        switch (mode_) {
            case Mode::Silence: return on_silence(frame, rms, levels);
            case Mode::Speech: return on_speech(frame, rms, levels);
            case Mode::Hangover: on_hangover(frame, levels); break;
        }
        return VADEvent::None;
    }

    AudioBuffer current_segment() const { return segment_; }

    AudioBuffer take_segment() {
        AudioBuffer taken = std::move(segment_);
        segment_.clear();
        return taken;
    }

    bool in_speech() const { return mode_ == Mode::Speech; }

    int64_t speech_ms() const { return samples_to_ms(voiced_samples_); }

    void reset() {
        mode_ = Mode::Silence;
        voiced_samples_ = 0;
        silent_samples_ = 0;
        hangover_samples_ = 0;
        hot_frames_ = 0;
        samples_since_report_ = 0;
        segment_.clear();
    }

private:
    enum class Mode { Silence, Speech, Hangover };

    /// Thresholds adjusted to the current noise floor
    struct Levels {
        float start_threshold;
        float end_threshold;
        bool above_start;
        bool above_end;
        bool clear_speech;  ///< Loud enough to reset the end-of-utterance silence count
    };

    static const char* mode_name(Mode mode) {
        switch (mode) {
            case Mode::Silence: return "Silence";
            case Mode::Speech: return "Speech";
            case Mode::Hangover: return "Hangover";
        }
        return "Unknown";
    }

    Levels levels_for(float rms) const {
        Levels levels;
        levels.start_threshold = std::max(config_.threshold, noise_floor_ * 2.0f + 0.02f);
        levels.end_threshold = std::max(config_.threshold * 0.5f, noise_floor_ * 1.3f + 0.01f);
        float reset_threshold = std::max(levels.end_threshold, noise_floor_ * 2.0f + 0.03f);
        levels.above_start = rms > levels.start_threshold;
        levels.above_end = rms > levels.end_threshold;
        levels.clear_speech = rms > reset_threshold;
        return levels;
    }

    void append(const AudioFrame& frame) {
        segment_.insert(segment_.end(), frame.begin(), frame.end());
    }

    // Debounced: start_frames_required hot frames in a row open a segment, so pops don't
    VADEvent on_silence(const AudioFrame& frame, float rms, const Levels& levels) {
        if (!levels.above_start) {
            hot_frames_ = 0;
            return VADEvent::None;
        }
        if (++hot_frames_ < start_frames_required_) {
            return VADEvent::None;
        }

        mode_ = Mode::Speech;
        hot_frames_ = 0;
        voiced_samples_ = static_cast<int64_t>(frame.size());
        silent_samples_ = 0;
        samples_since_report_ = 0;
        segment_.clear();
        append(frame);

        std::ostringstream oss;
        oss << "SpeechStart rms=" << rms << " threshold=" << levels.start_threshold;
        LOG_VAD(oss.str());
        return VADEvent::SpeechStart;
    }

    VADEvent on_speech(const AudioFrame& frame, float rms, const Levels& levels) {
        append(frame);
        samples_since_report_ += static_cast<int64_t>(frame.size());

        if (levels.clear_speech) {
            voiced_samples_ += static_cast<int64_t>(frame.size());
            silent_samples_ = 0;
        } else {
            // Breathing and small bumps count toward the silence that ends the utterance
            silent_samples_ += static_cast<int64_t>(frame.size());
            if (silent_samples_ >= end_silence_samples_) {
                mode_ = Mode::Hangover;
                hangover_samples_ = 0;
                VADEvent event = voiced_samples_ >= min_speech_samples_ ? VADEvent::SpeechEnd
                                                                        : VADEvent::SpeechDiscarded;
                std::ostringstream oss;
                oss << (event == VADEvent::SpeechEnd ? "SpeechEnd" : "SpeechDiscarded")
                    << " rms=" << rms << " end_thr=" << levels.end_threshold
                    << " silence_ms=" << samples_to_ms(silent_samples_)
                    << " speech_ms=" << samples_to_ms(voiced_samples_);
                LOG_VAD(oss.str());
                return event;
            }
        }

        // Progress line every half second of speech
        if (samples_since_report_ >= CAPTURE_SAMPLE_RATE / 2) {
            samples_since_report_ = 0;
            std::ostringstream oss;
            oss << "state=Speech rms=" << rms << " clear_speech=" << (levels.clear_speech ? 1 : 0)
                << " silence_ms=" << samples_to_ms(silent_samples_)
                << " speech_ms=" << samples_to_ms(voiced_samples_);
            LOG_VAD(oss.str());
        }
        return VADEvent::None;
    }

    void on_hangover(const AudioFrame& frame, const Levels& levels) {
        hangover_samples_ += static_cast<int64_t>(frame.size());

        // Speech resumes only into a segment the caller has not taken yet
        if (levels.above_end && !segment_.empty()) {
            mode_ = Mode::Speech;
            append(frame);
            voiced_samples_ += static_cast<int64_t>(frame.size());
            silent_samples_ = 0;
            hangover_samples_ = 0;
            return;
        }
        if (hangover_samples_ >= max_hangover_samples_) {
            mode_ = Mode::Silence;
            voiced_samples_ = 0;
            silent_samples_ = 0;
            samples_since_report_ = 0;
        }
    }

    // Fast adaptation in silence; during speech only quiet frames (likely ambient) nudge it
    void track_noise_floor(float rms) {
        if (mode_ == Mode::Silence) {
            if (!noise_floor_seeded_) {
                noise_floor_ = rms;
                noise_floor_seeded_ = true;
            } else {
                noise_floor_ = 0.92f * noise_floor_ + 0.08f * rms;
            }
        } else if (mode_ == Mode::Speech && rms <= noise_floor_ * 1.5f + 0.02f) {
            noise_floor_ = 0.995f * noise_floor_ + 0.005f * std::max(rms, NOISE_FLOOR_MIN);
        } else {
            return;
        }
        noise_floor_ = std::clamp(noise_floor_, NOISE_FLOOR_MIN, NOISE_FLOOR_MAX);
    }

    VADConfig config_;
    const int64_t min_speech_samples_;
    const int64_t end_silence_samples_;
    const int64_t max_hangover_samples_;
    const int start_frames_required_;

    Mode mode_ = Mode::Silence;
    int hot_frames_ = 0;
    int64_t voiced_samples_ = 0;
    int64_t silent_samples_ = 0;
    int64_t hangover_samples_ = 0;
    int64_t samples_since_report_ = 0;
    AudioBuffer segment_;

    float noise_floor_;
    bool noise_floor_seeded_ = false;
};

VADEndpointing::VADEndpointing(const VADConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

VADEndpointing::~VADEndpointing() = default;

VADEvent VADEndpointing::process(const AudioFrame& frame) {
    return pimpl_->process(frame);
}

AudioBuffer VADEndpointing::get_current_segment() const {
    return pimpl_->current_segment();
}

AudioBuffer VADEndpointing::finalize_segment() {
    return pimpl_->take_segment();
}

bool VADEndpointing::in_speech() const {
    return pimpl_->in_speech();
}

int64_t VADEndpointing::speech_ms() const {
    return pimpl_->speech_ms();
}

void VADEndpointing::reset() {
    pimpl_->reset();
}

} // namespace parley
