#include "whisper_recognizer.h"
#include "audio_io.h"
#include "logger.h"
#include "utils.h"
#include "vad_endpointing.h"
#include <atomic>
#include <sstream>
#include <thread>

namespace parley {

class WhisperRecognizer::Impl {
public:
    Impl(EventLoop& loop, std::shared_ptr<STTEngine> engine, const Config& config)
        : loop_(loop), engine_(std::move(engine)), config_(config), vad_(config.vad) {}

    ~Impl() {
        abort();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void set_handlers(Handlers handlers) {
        handlers_ = std::move(handlers);
    }

    VoidResult start() {
        if (started_) {
            return make_state_error("recognizer instances cannot be restarted");
        }
        if (!engine_ || !engine_->is_ready()) {
            return make_recognition_error("whisper model not loaded: " + config_.recognition.model_path);
        }
        started_ = true;
        running_ = true;
        thread_ = std::thread([this]() { run(); });
        return VoidResult();
    }

    void stop() {
        stop_requested_ = true;
    }

    void abort() {
        aborted_ = true;
        running_ = false;
    }

private:
    using Emit = std::function<void(Handlers&)>;

    /// Deliver on the loop thread; dropped once aborted or destroyed
    void emit(Emit fn) {
        std::weak_ptr<bool> alive = alive_;
        loop_.post([this, alive, fn]() {
            if (alive.expired() || aborted_) return;
            // Handlers may destroy this recognizer; run them from a copy
            Handlers handlers = handlers_;
            fn(handlers);
        });
    }

    void emit_result(const Transcript& transcript, bool is_final) {
        RecognitionResult result{transcript.text, transcript.confidence, is_final};
        emit([result](Handlers& h) {
            if (h.on_result) h.on_result({result});
        });
    }

    void emit_error(RecognitionErrorCode code, const std::string& message) {
        emit([code, message](Handlers& h) {
            if (h.on_error) h.on_error(code, message);
        });
    }

    /// Transcribe and drop blank/noise output; nullopt when nothing usable
    std::optional<Transcript> transcribe(const AudioBuffer& segment) {
        int64_t segment_ms = static_cast<int64_t>(segment.size()) * 1000 / CAPTURE_SAMPLE_RATE;
        if (segment_ms < constants::recognition::MIN_SEGMENT_MS) return std::nullopt;

        // abort() cuts a running inference short so the destructor's join is prompt
        auto result = engine_->transcribe(segment, &aborted_);
        if (result.is_error()) {
            LOG_STT("Transcription failed: " + result.error().message);
            return std::nullopt;
        }
        const Transcript& transcript = result.value();
        if (utils::is_blank_transcript(transcript.text, config_.recognition.blank_sentinel)) {
            return std::nullopt;
        }

        std::ostringstream oss;
        oss << "\"" << transcript.text << "\" (" << segment_ms << "ms audio, "
            << transcript.processing_ms << "ms, conf=" << transcript.confidence << ")";
        LOG_STT(oss.str());
        return transcript;
    }

    void run() {
        auto opened = capture_.start(config_.audio.input_device);
        if (opened.is_error()) {
            LOG_ERROR("Recognizer capture failed: " + opened.error().message);
            emit_error(RecognitionErrorCode::AudioCapture, opened.error().message);
            emit([](Handlers& h) { if (h.on_end) h.on_end(); });
            return;
        }

        emit([](Handlers& h) { if (h.on_start) h.on_start(); });

        TimePoint last_activity = std::chrono::steady_clock::now();
        TimePoint last_interim = last_activity;
        AudioFrame frame;

        while (running_) {
            if (!capture_.read_frame(frame)) {
                if (running_) {
                    emit_error(RecognitionErrorCode::AudioCapture, "microphone read failed");
                }
                break;
            }

            VADEvent event = vad_.process(frame);

            if (event == VADEvent::SpeechStart) {
                last_interim = std::chrono::steady_clock::now();
            } else if (event == VADEvent::SpeechDiscarded) {
                vad_.finalize_segment();
                last_activity = std::chrono::steady_clock::now();
            } else if (event == VADEvent::SpeechEnd) {
                last_activity = std::chrono::steady_clock::now();
                auto final_transcript = transcribe(vad_.finalize_segment());
                if (final_transcript && running_) {
                    emit_result(*final_transcript, true);
                    break;
                }
                continue;
            }

            if (vad_.in_speech()) {
                last_activity = std::chrono::steady_clock::now();

                if (stop_requested_) {
                    // Graceful stop mid-utterance: commit what was heard so far
                    auto final_transcript = transcribe(vad_.finalize_segment());
                    if (final_transcript && running_) emit_result(*final_transcript, true);
                    break;
                }

                if (ms_since(last_interim) >= config_.recognition.interim_interval_ms) {
                    last_interim = std::chrono::steady_clock::now();
                    auto interim = transcribe(vad_.get_current_segment());
                    if (interim && running_) emit_result(*interim, false);
                }
            } else {
                if (stop_requested_) break;

                if (config_.recognition.no_speech_timeout_ms > 0 &&
                    ms_since(last_activity) >= config_.recognition.no_speech_timeout_ms) {
                    emit_error(RecognitionErrorCode::NoSpeech,
                               "no speech detected for " +
                               std::to_string(config_.recognition.no_speech_timeout_ms) + "ms");
                    break;
                }
            }
        }

        capture_.stop();
        emit([](Handlers& h) { if (h.on_end) h.on_end(); });
    }

    EventLoop& loop_;
    std::shared_ptr<STTEngine> engine_;
    Config config_;
    VADEndpointing vad_;
    AudioCapture capture_;
    Handlers handlers_;

    std::thread thread_;
    bool started_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> aborted_{false};

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

WhisperRecognizer::WhisperRecognizer(EventLoop& loop, std::shared_ptr<STTEngine> engine, const Config& config)
    : pimpl_(std::make_unique<Impl>(loop, std::move(engine), config)) {}

WhisperRecognizer::~WhisperRecognizer() = default;

void WhisperRecognizer::set_handlers(Handlers handlers) {
    pimpl_->set_handlers(std::move(handlers));
}

VoidResult WhisperRecognizer::start() {
    return pimpl_->start();
}

void WhisperRecognizer::stop() {
    pimpl_->stop();
}

void WhisperRecognizer::abort() {
    pimpl_->abort();
}

} // namespace parley
