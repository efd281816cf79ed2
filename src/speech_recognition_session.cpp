#include "speech_recognition_session.h"
#include "logger.h"

namespace parley {

SpeechRecognitionSession::SpeechRecognitionSession(EventLoop& loop, std::unique_ptr<SpeechRecognizer> recognizer,
                                                   const RecognitionConfig& config, Events events)
    : loop_(loop), recognizer_(std::move(recognizer)), config_(config), events_(std::move(events)) {
    std::weak_ptr<bool> alive = alive_;

    // Handler copies held by the recognizer can run after this session is gone
    SpeechRecognizer::Handlers handlers;
    handlers.on_start = [this, alive]() {
        if (!alive.expired()) handle_start();
    };
    handlers.on_result = [this, alive](const std::vector<RecognitionResult>& results) {
        if (!alive.expired()) handle_results(results);
    };
    handlers.on_error = [this, alive](RecognitionErrorCode code, const std::string& message) {
        if (!alive.expired()) handle_error(code, message);
    };
    handlers.on_end = [this, alive]() {
        if (!alive.expired()) handle_end();
    };
    recognizer_->set_handlers(std::move(handlers));
}

SpeechRecognitionSession::~SpeechRecognitionSession() {
    cancel_watchdog();
    if (started_ && !aborted_ && !ended_) {
        recognizer_->abort();
    }
}

VoidResult SpeechRecognitionSession::start() {
    if (started_) {
        return make_state_error("recognition session already started");
    }
    auto result = recognizer_->start();
    if (result.is_error()) {
        LOG_RECOGNITION("Recognizer failed to start: " + result.error().message);
        return result;
    }
    started_ = true;
    LOG_RECOGNITION("Session started (language " + config_.language + ")");
    return VoidResult();
}

void SpeechRecognitionSession::stop() {
    if (!is_active()) return;
    recognizer_->stop();
}

void SpeechRecognitionSession::abort() {
    if (aborted_) return;
    aborted_ = true;
    cancel_watchdog();
    state_ = RecognitionState();
    if (started_ && !ended_) {
        recognizer_->abort();
    }
    LOG_RECOGNITION("Session aborted");
}

void SpeechRecognitionSession::handle_start() {
    if (aborted_ || ended_) return;
    state_.is_listening = true;
    auto on_start = events_.on_start;
    if (on_start) on_start();
}

void SpeechRecognitionSession::handle_results(const std::vector<RecognitionResult>& results) {
    if (aborted_ || ended_) return;

    std::string interim_transcript;
    std::string final_transcript;
    for (const auto& result : results) {
        if (result.is_final) {
            final_transcript += result.transcript;
        } else {
            interim_transcript += result.transcript;
        }
    }

    if (!final_transcript.empty()) {
        if (has_sent_final_) {
            LOG_RECOGNITION("Duplicate final transcript ignored");
            return;
        }
        cancel_watchdog();
        state_.current_transcript = final_transcript;
        send_final(final_transcript);
    } else if (!interim_transcript.empty()) {
        state_.current_transcript = interim_transcript;
        state_.is_user_speaking = true;
        std::weak_ptr<bool> alive = alive_;
        auto on_transcript = events_.on_transcript;
        if (on_transcript) on_transcript(interim_transcript, false);
        if (alive.expired() || aborted_) return;
        arm_watchdog();
    }
}

void SpeechRecognitionSession::handle_error(RecognitionErrorCode code, const std::string& message) {
    if (aborted_ || ended_) return;
    LOG_RECOGNITION(std::string("Recognizer error: ") + recognition_error_name(code) +
                    (message.empty() ? "" : " (" + message + ")"));
    auto on_error = events_.on_error;
    if (on_error) on_error(code, message);
}

void SpeechRecognitionSession::handle_end() {
    if (aborted_ || ended_) return;
    cancel_watchdog();

    // Promote a dangling interim so the turn is never lost with the session
    if (state_.is_user_speaking && !has_sent_final_ && !state_.current_transcript.empty()) {
        LOG_RECOGNITION("Session ended mid-utterance, promoting last interim");
        if (!send_final(state_.current_transcript)) return;
        if (aborted_ || ended_) return;
    }

    ended_ = true;
    state_.is_listening = false;
    state_.is_user_speaking = false;
    LOG_RECOGNITION("Session ended");
    auto on_ended = events_.on_ended;
    if (on_ended) on_ended();
}

bool SpeechRecognitionSession::send_final(const std::string& text) {
    has_sent_final_ = true;
    state_.is_user_speaking = false;

    // Copy first: the handler may destroy this session
    std::weak_ptr<bool> alive = alive_;
    auto on_transcript = events_.on_transcript;
    if (on_transcript) on_transcript(text, true);
    return !alive.expired();
}

void SpeechRecognitionSession::arm_watchdog() {
    cancel_watchdog();
    if (config_.silence_duration_ms <= 0) return;

    std::weak_ptr<bool> alive = alive_;
    watchdog_timer_ = loop_.post_delayed(config_.silence_duration_ms, [this, alive]() {
        if (alive.expired()) return;
        watchdog_timer_ = 0;
        on_watchdog();
    });
}

void SpeechRecognitionSession::cancel_watchdog() {
    if (watchdog_timer_ != 0) {
        loop_.cancel(watchdog_timer_);
        watchdog_timer_ = 0;
    }
}

void SpeechRecognitionSession::on_watchdog() {
    if (aborted_ || ended_ || !state_.is_user_speaking) return;

    state_.is_user_speaking = false;
    if (has_sent_final_) return;

    LOG_RECOGNITION("Silence timeout, sending transcript: " + state_.current_transcript);
    send_final(state_.current_transcript);
}

} // namespace parley
