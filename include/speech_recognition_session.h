#pragma once

#include "config.h"
#include "errors.h"
#include "event_loop.h"
#include "speech_recognizer.h"
#include <functional>
#include <memory>
#include <string>

namespace parley {

struct RecognitionState {
    bool is_listening = false;
    bool is_user_speaking = false;
    std::string current_transcript;
};

/**
 * @brief One microphone transcription session over one recognizer
 *
 * Interim hypotheses are forwarded as they arrive (each overwrites the
 * previous one); at most one final transcript is forwarded per session.
 * Every interim re-arms a silence watchdog: if no final arrives within
 * recognition.silence_duration_ms, the last interim is promoted to the
 * final. A session that ends with an unanswered interim promotes it
 * immediately.
 *
 * abort() detaches the session: the recognizer is torn down and no event
 * of this session fires again, not even on_ended.
 *
 * Any event handler may destroy the session.
 */
class SpeechRecognitionSession {
public:
    struct Events {
        std::function<void()> on_start;
        std::function<void(const std::string& text, bool is_final)> on_transcript;
        std::function<void(RecognitionErrorCode code, const std::string& message)> on_error;
        std::function<void()> on_ended;
    };

    SpeechRecognitionSession(EventLoop& loop, std::unique_ptr<SpeechRecognizer> recognizer,
                             const RecognitionConfig& config, Events events);
    ~SpeechRecognitionSession();

    // Non-copyable
    SpeechRecognitionSession(const SpeechRecognitionSession&) = delete;
    SpeechRecognitionSession& operator=(const SpeechRecognitionSession&) = delete;

    /// Start the recognizer; an error means the session never becomes active
    VoidResult start();

    /// Ask the recognizer to finish gracefully; on_ended still fires
    void stop();

    /// Tear down immediately and silence every later event
    void abort();

    /// Started, not aborted and not yet ended
    bool is_active() const { return started_ && !aborted_ && !ended_; }
    bool is_aborted() const { return aborted_; }
    bool has_ended() const { return ended_; }
    bool has_sent_final() const { return has_sent_final_; }
    const RecognitionState& state() const { return state_; }

private:
    void handle_start();
    void handle_results(const std::vector<RecognitionResult>& results);
    void handle_error(RecognitionErrorCode code, const std::string& message);
    void handle_end();
    void arm_watchdog();
    void cancel_watchdog();
    void on_watchdog();
    /// Forward a final transcript once; returns false if this session was destroyed
    bool send_final(const std::string& text);

    EventLoop& loop_;
    std::unique_ptr<SpeechRecognizer> recognizer_;
    RecognitionConfig config_;
    Events events_;

    RecognitionState state_;
    bool started_ = false;
    bool aborted_ = false;
    bool ended_ = false;
    bool has_sent_final_ = false;
    EventLoop::TimerId watchdog_timer_ = 0;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace parley
