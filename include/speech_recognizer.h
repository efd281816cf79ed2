#pragma once

#include "errors.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {

/// One hypothesis for one speech segment
struct RecognitionResult {
    std::string transcript;
    float confidence = 0.0f;
    bool is_final = false;
};

enum class RecognitionErrorCode {
    NoSpeech,
    Aborted,
    AudioCapture,
    Network,
    NotAllowed,
    ServiceNotAllowed,
    BadGrammar,
    LanguageNotSupported
};

inline const char* recognition_error_name(RecognitionErrorCode code) {
    switch (code) {
        case RecognitionErrorCode::NoSpeech: return "no-speech";
        case RecognitionErrorCode::Aborted: return "aborted";
        case RecognitionErrorCode::AudioCapture: return "audio-capture";
        case RecognitionErrorCode::Network: return "network";
        case RecognitionErrorCode::NotAllowed: return "not-allowed";
        case RecognitionErrorCode::ServiceNotAllowed: return "service-not-allowed";
        case RecognitionErrorCode::BadGrammar: return "bad-grammar";
        case RecognitionErrorCode::LanguageNotSupported: return "language-not-supported";
        default: return "unknown";
    }
}

/**
 * @brief One-shot continuous speech recognizer
 *
 * Lifecycle: start() once; the recognizer then raises on_start, any number
 * of on_result and on_error events, and exactly one on_end, unless abort()
 * was called, after which no handler fires at all. An instance is never
 * restarted; callers construct a fresh one.
 *
 * on_result carries the full result list of the session so far (interim
 * entries have is_final=false).
 *
 * Implementations invoke handlers on the event loop thread.
 */
class SpeechRecognizer {
public:
    struct Handlers {
        std::function<void()> on_start;
        std::function<void(const std::vector<RecognitionResult>&)> on_result;
        std::function<void(RecognitionErrorCode, const std::string&)> on_error;
        std::function<void()> on_end;
    };

    virtual ~SpeechRecognizer() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    /// Begin capturing; an error here means no event will ever fire
    virtual VoidResult start() = 0;

    /// Finish the current segment gracefully; on_end still fires
    virtual void stop() = 0;

    /// Tear down immediately; no further handler fires
    virtual void abort() = 0;
};

/// Constructs a fresh recognizer for every session
using RecognizerFactory = std::function<std::unique_ptr<SpeechRecognizer>()>;

} // namespace parley
