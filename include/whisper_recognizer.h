#pragma once

#include "config.h"
#include "event_loop.h"
#include "speech_recognizer.h"
#include "stt_engine.h"
#include <memory>

namespace parley {

/**
 * @brief SpeechRecognizer over PortAudio capture, energy VAD and whisper.cpp
 *
 * A capture thread reads 20 ms frames and runs them through VADEndpointing.
 * While the user speaks, the growing segment is re-transcribed every
 * recognition.interim_interval_ms to produce interim hypotheses; SpeechEnd
 * produces the final one and ends the session. Nothing voiced for
 * recognition.no_speech_timeout_ms ends the session with a no-speech error.
 *
 * The microphone is released before the destructor returns.
 */
class WhisperRecognizer : public SpeechRecognizer {
public:
    WhisperRecognizer(EventLoop& loop, std::shared_ptr<STTEngine> engine, const Config& config);
    ~WhisperRecognizer() override;

    // Non-copyable
    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    void set_handlers(Handlers handlers) override;
    VoidResult start() override;
    void stop() override;
    void abort() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
