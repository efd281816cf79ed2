#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <atomic>
#include <string>
#include <memory>

namespace parley {

/**
 * @brief whisper.cpp transcriber
 *
 * The model is loaded once and shared by every recognizer instance;
 * transcribe() serializes access to the whisper context internally, so it
 * may be called from any thread.
 */
class STTEngine {
public:
    explicit STTEngine(const RecognitionConfig& config);
    ~STTEngine();

    // Non-copyable
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    /**
     * @brief Transcribe a 16 kHz mono segment
     * @param cancel When set and it becomes true, inference stops early
     * @return Transcript (text may be empty or a blank marker), or
     *         RecognitionError when the model is not loaded, inference fails
     *         or the transcription was cancelled
     */
    Result<Transcript> transcribe(const AudioBuffer& segment, const std::atomic<bool>* cancel = nullptr);

    // Check if engine is ready
    bool is_ready() const;

    /// Whisper language code for a BCP-47 tag ("en-US" -> "en")
    static std::string whisper_language(const std::string& tag);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
