#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <optional>
#include <string>

namespace parley {
namespace synthesis {

/// One inbound message of the stream-input protocol
struct Frame {
    std::optional<std::string> audio_base64;
    /// normalizedAlignment when present, otherwise alignment
    std::optional<Alignment> alignment;
    bool is_final = false;
    /// Server-reported failure ("error"/"message" keys)
    std::optional<std::string> error;
};

/**
 * @brief First message: opens the stream with voice settings and credentials
 *
 * {"text": " ", "voice_settings": {...}, "xi-api-key": "..."}
 */
std::string make_init_message(const SynthesisConfig& config);

/// {"text": "...", "try_trigger_generation": true}
std::string make_text_message(const std::string& text);

/// {"text": ""} marks the end of input
std::string make_end_of_input_message();

/**
 * @brief Parse one inbound text frame
 * @return ParseError on malformed JSON or a non-object payload
 */
Result<Frame> parse_frame(const std::string& payload);

} // namespace synthesis
} // namespace parley
