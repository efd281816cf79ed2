#include "synthesis_protocol.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {
namespace synthesis {

namespace {

std::optional<Alignment> parse_alignment(const json& j) {
    if (!j.is_object()) return std::nullopt;

    Alignment alignment;
    if (j.contains("chars") && j["chars"].is_array()) {
        for (const auto& c : j["chars"]) {
            if (c.is_string()) alignment.chars.push_back(c.get<std::string>());
        }
    }
    if (j.contains("charStartTimesMs") && j["charStartTimesMs"].is_array()) {
        for (const auto& t : j["charStartTimesMs"]) {
            if (t.is_number()) alignment.char_start_times_ms.push_back(t.get<int>());
        }
    }
    if (j.contains("charDurationsMs") && j["charDurationsMs"].is_array()) {
        for (const auto& d : j["charDurationsMs"]) {
            if (d.is_number()) alignment.char_durations_ms.push_back(d.get<int>());
        }
    }
    if (alignment.empty()) return std::nullopt;
    return alignment;
}

} // anonymous namespace

std::string make_init_message(const SynthesisConfig& config) {
    json message;
    message["text"] = " ";
    message["voice_settings"]["stability"] = config.stability;
    message["voice_settings"]["similarity_boost"] = config.similarity_boost;
    message["xi-api-key"] = config.api_key;
    return message.dump();
}

std::string make_text_message(const std::string& text) {
    json message;
    message["text"] = text;
    message["try_trigger_generation"] = true;
    return message.dump();
}

std::string make_end_of_input_message() {
    json message;
    message["text"] = "";
    return message.dump();
}

Result<Frame> parse_frame(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("synthesis frame is not JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return make_parse_error("synthesis frame is not a JSON object");
    }

    Frame frame;
    if (j.contains("audio") && j["audio"].is_string() && !j["audio"].get<std::string>().empty()) {
        frame.audio_base64 = j["audio"].get<std::string>();
    }
    if (j.contains("normalizedAlignment")) {
        frame.alignment = parse_alignment(j["normalizedAlignment"]);
    }
    if (!frame.alignment && j.contains("alignment")) {
        frame.alignment = parse_alignment(j["alignment"]);
    }
    if (j.contains("isFinal") && j["isFinal"].is_boolean()) {
        frame.is_final = j["isFinal"].get<bool>();
    }
    if (j.contains("error") && !j["error"].is_null()) {
        std::string error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
        if (j.contains("message") && j["message"].is_string()) {
            error += ": " + j["message"].get<std::string>();
        }
        frame.error = error;
    }
    return frame;
}

} // namespace synthesis
} // namespace parley
