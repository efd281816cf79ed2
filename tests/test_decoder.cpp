/**
 * Transport audio decoding: base64, raw PCM, WAV containers, resampling,
 * and parsing of synthesis protocol frames.
 *
 * Run from build dir: ./test_decoder
 */

#include "audio_chunk_decoder.h"
#include "config.h"
#include "logger.h"
#include "synthesis_protocol.h"
#include "test_support.h"
#include <cstring>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace parley;
using parley::testing::base64_encode;
using parley::testing::pcm16_bytes;

namespace {

void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    for (int i = 0; i < 4; i++) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void put_tag(std::vector<uint8_t>& b, const char* tag) {
    b.insert(b.end(), tag, tag + 4);
}

std::vector<uint8_t> make_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                              const std::vector<uint8_t>& data, bool with_list_chunk = false) {
    std::vector<uint8_t> b;
    put_tag(b, "RIFF");
    put_u32(b, 0);  // size is not checked
    put_tag(b, "WAVE");
    put_tag(b, "fmt ");
    put_u32(b, 16);
    put_u16(b, format);
    put_u16(b, channels);
    put_u32(b, rate);
    put_u32(b, rate * channels * bits / 8);
    put_u16(b, static_cast<uint16_t>(channels * bits / 8));
    put_u16(b, bits);
    if (with_list_chunk) {
        put_tag(b, "LIST");
        put_u32(b, 3);  // odd size is padded to even
        b.push_back('a');
        b.push_back('b');
        b.push_back('c');
        b.push_back(0);
    }
    put_tag(b, "data");
    put_u32(b, static_cast<uint32_t>(data.size()));
    b.insert(b.end(), data.begin(), data.end());
    return b;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- base64 ---
    {
        auto hello = base64_decode("aGVsbG8=");
        ASSERT(hello.is_ok());
        ASSERT(std::string(hello.value().begin(), hello.value().end()) == "hello");

        auto spaced = base64_decode(" aGVs\nbG8h ");
        ASSERT(spaced.is_ok());
        ASSERT(std::string(spaced.value().begin(), spaced.value().end()) == "hello!");

        auto unpadded = base64_decode("aGk");
        ASSERT(unpadded.is_ok());
        ASSERT(std::string(unpadded.value().begin(), unpadded.value().end()) == "hi");

        auto url_safe = base64_decode("-_8=");
        ASSERT(url_safe.is_ok());
        ASSERT(url_safe.value().size() == 2);
        ASSERT(url_safe.value()[0] == 0xFB);
        ASSERT(url_safe.value()[1] == 0xFF);

        ASSERT(base64_decode("").is_ok());
        ASSERT(base64_decode("").value().empty());

        auto illegal = base64_decode("aGV*bG8=");
        ASSERT(illegal.is_error());
        ASSERT(illegal.error().type == ErrorType::DecodeError);

        ASSERT(base64_decode("aG=Vs").is_error());
        ASSERT(base64_decode("aGVsb").is_error());

        std::vector<uint8_t> blob = {0, 1, 2, 250, 251, 252, 253, 254, 255, 7};
        auto round = base64_decode(base64_encode(blob));
        ASSERT(round.is_ok());
        ASSERT(round.value() == blob);
    }

    // --- raw PCM16 at the source rate ---
    {
        AudioChunkDecoder decoder(24000, 24000);
        std::vector<uint8_t> bytes = {0x00, 0x40, 0x00, 0xC0, 0xFF, 0x7F, 0x00, 0x80};
        auto pcm = decoder.decode(bytes);
        ASSERT(pcm.is_ok());
        ASSERT(pcm.value().sample_rate == 24000);
        ASSERT(pcm.value().frames() == 4);
        ASSERT_NEAR(pcm.value().samples[0], 0.5f, 1e-6f);
        ASSERT_NEAR(pcm.value().samples[1], -0.5f, 1e-6f);
        ASSERT(pcm.value().samples[2] < 1.0f);
        ASSERT_NEAR(pcm.value().samples[3], -1.0f, 1e-6f);

        auto second = decoder.decode(pcm16_bytes(24000));
        ASSERT(second.is_ok());
        ASSERT_NEAR(second.value().duration_seconds(), 1.0, 1e-9);
    }

    // --- malformed raw payloads ---
    {
        AudioChunkDecoder decoder(24000, 24000);
        auto empty = decoder.decode({});
        ASSERT(empty.is_error());
        ASSERT(empty.error().type == ErrorType::DecodeError);

        auto odd = decoder.decode({0x01, 0x02, 0x03});
        ASSERT(odd.is_error());
        ASSERT(odd.error().type == ErrorType::DecodeError);
    }

    // --- raw PCM resampled to the device rate ---
    {
        AudioChunkDecoder decoder(16000, 48000);
        ASSERT(decoder.source_sample_rate() == 16000);
        ASSERT(decoder.target_sample_rate() == 48000);
        auto pcm = decoder.decode(pcm16_bytes(1600));
        ASSERT(pcm.is_ok());
        ASSERT(pcm.value().sample_rate == 48000);
        ASSERT(pcm.value().frames() == 4800);
        ASSERT_NEAR(pcm.value().duration_seconds(), 0.1, 1e-6);
    }

    // --- WAV PCM16 stereo is averaged to mono at the header rate ---
    {
        std::vector<uint8_t> data;
        for (int i = 0; i < 4; i++) {
            put_u16(data, 0x4000);  // left 0.5
            put_u16(data, 0x0000);  // right 0
        }
        AudioChunkDecoder decoder(24000, 0);
        auto pcm = decoder.decode(make_wav(1, 2, 22050, 16, data));
        ASSERT(pcm.is_ok());
        ASSERT(pcm.value().sample_rate == 22050);
        ASSERT(pcm.value().frames() == 4);
        ASSERT_NEAR(pcm.value().samples[0], 0.25f, 1e-6f);
    }

    // --- WAV float32 with an extra chunk before data ---
    {
        std::vector<uint8_t> data;
        float values[] = {0.25f, -0.75f, 1.0f};
        for (float v : values) {
            uint32_t raw;
            std::memcpy(&raw, &v, sizeof(raw));
            put_u32(data, raw);
        }
        AudioChunkDecoder decoder(24000, 24000);
        auto pcm = decoder.decode(make_wav(3, 1, 24000, 32, data, true));
        ASSERT(pcm.is_ok());
        ASSERT(pcm.value().frames() == 3);
        ASSERT_NEAR(pcm.value().samples[1], -0.75f, 1e-6f);
    }

    // --- unsupported and broken WAV ---
    {
        AudioChunkDecoder decoder(24000, 24000);
        std::vector<uint8_t> data(6, 0);
        auto pcm24 = decoder.decode(make_wav(1, 1, 24000, 24, data));
        ASSERT(pcm24.is_error());
        ASSERT(pcm24.error().type == ErrorType::DecodeError);

        std::vector<uint8_t> no_data;
        put_tag(no_data, "RIFF");
        put_u32(no_data, 4);
        put_tag(no_data, "WAVE");
        ASSERT(decoder.decode(no_data).is_error());

        std::vector<uint8_t> not_wave = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'A', 'V', 'I', ' '};
        ASSERT(decoder.decode(not_wave).is_error());
    }

    // --- resample ---
    {
        std::vector<float> ramp = {0.0f, 1.0f, 2.0f, 3.0f};
        ASSERT(AudioChunkDecoder::resample(ramp, 24000, 24000) == ramp);

        auto up = AudioChunkDecoder::resample(ramp, 8000, 16000);
        ASSERT(up.size() == 8);
        ASSERT_NEAR(up[1], 0.5f, 1e-6f);
        ASSERT_NEAR(up[2], 1.0f, 1e-6f);

        auto down = AudioChunkDecoder::resample(ramp, 16000, 8000);
        ASSERT(down.size() == 2);
        ASSERT_NEAR(down[1], 2.0f, 1e-6f);
    }

    // --- outbound protocol messages ---
    {
        SynthesisConfig config;
        config.api_key = "secret";
        config.stability = 0.4f;
        config.similarity_boost = 0.9f;

        auto init = nlohmann::json::parse(synthesis::make_init_message(config));
        ASSERT(init["text"] == " ");
        ASSERT(init["xi-api-key"] == "secret");
        ASSERT_NEAR(init["voice_settings"]["stability"].get<double>(), 0.4, 1e-6);
        ASSERT_NEAR(init["voice_settings"]["similarity_boost"].get<double>(), 0.9, 1e-6);

        auto text = nlohmann::json::parse(synthesis::make_text_message("Hello there"));
        ASSERT(text["text"] == "Hello there");
        ASSERT(text["try_trigger_generation"] == true);

        auto end = nlohmann::json::parse(synthesis::make_end_of_input_message());
        ASSERT(end["text"] == "");

        std::string url = config.stream_url();
        ASSERT(url.find(config.voice_id) != std::string::npos);
        ASSERT(url.find("stream-input") != std::string::npos);
        ASSERT(url.find("output_format=pcm_24000") != std::string::npos);
    }

    // --- inbound frames ---
    {
        auto audio = synthesis::parse_frame(R"({"audio":"AAA=","isFinal":false})");
        ASSERT(audio.is_ok());
        ASSERT(audio.value().audio_base64.has_value());
        ASSERT(*audio.value().audio_base64 == "AAA=");
        ASSERT(!audio.value().is_final);
        ASSERT(!audio.value().alignment.has_value());

        auto final_frame = synthesis::parse_frame(R"({"audio":null,"isFinal":true})");
        ASSERT(final_frame.is_ok());
        ASSERT(!final_frame.value().audio_base64.has_value());
        ASSERT(final_frame.value().is_final);

        auto aligned = synthesis::parse_frame(R"({
            "audio": "AAA=",
            "alignment": {"chars": ["x"], "charStartTimesMs": [0], "charDurationsMs": [10]},
            "normalizedAlignment": {"chars": ["H", "i"], "charStartTimesMs": [0, 50], "charDurationsMs": [50, 60]}
        })");
        ASSERT(aligned.is_ok());
        ASSERT(aligned.value().alignment.has_value());
        ASSERT(aligned.value().alignment->chars.size() == 2);
        ASSERT(aligned.value().alignment->chars[1] == "i");
        ASSERT(aligned.value().alignment->char_start_times_ms[1] == 50);
        ASSERT(aligned.value().alignment->char_durations_ms[1] == 60);

        auto fallback = synthesis::parse_frame(R"({"alignment": {"chars": ["a"], "charStartTimesMs": [5], "charDurationsMs": [7]}})");
        ASSERT(fallback.is_ok());
        ASSERT(fallback.value().alignment.has_value());
        ASSERT(fallback.value().alignment->char_start_times_ms[0] == 5);

        auto error = synthesis::parse_frame(R"({"error":"quota_exceeded","message":"out of credits"})");
        ASSERT(error.is_ok());
        ASSERT(error.value().error.has_value());
        ASSERT(error.value().error->find("quota_exceeded") != std::string::npos);

        auto garbage = synthesis::parse_frame("{not json");
        ASSERT(garbage.is_error());
        ASSERT(garbage.error().type == ErrorType::ParseError);

        auto array = synthesis::parse_frame("[1, 2]");
        ASSERT(array.is_error());
    }

    Logger::shutdown();
    return parley::testing::finish("decoder");
}
