/**
 * Energy VAD endpointing on synthetic 16 kHz frames: start debounce,
 * end-of-utterance silence, short-burst rejection and hangover.
 *
 * Run from build dir: ./test_vad
 */

#include "config.h"
#include "logger.h"
#include "test_support.h"
#include "vad_endpointing.h"
#include <vector>

using namespace parley;

namespace {

AudioFrame silence_frame() {
    return AudioFrame(SAMPLES_PER_FRAME, 0);
}

AudioFrame loud_frame() {
    AudioFrame frame(SAMPLES_PER_FRAME);
    for (size_t i = 0; i < frame.size(); i++) {
        frame[i] = (i % 2 == 0) ? 20000 : -20000;
    }
    return frame;
}

/// Feed n copies of a frame; returns the events that were not None
std::vector<VADEvent> feed(VADEndpointing& vad, const AudioFrame& frame, int n) {
    std::vector<VADEvent> events;
    for (int i = 0; i < n; i++) {
        VADEvent e = vad.process(frame);
        if (e != VADEvent::None) events.push_back(e);
    }
    return events;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    VADConfig config;
    const int frames_per_second = 1000 / FRAME_SIZE_MS;
    const int end_frames = config.end_of_utterance_silence_ms / FRAME_SIZE_MS;
    const int hangover_frames = config.hangover_ms / FRAME_SIZE_MS;

    // --- silence never opens a segment ---
    {
        VADEndpointing vad(config);
        ASSERT(feed(vad, silence_frame(), frames_per_second).empty());
        ASSERT(!vad.in_speech());
        ASSERT(vad.get_current_segment().empty());
    }

    // --- a single pop is debounced ---
    {
        VADEndpointing vad(config);
        feed(vad, silence_frame(), 10);
        ASSERT(feed(vad, loud_frame(), config.start_frames_required - 1).empty());
        ASSERT(feed(vad, silence_frame(), 10).empty());
        ASSERT(!vad.in_speech());
    }

    // --- an utterance: start, sustained speech, end after the silence window ---
    {
        VADEndpointing vad(config);
        feed(vad, silence_frame(), 10);

        auto start = feed(vad, loud_frame(), config.start_frames_required);
        ASSERT(start.size() == 1);
        ASSERT(start[0] == VADEvent::SpeechStart);
        ASSERT(vad.in_speech());

        ASSERT(feed(vad, loud_frame(), 20).empty());
        ASSERT(vad.speech_ms() == 21 * FRAME_SIZE_MS);

        ASSERT(feed(vad, silence_frame(), end_frames - 1).empty());
        ASSERT(vad.in_speech());
        auto end = feed(vad, silence_frame(), 1);
        ASSERT(end.size() == 1);
        ASSERT(end[0] == VADEvent::SpeechEnd);
        ASSERT(!vad.in_speech());

        AudioBuffer segment = vad.finalize_segment();
        ASSERT(segment.size() == static_cast<size_t>((1 + 20 + end_frames) * SAMPLES_PER_FRAME));
        ASSERT(vad.get_current_segment().empty());

        // Speech right after a finalized segment needs a fresh start
        ASSERT(feed(vad, silence_frame(), hangover_frames).empty());
        auto again = feed(vad, loud_frame(), config.start_frames_required);
        ASSERT(again.size() == 1);
        ASSERT(again[0] == VADEvent::SpeechStart);
    }

    // --- bursts shorter than min_speech_ms are discarded ---
    {
        VADEndpointing vad(config);
        feed(vad, silence_frame(), 10);
        int burst_frames = config.min_speech_ms / FRAME_SIZE_MS / 2;
        auto start = feed(vad, loud_frame(), burst_frames);
        ASSERT(start.size() == 1);
        auto end = feed(vad, silence_frame(), end_frames);
        ASSERT(end.size() == 1);
        ASSERT(end[0] == VADEvent::SpeechDiscarded);
        vad.finalize_segment();
    }

    // --- reset returns to silence ---
    {
        VADEndpointing vad(config);
        feed(vad, silence_frame(), 10);
        feed(vad, loud_frame(), 10);
        ASSERT(vad.in_speech());
        vad.reset();
        ASSERT(!vad.in_speech());
        ASSERT(vad.get_current_segment().empty());
        ASSERT(vad.speech_ms() == 0);
    }

    Logger::shutdown();
    return parley::testing::finish("VAD");
}
