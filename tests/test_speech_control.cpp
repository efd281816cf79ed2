/**
 * Turn-taking orchestration with fake microphone, device, recognizer and
 * synthesis socket. Checks that the microphone is never live while the
 * agent speaks and that every way a reply can end returns to listening
 * exactly once.
 *
 * Run from build dir: ./test_speech_control
 */

#include "logger.h"
#include "speech_control.h"
#include "test_support.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace parley;
using parley::testing::FakeAudioOutput;
using parley::testing::FakeRecognizer;
using parley::testing::FakeSocket;
using parley::testing::ManualLoop;
using parley::testing::RecognizerProbe;
using parley::testing::SocketProbe;

namespace {

constexpr int RATE = 24000;

std::string audio_frame(double seconds, bool is_final = false) {
    nlohmann::json frame;
    frame["audio"] = parley::testing::base64_encode(
        parley::testing::pcm16_bytes(static_cast<size_t>(seconds * RATE)));
    frame["isFinal"] = is_final;
    return frame.dump();
}

std::string final_frame() {
    return R"({"audio":null,"isFinal":true})";
}

struct Rig {
    ManualLoop m;
    Config config;
    std::shared_ptr<RecognizerProbe> recognizers = std::make_shared<RecognizerProbe>();
    std::shared_ptr<SocketProbe> sockets = std::make_shared<SocketProbe>();
    std::vector<std::shared_ptr<FakeAudioOutput>> outputs;
    bool deny_microphone = false;
    bool fail_output = false;
    int microphone_requests = 0;

    std::vector<std::pair<std::string, bool>> transcripts;
    std::vector<Error> errors;
    std::function<void(const std::string&, bool)> transcript_hook;
    std::unique_ptr<SpeechControl> control;

    Rig() {
        config.synthesis.api_key = "test-key";
    }

    void create() {
        SpeechControl::Backends backends;
        backends.request_microphone = [this]() -> VoidResult {
            microphone_requests++;
            if (deny_microphone) return make_permission_error("microphone access denied");
            return VoidResult();
        };
        backends.create_output = [this]() -> Result<std::shared_ptr<AudioOutput>> {
            if (fail_output) return make_device_error("no output device");
            outputs.push_back(std::make_shared<FakeAudioOutput>(RATE));
            return std::shared_ptr<AudioOutput>(outputs.back());
        };
        backends.create_recognizer = parley::testing::fake_recognizer_factory(recognizers);
        backends.create_socket = parley::testing::fake_socket_factory(sockets);

        SpeechControl::Events events;
        events.on_transcript_update = [this](const std::string& text, bool is_final) {
            transcripts.emplace_back(text, is_final);
            if (transcript_hook) transcript_hook(text, is_final);
        };
        events.on_error = [this](const Error& error) { errors.push_back(error); };

        control = std::make_unique<SpeechControl>(m.loop, config, std::move(backends), std::move(events));
    }

    void start() {
        create();
        auto initialized = control->initialize();
        ASSERT(initialized.is_ok());
    }

    FakeAudioOutput& output() { return *outputs.back(); }
    FakeRecognizer* recognizer() { return recognizers->current; }
    FakeSocket* socket() { return sockets->current; }

    bool exclusive() const {
        return !(control->turn_state().is_agent_speaking && control->has_active_session());
    }

    /// speak() and let the socket connect
    void speak_and_open(const std::string& text) {
        auto spoken = control->speak(text);
        ASSERT(spoken.is_ok());
        ASSERT(socket() != nullptr);
        if (socket()) socket()->fire_open();
    }
};

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- initialize acquires the microphone, device and first session ---
    {
        Rig rig;
        rig.create();
        ASSERT(rig.control->phase() == TurnPhase::Idle);
        ASSERT(!rig.control->turn_state().is_connected);

        ASSERT(rig.control->initialize().is_ok());
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(rig.control->turn_state().is_connected);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.microphone_requests == 1);
        ASSERT(rig.outputs.size() == 1);
        ASSERT(rig.recognizers->created == 1);
        ASSERT(rig.control->audio_queue() != nullptr);

        // Already initialized: no-op
        ASSERT(rig.control->initialize().is_ok());
        ASSERT(rig.microphone_requests == 1);
        ASSERT(rig.recognizers->created == 1);
        ASSERT(rig.errors.empty());
    }

    // --- denied microphone is fatal ---
    {
        Rig rig;
        rig.deny_microphone = true;
        rig.create();
        auto initialized = rig.control->initialize();
        ASSERT(initialized.is_error());
        ASSERT(initialized.error().type == ErrorType::PermissionDenied);
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::PermissionDenied);
        ASSERT(rig.control->phase() == TurnPhase::Idle);
        ASSERT(rig.recognizers->created == 0);
        ASSERT(rig.outputs.empty());

        // A later attempt can succeed
        rig.deny_microphone = false;
        ASSERT(rig.control->initialize().is_ok());
        ASSERT(rig.control->phase() == TurnPhase::Listening);
    }

    // --- missing output device ---
    {
        Rig rig;
        rig.fail_output = true;
        rig.create();
        auto initialized = rig.control->initialize();
        ASSERT(initialized.is_error());
        ASSERT(initialized.error().type == ErrorType::DeviceError);
        ASSERT(rig.control->phase() == TurnPhase::Idle);
        ASSERT(!rig.control->has_active_session());
    }

    // --- speak() preconditions ---
    {
        Rig rig;
        rig.create();
        auto early = rig.control->speak("hello");
        ASSERT(early.is_error());
        ASSERT(early.error().type == ErrorType::InvalidState);

        rig.config.synthesis.api_key.clear();
        rig.create();
        rig.control->initialize();
        auto no_key = rig.control->speak("hello");
        ASSERT(no_key.is_error());
        ASSERT(no_key.error().type == ErrorType::ConfigError);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.sockets->created == 0);
    }

    // --- a full reply: mute, stream, play, listen again ---
    {
        Rig rig;
        rig.start();
        FakeRecognizer* first = rig.recognizer();
        ASSERT(first != nullptr);

        ASSERT(rig.control->speak("Hi there").is_ok());
        ASSERT(rig.control->phase() == TurnPhase::Speaking);
        ASSERT(rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.recognizers->aborted == 1);
        ASSERT(rig.recognizers->live == 0);
        ASSERT(rig.exclusive());

        FakeSocket* socket = rig.socket();
        ASSERT(socket != nullptr);
        ASSERT(socket->url() == rig.config.synthesis.stream_url());
        ASSERT(socket->sent.empty());

        socket->fire_open();
        ASSERT(socket->sent.size() == 3);
        auto init = nlohmann::json::parse(socket->sent[0]);
        ASSERT(init["text"] == " ");
        ASSERT(init["xi-api-key"] == "test-key");
        ASSERT(init.contains("voice_settings"));
        auto text = nlohmann::json::parse(socket->sent[1]);
        ASSERT(text["text"] == "Hi there");
        ASSERT(text["try_trigger_generation"] == true);
        auto end = nlohmann::json::parse(socket->sent[2]);
        ASSERT(end["text"] == "");

        socket->fire_message(audio_frame(1.0));
        socket->fire_message(audio_frame(0.5));
        ASSERT(!socket->close_requested());
        socket->fire_message(audio_frame(1.0, true));
        ASSERT(socket->close_requested());
        socket->fire_close();
        ASSERT(rig.exclusive());

        rig.m.advance(100);
        ASSERT(rig.output().nodes.size() == 3);
        ASSERT(rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.exclusive());
        ASSERT(rig.control->conversation().snapshot().queued_chunks == 3);

        rig.output().advance_to(rig.output().nodes[1].end_time());
        ASSERT(rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->has_active_session());

        rig.output().play_all();
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.recognizers->created == 2);
        ASSERT(rig.errors.empty());

        const auto& log = rig.control->conversation().transcript();
        ASSERT(log.size() == 1);
        ASSERT(log[0].speaker == Speaker::Agent);
        ASSERT(log[0].text == "Hi there");

        // Nothing left to fire
        rig.m.advance(rig.config.synthesis.stall_timeout_ms + 100);
        ASSERT(rig.errors.empty());
        ASSERT(rig.recognizers->created == 2);
    }

    // --- transcripts are forwarded and finals logged ---
    {
        Rig rig;
        rig.start();
        rig.recognizer()->fire_start();
        rig.recognizer()->fire_result("what is", false);
        rig.recognizer()->fire_result("what is the time", true);
        ASSERT(rig.transcripts.size() == 2);
        ASSERT(rig.transcripts[0] == std::make_pair(std::string("what is"), false));
        ASSERT(rig.transcripts[1] == std::make_pair(std::string("what is the time"), true));

        const auto& log = rig.control->conversation().transcript();
        ASSERT(log.size() == 1);
        ASSERT(log[0].speaker == Speaker::User);
        ASSERT(log[0].text == "what is the time");
    }

    // --- replying from inside the transcript callback ---
    {
        Rig rig;
        rig.transcript_hook = [&rig](const std::string& text, bool is_final) {
            if (is_final) rig.control->speak("You said " + text);
        };
        rig.start();
        rig.recognizer()->fire_result("ping", true);
        ASSERT(rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.recognizers->live == 0);
        ASSERT(rig.socket() != nullptr);
        rig.m.advance(10);
        ASSERT(rig.exclusive());
    }

    // --- speak while speaking is refused ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("first");
        auto second = rig.control->speak("second");
        ASSERT(second.is_error());
        ASSERT(second.error().type == ErrorType::InvalidState);
        ASSERT(rig.sockets->created == 1);
        ASSERT(rig.control->conversation().transcript().size() == 1);
    }

    // --- socket closes early with audio queued: completion is attached afterwards ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("partial");
        rig.socket()->fire_message(audio_frame(0.3));
        rig.m.advance(100);
        ASSERT(rig.output().nodes.empty());  // below threshold

        rig.socket()->fire_close();
        ASSERT(rig.control->turn_state().is_agent_speaking);
        rig.m.advance(100);
        ASSERT(rig.output().nodes.size() == 1);
        ASSERT(!rig.control->has_active_session());

        rig.output().play_all();
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.recognizers->created == 2);
        ASSERT(rig.errors.empty());

        rig.output().play_all();
        rig.m.advance(100);
        ASSERT(rig.recognizers->created == 2);
    }

    // --- socket closes before any audio: straight back to listening ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("nothing");
        rig.socket()->fire_close();
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.errors.empty());
    }

    // --- final frame without audio attaches to what is queued ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("tail");
        rig.socket()->fire_message(audio_frame(0.2));
        rig.socket()->fire_message(final_frame());
        ASSERT(rig.socket()->close_requested());
        rig.m.advance(50);
        ASSERT(rig.output().nodes.size() == 1);
        ASSERT(rig.control->turn_state().is_agent_speaking);
        rig.output().play_all();
        ASSERT(!rig.control->turn_state().is_agent_speaking);

        // A final frame with nothing queued at all
        rig.speak_and_open("empty");
        rig.socket()->fire_message(final_frame());
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.errors.empty());
    }

    // --- socket error mid-stream: reported once, queue cleared, listening again ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("doomed");
        FakeSocket* socket = rig.socket();
        socket->fire_message(audio_frame(0.5));
        socket->fire_message(audio_frame(0.5));
        rig.m.advance(50);
        ASSERT(rig.output().live_nodes() == 2);

        socket->fire_error("connection reset");
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::SynthesisTransportError);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.output().live_nodes() == 0);
        ASSERT(rig.control->audio_queue()->is_idle());
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.recognizers->created == 2);

        // Every later source for the same reply is ignored
        socket->fire_error("again");
        socket->fire_message(audio_frame(0.5, true));
        socket->fire_close();
        rig.m.advance(rig.config.synthesis.stall_timeout_ms + 100);
        rig.output().play_all();
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.recognizers->created == 2);
        ASSERT(rig.output().nodes.size() == 2);
    }

    // --- an error frame from the service ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("quota");
        rig.socket()->fire_message(R"({"error":"quota_exceeded","message":"out of credits"})");
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::SynthesisTransportError);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
    }

    // --- malformed frames are skipped ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("noisy");
        rig.socket()->fire_message("{garbage");
        rig.socket()->fire_message(R"({"audio":"@@@@"})");
        ASSERT(rig.errors.empty());
        ASSERT(rig.control->turn_state().is_agent_speaking);
        rig.socket()->fire_message(audio_frame(0.2, true));
        rig.m.advance(50);
        ASSERT(rig.output().nodes.size() == 1);
        rig.output().play_all();
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.errors.empty());
    }

    // --- a stalled stream is a transport error ---
    {
        Rig rig;
        rig.config.synthesis.stall_timeout_ms = 500;
        rig.start();
        rig.speak_and_open("slow");
        rig.m.advance(300);
        rig.socket()->fire_message(audio_frame(0.1));
        rig.m.advance(499);
        ASSERT(rig.errors.empty());
        ASSERT(rig.control->turn_state().is_agent_speaking);
        rig.m.advance(1);
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::SynthesisTransportError);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());

        rig.m.advance(2000);
        ASSERT(rig.errors.size() == 1);
    }

    // --- socket that cannot open ---
    {
        Rig rig;
        rig.start();
        rig.sockets->fail_open = true;
        auto spoken = rig.control->speak("unreachable");
        ASSERT(spoken.is_error());
        ASSERT(spoken.error().type == ErrorType::SynthesisTransportError);
        ASSERT(rig.errors.size() == 1);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(rig.control->has_active_session());
    }

    // --- device failure while scheduling ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("no speaker");
        rig.output().fail_schedule = true;
        rig.socket()->fire_message(audio_frame(0.3));
        rig.socket()->fire_message(audio_frame(0.3));
        rig.m.advance(50);
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::DeviceError);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.control->has_active_session());
    }

    // --- no-speech restarts silently; pending restarts never fire while speaking ---
    {
        Rig rig;
        rig.start();
        rig.recognizer()->fire_error(RecognitionErrorCode::NoSpeech);
        ASSERT(rig.errors.empty());
        ASSERT(rig.recognizers->created == 2);
        ASSERT(rig.recognizers->live == 1);
        ASSERT(rig.control->has_active_session());

        // Another error then end schedules a delayed relaunch...
        rig.recognizer()->fire_error(RecognitionErrorCode::Network, "offline");
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::RecognitionError);
        rig.recognizer()->fire_end();
        ASSERT(!rig.control->has_active_session());

        // ...which speaking cancels
        rig.speak_and_open("busy");
        rig.m.advance(rig.config.recognition.restart_delay_ms * 4);
        ASSERT(rig.recognizers->created == 2);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.exclusive());

        rig.socket()->fire_message(audio_frame(0.2, true));
        rig.m.advance(50);
        ASSERT(rig.recognizers->created == 2);
        rig.output().play_all();
        ASSERT(rig.recognizers->created == 3);
        ASSERT(rig.control->has_active_session());
        rig.m.advance(rig.config.recognition.restart_delay_ms * 4);
        ASSERT(rig.recognizers->created == 3);
    }

    // --- late no-speech from a discarded recognizer starts nothing while speaking ---
    {
        Rig rig;
        rig.start();
        ASSERT(rig.recognizers->created == 1);
        SpeechRecognizer::Handlers stale = rig.recognizers->handlers;

        rig.speak_and_open("hold the floor");
        ASSERT(rig.recognizers->live == 0);
        stale.on_error(RecognitionErrorCode::NoSpeech, "");
        stale.on_result({RecognitionResult{"echo of the agent", 0.9f, true}});
        stale.on_end();
        rig.m.advance(rig.config.recognition.restart_delay_ms * 2);
        ASSERT(rig.recognizers->created == 1);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.transcripts.empty());
        ASSERT(rig.errors.empty());

        rig.socket()->fire_message(audio_frame(0.2, true));
        rig.m.advance(50);
        ASSERT(rig.recognizers->created == 1);
        rig.output().play_all();
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(rig.recognizers->created == 2);
        ASSERT(rig.recognizers->live == 1);
        ASSERT(rig.control->has_active_session());
    }

    // --- a session that ends on its own is replaced ---
    {
        Rig rig;
        rig.start();
        rig.recognizer()->fire_end();
        ASSERT(!rig.control->has_active_session());
        rig.m.loop.poll();
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.recognizers->created == 2);

        // After an error the relaunch waits for the restart delay
        rig.recognizer()->fire_error(RecognitionErrorCode::AudioCapture, "device busy");
        rig.recognizer()->fire_end();
        rig.m.advance(rig.config.recognition.restart_delay_ms - 1);
        ASSERT(rig.recognizers->created == 2);
        rig.m.advance(1);
        ASSERT(rig.recognizers->created == 3);
    }

    // --- recognizer failing to start at initialize is retried ---
    {
        Rig rig;
        rig.recognizers->fail_start = true;
        rig.start();
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.errors.size() == 1);
        ASSERT(rig.errors[0].type == ErrorType::RecognitionError);

        rig.recognizers->fail_start = false;
        rig.m.advance(rig.config.recognition.restart_delay_ms);
        ASSERT(rig.control->has_active_session());
    }

    // --- pause and resume ---
    {
        Rig rig;
        rig.start();
        rig.speak_and_open("interrupted");
        rig.socket()->fire_message(audio_frame(0.5));
        rig.socket()->fire_message(audio_frame(0.5));
        rig.m.advance(50);

        rig.control->pause();
        ASSERT(rig.control->is_paused());
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.output().live_nodes() == 0);
        ASSERT(rig.output().state() == AudioOutput::DeviceState::Suspended);
        ASSERT(rig.errors.empty());
        ASSERT(rig.control->conversation().snapshot().paused);

        rig.control->pause();
        ASSERT(rig.output().suspend_calls == 1);

        rig.m.advance(rig.config.recognition.restart_delay_ms * 4);
        ASSERT(!rig.control->has_active_session());

        auto refused = rig.control->speak("not now");
        ASSERT(refused.is_error());
        ASSERT(refused.error().type == ErrorType::InvalidState);

        ASSERT(rig.control->resume().is_ok());
        ASSERT(!rig.control->is_paused());
        ASSERT(rig.output().state() == AudioOutput::DeviceState::Running);
        ASSERT(rig.output().resume_calls == 1);
        ASSERT(rig.outputs.size() == 1);
        ASSERT(rig.control->has_active_session());
        ASSERT(rig.control->audio_queue()->is_idle());
        ASSERT(rig.control->resume().is_ok());

        rig.speak_and_open("after resume");
        ASSERT(rig.control->turn_state().is_agent_speaking);
    }

    // --- speak() reopens a device that was closed underneath ---
    {
        Rig rig;
        rig.start();
        rig.output().close();
        ASSERT(rig.control->speak("reopen").is_ok());
        ASSERT(rig.outputs.size() == 2);
        ASSERT(rig.output().state() == AudioOutput::DeviceState::Running);
        rig.socket()->fire_open();
        rig.socket()->fire_message(audio_frame(0.2, true));
        rig.m.advance(50);
        ASSERT(rig.output().nodes.size() == 1);
    }

    // --- volume ---
    {
        Rig rig;
        rig.start();
        rig.control->set_volume(0.25f);
        ASSERT_NEAR(rig.control->volume(), 0.25f, 1e-6f);
        ASSERT_NEAR(rig.output().master_gain, 0.25f, 1e-6f);
        ASSERT_NEAR(rig.control->conversation().snapshot().volume, 0.25f, 1e-6f);
        rig.control->set_volume(1.5f);
        ASSERT_NEAR(rig.control->volume(), 1.0f, 1e-6f);
        rig.control->set_volume(-0.5f);
        ASSERT_NEAR(rig.output().master_gain, 0.0f, 1e-6f);

        // Kept across a pause/resume queue rebuild
        rig.control->set_volume(0.6f);
        rig.control->pause();
        rig.control->resume();
        ASSERT_NEAR(rig.output().master_gain, 0.6f, 1e-6f);
    }

    // --- stop() mid-reply resets everything and is idempotent ---
    {
        Rig rig;
        rig.start();
        rig.recognizer()->fire_result("hello", true);
        rig.speak_and_open("goodbye");
        FakeSocket* socket = rig.socket();
        socket->fire_message(audio_frame(0.5));
        socket->fire_message(audio_frame(0.5));
        rig.m.advance(50);

        rig.control->stop();
        ASSERT(rig.control->phase() == TurnPhase::Stopped);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->turn_state().is_connected);
        ASSERT(!rig.control->has_active_session());
        ASSERT(rig.control->audio_queue() == nullptr);
        ASSERT(rig.output().close_calls == 1);
        ASSERT(rig.output().live_nodes() == 0);
        ASSERT(socket->close_requested());
        ASSERT(rig.control->conversation().transcript().empty());
        ASSERT(rig.control->conversation().snapshot().queued_chunks == 0);

        // Late events from the old stream do nothing
        socket->fire_message(audio_frame(0.5, true));
        socket->fire_error("late");
        socket->fire_close();
        rig.m.advance(rig.config.synthesis.stall_timeout_ms + 100);
        ASSERT(rig.errors.empty());
        ASSERT(rig.recognizers->live == 0);
        ASSERT(rig.sockets->live == 0);

        rig.control->stop();
        ASSERT(rig.control->phase() == TurnPhase::Stopped);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->turn_state().is_connected);
        ASSERT(rig.errors.empty());

        // And it can start over
        ASSERT(rig.control->initialize().is_ok());
        ASSERT(rig.outputs.size() == 2);
        ASSERT(rig.control->phase() == TurnPhase::Listening);
        ASSERT(rig.control->has_active_session());
    }

    // --- stop() before initialize ---
    {
        Rig rig;
        rig.create();
        rig.control->stop();
        rig.control->stop();
        ASSERT(rig.control->phase() == TurnPhase::Idle);
        ASSERT(!rig.control->turn_state().is_agent_speaking);
        ASSERT(!rig.control->turn_state().is_connected);
    }

    // --- observers see the turn change hands ---
    {
        Rig rig;
        rig.create();
        std::vector<TurnPhase> phases;
        bool overlap = false;
        int agent_lines_seen = 0;
        bool agent_line_while_listening = false;
        auto id = rig.control->conversation().subscribe([&](const ConversationSnapshot& s) {
            if (phases.empty() || phases.back() != s.phase) phases.push_back(s.phase);
            if (s.turn.is_agent_speaking && rig.control->has_active_session()) overlap = true;
            int agent_lines = 0;
            for (const auto& u : s.transcript) {
                if (u.speaker == Speaker::Agent) agent_lines++;
            }
            if (agent_lines > agent_lines_seen) {
                agent_lines_seen = agent_lines;
                if (!s.turn.is_agent_speaking || s.phase != TurnPhase::Speaking) agent_line_while_listening = true;
            }
        });
        rig.control->initialize();
        rig.speak_and_open("observed");
        rig.socket()->fire_message(audio_frame(0.2, true));
        rig.m.advance(50);
        rig.output().play_all();

        ASSERT(!overlap);
        ASSERT(agent_lines_seen == 1);
        ASSERT(!agent_line_while_listening);
        std::vector<TurnPhase> expected = {TurnPhase::Initializing, TurnPhase::Listening,
                                           TurnPhase::Speaking, TurnPhase::Listening};
        ASSERT(phases == expected);

        ASSERT(rig.control->conversation().subscriber_count() == 1);
        rig.control->conversation().unsubscribe(id);
        ASSERT(rig.control->conversation().subscriber_count() == 0);
        size_t seen = phases.size();
        rig.control->stop();
        ASSERT(phases.size() == seen);
    }

    // --- many replies in a row keep the invariants ---
    {
        Rig rig;
        rig.start();
        for (int i = 0; i < 5; i++) {
            rig.recognizer()->fire_result("question " + std::to_string(i), true);
            rig.speak_and_open("answer " + std::to_string(i));
            ASSERT(rig.exclusive());
            rig.socket()->fire_message(audio_frame(0.2));
            rig.socket()->fire_message(audio_frame(0.2, true));
            rig.socket()->fire_close();
            rig.m.advance(50);
            rig.output().play_all();
            ASSERT(!rig.control->turn_state().is_agent_speaking);
            ASSERT(rig.control->has_active_session());
            ASSERT(rig.recognizers->live == 1);
        }
        ASSERT(rig.control->conversation().transcript().size() == 10);
        ASSERT(rig.errors.empty());
    }

    Logger::shutdown();
    return parley::testing::finish("speech control");
}
