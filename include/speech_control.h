#pragma once

#include "audio_output.h"
#include "audio_queue_manager.h"
#include "config.h"
#include "conversation_state.h"
#include "errors.h"
#include "event_loop.h"
#include "speech_recognition_session.h"
#include "speech_recognizer.h"
#include "state_machine.h"
#include "synthesis_socket.h"
#include <functional>
#include <memory>
#include <string>

namespace parley {

/**
 * @brief Half-duplex turn-taking orchestrator
 *
 * Owns at most one SpeechRecognitionSession and one AudioQueueManager and
 * guarantees the microphone is never live while the agent speaks:
 *
 * - entering Speaking aborts and discards the session before
 *   is_agent_speaking becomes true
 * - leaving Speaking clears is_agent_speaking before a fresh session is
 *   constructed
 *
 * Each speak() opens one synthesis stream identified by a stream id; the
 * return to listening runs exactly once per stream no matter how many of
 * playback completion, socket close, socket error, stall timeout or device
 * error fire.
 *
 * All methods must be called on the event loop thread.
 */
class SpeechControl {
public:
    struct Backends {
        /// Acquire microphone access; PermissionDenied is fatal. Null means granted.
        std::function<VoidResult()> request_microphone;
        AudioOutputFactory create_output;
        RecognizerFactory create_recognizer;
        SocketFactory create_socket;
    };

    struct Events {
        std::function<void(const std::string& text, bool is_final)> on_transcript_update;
        std::function<void(const Error& error)> on_error;
    };

    SpeechControl(EventLoop& loop, const Config& config, Backends backends, Events events);
    ~SpeechControl();

    // Non-copyable
    SpeechControl(const SpeechControl&) = delete;
    SpeechControl& operator=(const SpeechControl&) = delete;

    /**
     * @brief Acquire the microphone and output device and start listening
     *
     * No-op success when already initialized. On failure the error is also
     * reported through on_error and the phase returns to Idle.
     */
    VoidResult initialize();

    /**
     * @brief Speak one agent reply
     *
     * @return InvalidState when not initialized, paused or already speaking;
     *         ConfigError without a synthesis API key; DeviceError when the
     *         output device cannot be resumed or reopened
     */
    VoidResult speak(const std::string& text);

    /// Cancel any reply in flight, stop recognition and suspend the device
    void pause();

    /// Resume the device, recreate the playback queue and listen again
    VoidResult resume();

    /// Master volume, clamped to [0, 1]
    void set_volume(float volume);

    /// Tear everything down and reset to initial values; idempotent
    void stop();

    TurnPhase phase() const { return machine_.get_phase(); }
    const TurnState& turn_state() const { return turn_; }
    bool is_paused() const { return paused_; }
    float volume() const { return volume_; }

    /// True while a recognition session exists and has not ended or been aborted
    bool has_active_session() const;

    /// Playback queue of the current device; null before initialize() and after stop()
    const AudioQueueManager* audio_queue() const { return queue_.get(); }

    ConversationState& conversation() { return state_; }
    const ConversationState& conversation() const { return state_; }

private:
    // Recognition
    VoidResult start_session();
    void discard_session();
    void schedule_restart(int delay_ms);
    void cancel_restart();
    bool can_listen() const;
    void handle_transcript(const std::string& text, bool is_final);
    void handle_recognition_error(RecognitionErrorCode code, const std::string& message);
    void handle_session_ended();

    // Output device
    VoidResult ensure_output();
    void create_queue();
    void handle_playback_error(const Error& error);

    // Synthesis stream
    VoidResult open_stream(const std::string& text);
    void handle_stream_open(uint64_t stream_id, const std::string& text);
    void handle_frame(uint64_t stream_id, const std::string& payload);
    void handle_stream_error(uint64_t stream_id, const std::string& message);
    void handle_stream_closed(uint64_t stream_id);
    void arm_stall_timer(uint64_t stream_id);
    void cancel_stall_timer();
    void release_socket();
    AudioQueueManager::CompletionHandler make_completion(uint64_t stream_id);

    /// Clear playback, report once and return to listening
    void recover(uint64_t stream_id, const Error& error);

    /// Leave Speaking; runs at most once per stream
    void finish_utterance(uint64_t stream_id);

    void teardown();
    void report(const Error& error);
    void sync_state();

    EventLoop& loop_;
    Config config_;
    Backends backends_;
    Events events_;

    TurnStateMachine machine_;
    ConversationState state_;
    TurnState turn_;
    bool paused_ = false;
    float volume_ = 1.0f;

    std::shared_ptr<AudioOutput> output_;
    std::unique_ptr<AudioQueueManager> queue_;
    std::unique_ptr<SpeechRecognitionSession> session_;
    bool session_had_error_ = false;
    EventLoop::TimerId restart_timer_ = 0;

    std::unique_ptr<SynthesisSocket> socket_;
    uint64_t stream_id_ = 0;
    bool stream_finished_ = true;
    bool final_frame_handled_ = false;
    EventLoop::TimerId stall_timer_ = 0;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace parley
