#include "speech_control.h"
#include "audio_chunk_decoder.h"
#include "logger.h"
#include "synthesis_protocol.h"
#include "utils.h"
#include <algorithm>

namespace parley {

SpeechControl::SpeechControl(EventLoop& loop, const Config& config, Backends backends, Events events)
    : loop_(loop), config_(config), backends_(std::move(backends)), events_(std::move(events)) {
    volume_ = std::clamp(config_.playback.volume, 0.0f, 1.0f);
    sync_state();
}

SpeechControl::~SpeechControl() {
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
    teardown();
}

// =============================================================================
// Lifecycle
// =============================================================================

VoidResult SpeechControl::initialize() {
    if (machine_.is_initialized()) {
        return VoidResult();
    }
    if (!machine_.begin_initialize()) {
        return make_state_error(std::string("cannot initialize while ") + turn_phase_name(machine_.get_phase()));
    }
    sync_state();

    if (backends_.request_microphone) {
        auto permission = backends_.request_microphone();
        if (permission.is_error()) {
            Error error = permission.error().type == ErrorType::PermissionDenied
                              ? permission.error()
                              : make_permission_error(permission.error().message);
            LOG_ERROR("Microphone unavailable: " + error.message);
            machine_.on_initialize_failed();
            sync_state();
            report(error);
            return error;
        }
    }

    auto output = ensure_output();
    if (output.is_error()) {
        machine_.on_initialize_failed();
        sync_state();
        report(output.error());
        return output.error();
    }

    turn_.is_connected = true;
    machine_.on_initialized();
    sync_state();
    LOG_INFO("Speech control ready");

    auto started = start_session();
    if (started.is_error()) {
        report(started.error());
        schedule_restart(config_.recognition.restart_delay_ms);
    }
    return VoidResult();
}

void SpeechControl::stop() {
    teardown();
    state_.reset();
    sync_state();
}

void SpeechControl::teardown() {
    cancel_restart();
    cancel_stall_timer();

    // Invalidate every callback of the current stream
    stream_id_++;
    stream_finished_ = true;
    final_frame_handled_ = false;

    discard_session();

    release_socket();
    if (queue_) {
        queue_->clear();
        queue_.reset();
    }
    if (output_) {
        output_->close();
        output_.reset();
    }

    bool was_active = machine_.get_phase() != TurnPhase::Idle && machine_.get_phase() != TurnPhase::Stopped;
    if (machine_.get_phase() != TurnPhase::Idle) {
        machine_.on_stop();
    }
    turn_ = TurnState();
    paused_ = false;
    session_had_error_ = false;
    if (was_active) {
        LOG_INFO("Speech control stopped");
    }
}

void SpeechControl::pause() {
    if (!machine_.is_initialized() || paused_) return;

    LOG_TURN("Pausing");
    paused_ = true;

    if (machine_.is_speaking()) {
        if (queue_) queue_->clear();
        finish_utterance(stream_id_);
    }
    cancel_restart();
    discard_session();

    if (output_) {
        auto suspended = output_->suspend();
        if (suspended.is_error()) {
            report(suspended.error());
        }
    }
    sync_state();
}

VoidResult SpeechControl::resume() {
    if (!paused_) return VoidResult();

    LOG_TURN("Resuming");
    auto output = ensure_output();
    if (output.is_error()) {
        report(output.error());
        return output.error();
    }

    // A fresh queue starts its clock from the resumed device
    if (queue_) queue_->clear();
    queue_.reset();
    create_queue();

    paused_ = false;
    sync_state();

    auto started = start_session();
    if (started.is_error()) {
        report(started.error());
        schedule_restart(config_.recognition.restart_delay_ms);
    }
    return VoidResult();
}

void SpeechControl::set_volume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    if (queue_) queue_->set_volume(volume_);
    sync_state();
}

bool SpeechControl::has_active_session() const {
    return session_ && session_->is_active();
}

// =============================================================================
// Recognition
// =============================================================================

bool SpeechControl::can_listen() const {
    return machine_.is_listening() && !turn_.is_agent_speaking && !paused_;
}

VoidResult SpeechControl::start_session() {
    if (!can_listen()) {
        return make_state_error("recognition is muted");
    }
    cancel_restart();
    discard_session();

    if (!backends_.create_recognizer) {
        return make_recognition_error("no recognizer backend");
    }
    auto recognizer = backends_.create_recognizer();
    if (!recognizer) {
        return make_recognition_error("recognizer could not be created");
    }

    std::weak_ptr<bool> alive = alive_;
    SpeechRecognitionSession::Events events;
    events.on_start = [this, alive]() {
        if (!alive.expired()) sync_state();
    };
    events.on_transcript = [this, alive](const std::string& text, bool is_final) {
        if (!alive.expired()) handle_transcript(text, is_final);
    };
    events.on_error = [this, alive](RecognitionErrorCode code, const std::string& message) {
        if (!alive.expired()) handle_recognition_error(code, message);
    };
    events.on_ended = [this, alive]() {
        if (!alive.expired()) handle_session_ended();
    };

    session_had_error_ = false;
    session_ = std::make_unique<SpeechRecognitionSession>(loop_, std::move(recognizer),
                                                          config_.recognition, std::move(events));
    auto started = session_->start();
    if (started.is_error()) {
        session_.reset();
        sync_state();
        return make_recognition_error("recognition failed to start: " + started.error().message);
    }
    sync_state();
    return VoidResult();
}

void SpeechControl::discard_session() {
    if (!session_) return;
    session_->abort();
    session_.reset();
}

void SpeechControl::schedule_restart(int delay_ms) {
    cancel_restart();
    std::weak_ptr<bool> alive = alive_;
    restart_timer_ = loop_.post_delayed(std::max(0, delay_ms), [this, alive]() {
        if (alive.expired()) return;
        restart_timer_ = 0;
        if (!can_listen() || session_) return;
        auto started = start_session();
        if (started.is_error()) {
            report(started.error());
            schedule_restart(config_.recognition.restart_delay_ms);
        }
    });
}

void SpeechControl::cancel_restart() {
    if (restart_timer_ != 0) {
        loop_.cancel(restart_timer_);
        restart_timer_ = 0;
    }
}

void SpeechControl::handle_transcript(const std::string& text, bool is_final) {
    if (turn_.is_agent_speaking) {
        LOG_RECOGNITION("Ignoring transcript while agent is speaking");
        return;
    }

    if (is_final) {
        state_.append_utterance(Speaker::User, text, loop_.now_ms());
    }
    sync_state();

    auto on_transcript_update = events_.on_transcript_update;
    if (on_transcript_update) on_transcript_update(text, is_final);
}

void SpeechControl::handle_recognition_error(RecognitionErrorCode code, const std::string& message) {
    if (code == RecognitionErrorCode::NoSpeech) {
        // Silent restart; a muted turn is resumed by finish_utterance instead
        if (!can_listen()) return;
        LOG_RECOGNITION("No speech, restarting recognition");
        discard_session();
        auto started = start_session();
        if (started.is_error()) {
            report(started.error());
            schedule_restart(config_.recognition.restart_delay_ms);
        }
        return;
    }
    if (code == RecognitionErrorCode::Aborted) {
        return;
    }

    session_had_error_ = true;
    std::string detail = recognition_error_name(code);
    if (!message.empty()) detail += ": " + message;
    report(make_recognition_error(detail));
}

void SpeechControl::handle_session_ended() {
    session_.reset();
    sync_state();

    if (!can_listen()) return;
    int delay = session_had_error_ ? config_.recognition.restart_delay_ms : 0;
    LOG_RECOGNITION("Session ended, relaunching in " + std::to_string(delay) + " ms");
    schedule_restart(delay);
}

// =============================================================================
// Output device
// =============================================================================

VoidResult SpeechControl::ensure_output() {
    if (output_ && output_->state() == AudioOutput::DeviceState::Suspended) {
        auto resumed = output_->resume();
        if (resumed.is_ok()) return VoidResult();
        LOG_WARN("Output device failed to resume, reopening: " + resumed.error().message);
        output_->close();
    }

    if (output_ && output_->state() == AudioOutput::DeviceState::Running) {
        if (!queue_) create_queue();
        return VoidResult();
    }

    if (queue_) {
        queue_->clear();
        queue_.reset();
    }
    output_.reset();

    if (!backends_.create_output) {
        return make_device_error("no audio output backend");
    }
    auto created = backends_.create_output();
    if (created.is_error()) {
        return make_device_error("audio output unavailable: " + created.error().message);
    }
    output_ = created.value();
    create_queue();
    LOG_AUDIO("Output device open at " + std::to_string(output_->sample_rate()) + " Hz");
    return VoidResult();
}

void SpeechControl::create_queue() {
    PlaybackConfig playback = config_.playback;
    playback.volume = volume_;
    AudioChunkDecoder decoder(config_.synthesis.output_sample_rate, output_->sample_rate());
    queue_ = std::make_unique<AudioQueueManager>(loop_, output_, decoder, playback);

    std::weak_ptr<bool> alive = alive_;
    queue_->set_error_handler([this, alive](const Error& error) {
        if (!alive.expired()) handle_playback_error(error);
    });
    queue_->set_queue_changed_handler([this, alive](size_t) {
        if (!alive.expired()) sync_state();
    });
}

void SpeechControl::handle_playback_error(const Error& error) {
    if (machine_.is_speaking() && !stream_finished_) {
        recover(stream_id_, error);
        return;
    }
    report(error);
}

// =============================================================================
// Speaking
// =============================================================================

VoidResult SpeechControl::speak(const std::string& text) {
    if (!machine_.is_initialized()) {
        return make_state_error("speech control is not initialized");
    }
    if (paused_) {
        return make_state_error("speech control is paused");
    }
    if (machine_.is_speaking()) {
        return make_state_error("agent is already speaking");
    }
    if (config_.synthesis.api_key.empty()) {
        return make_error(ErrorType::ConfigError, "synthesis API key is not configured");
    }
    if (utils::is_empty_or_whitespace(text)) {
        return make_state_error("nothing to speak");
    }

    auto output = ensure_output();
    if (output.is_error()) {
        report(output.error());
        return output.error();
    }

    // The microphone goes quiet before the agent's turn becomes visible
    cancel_restart();
    discard_session();

    machine_.on_speak();
    turn_.is_agent_speaking = true;
    sync_state();
    state_.append_utterance(Speaker::Agent, text, loop_.now_ms());

    return open_stream(text);
}

VoidResult SpeechControl::open_stream(const std::string& text) {
    release_socket();

    uint64_t id = ++stream_id_;
    stream_finished_ = false;
    final_frame_handled_ = false;

    if (!backends_.create_socket || !(socket_ = backends_.create_socket())) {
        Error error = make_transport_error("synthesis socket could not be created");
        recover(id, error);
        return error;
    }

    std::weak_ptr<bool> alive = alive_;
    SynthesisSocket::Handlers handlers;
    handlers.on_open = [this, alive, id, text]() {
        if (!alive.expired()) handle_stream_open(id, text);
    };
    handlers.on_message = [this, alive, id](const std::string& payload) {
        if (!alive.expired()) handle_frame(id, payload);
    };
    handlers.on_error = [this, alive, id](const std::string& message) {
        if (!alive.expired()) handle_stream_error(id, message);
    };
    handlers.on_close = [this, alive, id]() {
        if (!alive.expired()) handle_stream_closed(id);
    };
    socket_->set_handlers(std::move(handlers));

    std::string url = config_.synthesis.stream_url();
    LOG_SYNTH("Opening stream " + std::to_string(id));
    auto opened = socket_->open(url);
    if (opened.is_error()) {
        Error error = make_transport_error("synthesis socket failed to open: " + opened.error().message);
        recover(id, error);
        return error;
    }
    arm_stall_timer(id);
    return VoidResult();
}

void SpeechControl::handle_stream_open(uint64_t stream_id, const std::string& text) {
    if (stream_id != stream_id_ || stream_finished_ || !socket_) return;

    LOG_SYNTH("Stream " + std::to_string(stream_id) + " open, sending text");
    const std::string messages[] = {
        synthesis::make_init_message(config_.synthesis),
        synthesis::make_text_message(text),
        synthesis::make_end_of_input_message(),
    };
    for (const auto& message : messages) {
        auto sent = socket_->send(message);
        if (sent.is_error()) {
            handle_stream_error(stream_id, sent.error().message);
            return;
        }
    }
    arm_stall_timer(stream_id);
}

void SpeechControl::handle_frame(uint64_t stream_id, const std::string& payload) {
    if (stream_id != stream_id_ || stream_finished_ || final_frame_handled_) return;
    arm_stall_timer(stream_id);

    auto parsed = synthesis::parse_frame(payload);
    if (parsed.is_error()) {
        LOG_WARN("Ignoring synthesis frame: " + parsed.error().message);
        return;
    }
    const synthesis::Frame& frame = parsed.value();

    if (frame.error) {
        handle_stream_error(stream_id, "synthesis service error: " + *frame.error);
        return;
    }

    if (frame.audio_base64) {
        std::vector<uint8_t> bytes;
        auto decoded = base64_decode(*frame.audio_base64);
        if (decoded.is_ok()) {
            bytes = std::move(decoded.value());
        } else {
            // Queued as an undecodable chunk so sequencing stays intact
            LOG_WARN("Bad base64 audio payload: " + decoded.error().message);
        }
        auto queued = queue_->add_to_queue(bytes, frame.alignment,
                                           frame.is_final ? make_completion(stream_id) : nullptr);
        if (queued.is_error()) {
            LOG_SYNTH("Chunk skipped: " + queued.error().message);
        }
    } else if (frame.is_final) {
        if (!queue_->attach_completion(make_completion(stream_id))) {
            LOG_SYNTH("Final frame with nothing queued");
            finish_utterance(stream_id);
            return;
        }
    }

    if (frame.is_final) {
        LOG_SYNTH("Final frame received for stream " + std::to_string(stream_id));
        final_frame_handled_ = true;
        cancel_stall_timer();
        if (socket_) socket_->close();
    }
}

void SpeechControl::handle_stream_error(uint64_t stream_id, const std::string& message) {
    if (stream_id != stream_id_ || stream_finished_) return;
    recover(stream_id, make_transport_error(message));
}

void SpeechControl::handle_stream_closed(uint64_t stream_id) {
    if (stream_id != stream_id_) return;

    cancel_stall_timer();
    release_socket();
    if (stream_finished_ || final_frame_handled_) return;

    // Closed early: play out whatever arrived, then hand the turn back
    if (queue_ && queue_->attach_completion(make_completion(stream_id))) {
        LOG_SYNTH("Stream closed before final frame, completing after queued audio");
        return;
    }
    LOG_SYNTH("Stream closed before any audio");
    finish_utterance(stream_id);
}

void SpeechControl::arm_stall_timer(uint64_t stream_id) {
    cancel_stall_timer();
    int timeout_ms = config_.synthesis.stall_timeout_ms;
    if (timeout_ms <= 0) return;

    std::weak_ptr<bool> alive = alive_;
    stall_timer_ = loop_.post_delayed(timeout_ms, [this, alive, stream_id, timeout_ms]() {
        if (alive.expired()) return;
        stall_timer_ = 0;
        handle_stream_error(stream_id, "no synthesis frame for " + std::to_string(timeout_ms) + " ms");
    });
}

void SpeechControl::cancel_stall_timer() {
    if (stall_timer_ != 0) {
        loop_.cancel(stall_timer_);
        stall_timer_ = 0;
    }
}

void SpeechControl::release_socket() {
    if (!socket_) return;
    socket_->close();
    // May be running inside one of the socket's own handlers; destroy it later
    std::shared_ptr<SynthesisSocket> released(std::move(socket_));
    loop_.post([released]() {});
}

AudioQueueManager::CompletionHandler SpeechControl::make_completion(uint64_t stream_id) {
    std::weak_ptr<bool> alive = alive_;
    return [this, alive, stream_id]() {
        if (alive.expired()) return;
        LOG_TURN("Playback finished for stream " + std::to_string(stream_id));
        finish_utterance(stream_id);
    };
}

void SpeechControl::recover(uint64_t stream_id, const Error& error) {
    if (stream_id != stream_id_ || stream_finished_) return;
    LOG_ERROR("Reply failed, returning to listening: " + to_string(error));
    if (queue_) queue_->clear();
    report(error);
    finish_utterance(stream_id);
}

void SpeechControl::finish_utterance(uint64_t stream_id) {
    if (stream_id != stream_id_ || stream_finished_) return;
    stream_finished_ = true;

    cancel_stall_timer();
    if (socket_) socket_->close();

    turn_.is_agent_speaking = false;
    machine_.on_speech_finished();
    sync_state();

    if (!can_listen()) return;
    auto started = start_session();
    if (started.is_error()) {
        report(started.error());
        schedule_restart(config_.recognition.restart_delay_ms);
    }
}

// =============================================================================
// Helpers
// =============================================================================

void SpeechControl::report(const Error& error) {
    LOG_ERROR(to_string(error));
    auto on_error = events_.on_error;
    if (on_error) on_error(error);
}

void SpeechControl::sync_state() {
    state_.update([this](ConversationSnapshot& snapshot) {
        snapshot.phase = machine_.get_phase();
        snapshot.turn = turn_;
        snapshot.recognition = session_ ? session_->state() : RecognitionState();
        snapshot.queued_chunks = queue_ ? queue_->queued_count() : 0;
        snapshot.volume = volume_;
        snapshot.paused = paused_;
    });
}

} // namespace parley
