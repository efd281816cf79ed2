#pragma once

#include <memory>

namespace parley {

/**
 * @brief Conversation phase
 */
enum class TurnPhase {
    Idle,          ///< Constructed, nothing acquired
    Initializing,  ///< Acquiring microphone and output device
    Listening,     ///< Recognition session owns the microphone
    Speaking,      ///< Agent audio owns the turn; recognition is torn down
    Stopped        ///< Torn down; initialize() may start over
};

const char* turn_phase_name(TurnPhase phase);

/**
 * @brief Turn-taking state machine
 *
 * - Idle/Stopped -> Initializing (begin_initialize)
 * - Initializing -> Listening (on_initialized)
 * - Initializing -> Idle (on_initialize_failed)
 * - Listening -> Speaking (on_speak)
 * - Speaking -> Listening (on_speech_finished: playback drained or recovery)
 * - any -> Stopped (on_stop)
 *
 * Every event returns false and leaves the phase untouched when it is not
 * valid in the current phase.
 */
class TurnStateMachine {
public:
    TurnStateMachine();
    ~TurnStateMachine();

    TurnPhase get_phase() const;

    bool begin_initialize();
    bool on_initialized();
    bool on_initialize_failed();
    bool on_speak();
    bool on_speech_finished();
    bool on_stop();

    bool is_listening() const;
    bool is_speaking() const;

    /**
     * @brief True in Listening and Speaking
     */
    bool is_initialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
