#include "state_machine.h"
#include "logger.h"

namespace parley {

const char* turn_phase_name(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::Idle: return "Idle";
        case TurnPhase::Initializing: return "Initializing";
        case TurnPhase::Listening: return "Listening";
        case TurnPhase::Speaking: return "Speaking";
        case TurnPhase::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

class TurnStateMachine::Impl {
public:
    Impl() : phase_(TurnPhase::Idle) {}

    TurnPhase get_phase() const {
        return phase_;
    }

    bool begin_initialize() {
        if (phase_ != TurnPhase::Idle && phase_ != TurnPhase::Stopped) return false;
        transition(TurnPhase::Initializing);
        return true;
    }

    bool on_initialized() {
        if (phase_ != TurnPhase::Initializing) return false;
        transition(TurnPhase::Listening);
        return true;
    }

    bool on_initialize_failed() {
        if (phase_ != TurnPhase::Initializing) return false;
        transition(TurnPhase::Idle);
        return true;
    }

    bool on_speak() {
        if (phase_ != TurnPhase::Listening) return false;
        transition(TurnPhase::Speaking);
        return true;
    }

    bool on_speech_finished() {
        if (phase_ != TurnPhase::Speaking) return false;
        transition(TurnPhase::Listening);
        return true;
    }

    bool on_stop() {
        if (phase_ == TurnPhase::Stopped) return false;
        transition(TurnPhase::Stopped);
        return true;
    }

private:
    void transition(TurnPhase next) {
        LOG_TURN(std::string(turn_phase_name(phase_)) + " -> " + turn_phase_name(next));
        phase_ = next;
    }

    TurnPhase phase_;
};

TurnStateMachine::TurnStateMachine() : pimpl_(std::make_unique<Impl>()) {}
TurnStateMachine::~TurnStateMachine() = default;

TurnPhase TurnStateMachine::get_phase() const {
    return pimpl_->get_phase();
}

bool TurnStateMachine::begin_initialize() {
    return pimpl_->begin_initialize();
}

bool TurnStateMachine::on_initialized() {
    return pimpl_->on_initialized();
}

bool TurnStateMachine::on_initialize_failed() {
    return pimpl_->on_initialize_failed();
}

bool TurnStateMachine::on_speak() {
    return pimpl_->on_speak();
}

bool TurnStateMachine::on_speech_finished() {
    return pimpl_->on_speech_finished();
}

bool TurnStateMachine::on_stop() {
    return pimpl_->on_stop();
}

bool TurnStateMachine::is_listening() const {
    return pimpl_->get_phase() == TurnPhase::Listening;
}

bool TurnStateMachine::is_speaking() const {
    return pimpl_->get_phase() == TurnPhase::Speaking;
}

bool TurnStateMachine::is_initialized() const {
    TurnPhase phase = pimpl_->get_phase();
    return phase == TurnPhase::Listening || phase == TurnPhase::Speaking;
}

} // namespace parley
