#pragma once

/**
 * @file conversation_state.h
 * @brief Observable conversation state
 *
 * Single owner (SpeechControl) mutates it through update(); every mutation
 * notifies subscribers with the full snapshot.
 */

#include "speech_recognition_session.h"
#include "state_machine.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {

enum class Speaker {
    User,
    Agent
};

inline const char* speaker_name(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "agent";
}

/**
 * @brief One entry of the transcript log; immutable once appended
 */
struct Utterance {
    Speaker speaker = Speaker::User;
    std::string text;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Whose turn it is
 */
struct TurnState {
    bool is_agent_speaking = false;
    bool is_connected = false;
};

struct ConversationSnapshot {
    TurnPhase phase = TurnPhase::Idle;
    TurnState turn;
    RecognitionState recognition;
    size_t queued_chunks = 0;
    float volume = 1.0f;
    bool paused = false;
    std::vector<Utterance> transcript;
};

class ConversationState {
public:
    using Listener = std::function<void(const ConversationSnapshot&)>;
    using SubscriptionId = uint64_t;
    using Mutator = std::function<void(ConversationSnapshot&)>;

    ConversationState();
    ~ConversationState();

    // Non-copyable
    ConversationState(const ConversationState&) = delete;
    ConversationState& operator=(const ConversationState&) = delete;

    // =========================================================================
    // Subscription
    // =========================================================================

    /// Listener is not called on subscribe; read snapshot() for the current value
    SubscriptionId subscribe(Listener listener);

    /// No-op for unknown ids; safe from inside a listener
    void unsubscribe(SubscriptionId id);

    size_t subscriber_count() const;

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Apply a change and notify every subscriber once
    void update(const Mutator& mutator);

    /// Append to the transcript log and notify
    void append_utterance(Speaker speaker, const std::string& text, int64_t timestamp_ms);

    /// Back to initial values (transcript log included) and notify
    void reset();

    // =========================================================================
    // Query
    // =========================================================================

    const ConversationSnapshot& snapshot() const;

    const std::vector<Utterance>& transcript() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
