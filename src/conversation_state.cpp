#include "conversation_state.h"
#include "logger.h"
#include <map>

namespace parley {

class ConversationState::Impl {
public:
    SubscriptionId subscribe(Listener listener) {
        SubscriptionId id = next_id_++;
        listeners_[id] = std::move(listener);
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        listeners_.erase(id);
    }

    size_t subscriber_count() const {
        return listeners_.size();
    }

    void update(const Mutator& mutator) {
        if (mutator) mutator(snapshot_);
        notify();
    }

    void append_utterance(Speaker speaker, const std::string& text, int64_t timestamp_ms) {
        Utterance utterance;
        utterance.speaker = speaker;
        utterance.text = text;
        utterance.timestamp_ms = timestamp_ms;
        snapshot_.transcript.push_back(std::move(utterance));
        LOG_TURN(std::string(speaker_name(speaker)) + ": " + text);
        notify();
    }

    void reset() {
        snapshot_ = ConversationSnapshot();
        notify();
    }

    const ConversationSnapshot& snapshot() const {
        return snapshot_;
    }

private:
    void notify() {
        // Listeners may subscribe or unsubscribe while being notified
        auto listeners = listeners_;
        for (const auto& [id, listener] : listeners) {
            if (listeners_.count(id) == 0) continue;
            if (listener) listener(snapshot_);
        }
    }

    ConversationSnapshot snapshot_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_id_ = 1;
};

ConversationState::ConversationState() : impl_(std::make_unique<Impl>()) {}

ConversationState::~ConversationState() = default;

ConversationState::SubscriptionId ConversationState::subscribe(Listener listener) {
    return impl_->subscribe(std::move(listener));
}

void ConversationState::unsubscribe(SubscriptionId id) {
    impl_->unsubscribe(id);
}

size_t ConversationState::subscriber_count() const {
    return impl_->subscriber_count();
}

void ConversationState::update(const Mutator& mutator) {
    impl_->update(mutator);
}

void ConversationState::append_utterance(Speaker speaker, const std::string& text, int64_t timestamp_ms) {
    impl_->append_utterance(speaker, text, timestamp_ms);
}

void ConversationState::reset() {
    impl_->reset();
}

const ConversationSnapshot& ConversationState::snapshot() const {
    return impl_->snapshot();
}

const std::vector<Utterance>& ConversationState::transcript() const {
    return impl_->snapshot().transcript;
}

} // namespace parley
