#include "audio_queue_manager.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace parley {

AudioQueueManager::AudioQueueManager(EventLoop& loop, std::shared_ptr<AudioOutput> output,
                                     AudioChunkDecoder decoder, const PlaybackConfig& config)
    : loop_(loop), output_(std::move(output)), decoder_(decoder), config_(config) {
    volume_ = std::clamp(config_.volume, 0.0f, 1.0f);
    output_->set_master_gain(volume_);
    last_scheduled_end_time_ = output_->current_time();
}

AudioQueueManager::~AudioQueueManager() {
    if (step_timer_ != 0) loop_.cancel(step_timer_);
    for (const auto& [sequence, node] : active_nodes_) {
        output_->stop(node);
    }
}

VoidResult AudioQueueManager::add_to_queue(const std::vector<uint8_t>& bytes,
                                           std::optional<Alignment> alignment,
                                           CompletionHandler on_complete) {
    if (on_complete) {
        completion_handler_ = std::move(on_complete);
    }

    AudioChunk chunk;
    chunk.sequence = next_sequence_++;
    chunk.alignment = std::move(alignment);

    VoidResult status;
    auto decoded = decoder_.decode(bytes);
    if (decoded.is_error()) {
        LOG_WARN("Chunk " + std::to_string(chunk.sequence) + " failed to decode, skipping: " +
                 decoded.error().message);
        status = decoded.error();
    } else {
        chunk.buffer = std::move(decoded.value());
    }

    insert_pending(std::move(chunk));
    maybe_start_scheduling();
    return status;
}

void AudioQueueManager::add_chunk(AudioChunk chunk, CompletionHandler on_complete) {
    if (on_complete) {
        completion_handler_ = std::move(on_complete);
    }

    if (static_cast<int64_t>(chunk.sequence) <= last_processed_sequence_) {
        LOG_WARN("Dropping stale chunk " + std::to_string(chunk.sequence) +
                 " (last processed " + std::to_string(last_processed_sequence_) + ")");
        if (!scheduling_) check_drained();
        return;
    }

    next_sequence_ = std::max(next_sequence_, chunk.sequence + 1);
    insert_pending(std::move(chunk));
    maybe_start_scheduling();
}

bool AudioQueueManager::attach_completion(CompletionHandler on_complete) {
    if (is_idle()) {
        return false;
    }
    LOG_QUEUE("Completion handler attached to " + std::to_string(queued_.size()) + " queued chunk(s)");
    completion_handler_ = std::move(on_complete);
    maybe_start_scheduling();
    return true;
}

void AudioQueueManager::clear() {
    epoch_++;

    if (step_timer_ != 0) {
        loop_.cancel(step_timer_);
        step_timer_ = 0;
    }
    for (const auto& [sequence, node] : active_nodes_) {
        output_->stop(node);
    }

    bool had_chunks = !queued_.empty();
    active_nodes_.clear();
    pending_.clear();
    queued_.clear();

    next_sequence_ = 0;
    last_processed_sequence_ = -1;
    gap_started_ms_ = -1;
    scheduling_ = false;
    completion_handler_ = nullptr;
    last_scheduled_end_time_ = output_->current_time();
    output_->set_master_gain(volume_);

    if (had_chunks) {
        LOG_QUEUE("Queue cleared");
        notify_queue_changed();
    }
}

void AudioQueueManager::set_volume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    output_->set_master_gain(volume_);
}

void AudioQueueManager::insert_pending(AudioChunk chunk) {
    uint64_t sequence = chunk.sequence;
    // Empty buffers never get a device node, so they never join the visible queue
    bool playable = !chunk.buffer.empty();

    auto inserted = pending_.emplace(sequence, std::move(chunk));
    if (!inserted.second) {
        LOG_WARN("Duplicate chunk sequence " + std::to_string(sequence) + " dropped");
        return;
    }
    if (playable) {
        queued_.insert(sequence);
        notify_queue_changed();
    }
}

void AudioQueueManager::maybe_start_scheduling() {
    if (scheduling_ || pending_.empty()) return;
    bool threshold_met = static_cast<int>(pending_.size()) >= config_.buffer_threshold;
    if (!threshold_met && !completion_handler_) return;

    scheduling_ = true;
    post_step(0);
}

void AudioQueueManager::post_step(int64_t delay_ms) {
    std::weak_ptr<bool> alive = alive_;
    uint64_t epoch = epoch_;
    step_timer_ = loop_.post_delayed(delay_ms, [this, alive, epoch]() {
        if (alive.expired()) return;
        schedule_step(epoch);
    });
}

void AudioQueueManager::schedule_step(uint64_t epoch) {
    if (epoch != epoch_) return;
    step_timer_ = 0;

    std::weak_ptr<bool> alive = alive_;

    while (!pending_.empty()) {
        auto head = pending_.begin();
        int64_t sequence = static_cast<int64_t>(head->first);
        int64_t expected = last_processed_sequence_ + 1;

        if (sequence < expected) {
            pending_.erase(head);
            if (queued_.erase(static_cast<uint64_t>(sequence)) > 0) notify_queue_changed();
            continue;
        }

        if (sequence > expected) {
            int64_t now = loop_.now_ms();
            if (gap_started_ms_ < 0) {
                gap_started_ms_ = now;
                LOG_WARN("Out of sequence chunk: expected " + std::to_string(expected) +
                         ", got " + std::to_string(sequence));
            }
            if (now - gap_started_ms_ < config_.max_gap_wait_ms) {
                post_step(config_.scheduling_interval_ms);
                return;
            }
            LOG_WARN("Gave up waiting for chunk " + std::to_string(expected) + " after " +
                     std::to_string(now - gap_started_ms_) + "ms");
            last_processed_sequence_ = sequence - 1;
        }
        gap_started_ms_ = -1;

        AudioChunk chunk = std::move(head->second);
        pending_.erase(head);
        last_processed_sequence_ = sequence;

        if (chunk.buffer.empty()) {
            LOG_QUEUE("Skipping empty chunk " + std::to_string(sequence));
            check_drained();
            if (alive.expired() || epoch != epoch_) return;
            continue;
        }

        play_chunk(chunk, epoch);
        if (alive.expired() || epoch != epoch_) return;

        if (pending_.empty()) break;
        post_step(config_.scheduling_interval_ms);
        return;
    }

    scheduling_ = false;
}

bool AudioQueueManager::play_chunk(AudioChunk& chunk, uint64_t epoch) {
    double duration = chunk.duration_seconds();
    double start_time = std::max(output_->current_time() + config_.lookahead_seconds,
                                 last_scheduled_end_time_ - config_.crossfade_seconds);
    GainEnvelope envelope = GainEnvelope::crossfade(start_time, duration, config_.crossfade_seconds,
                                                    config_.min_gain);

    uint64_t sequence = chunk.sequence;
    std::weak_ptr<bool> alive = alive_;
    auto node = output_->schedule(chunk.buffer, start_time, envelope, [this, alive, epoch, sequence]() {
        if (alive.expired() || epoch != epoch_) return;
        on_node_ended(sequence);
    });

    if (node.is_error()) {
        LOG_ERROR("Failed to schedule chunk " + std::to_string(sequence) + ": " + node.error().message);
        queued_.erase(sequence);
        notify_queue_changed();
        // The handler may tear this queue down
        auto on_error = error_handler_;
        if (on_error) on_error(make_device_error(node.error().message));
        if (alive.expired() || epoch != epoch_) return false;
        check_drained();
        return false;
    }

    active_nodes_[sequence] = node.value();
    last_scheduled_end_time_ = start_time + duration;

    std::ostringstream oss;
    oss << "Scheduled chunk " << sequence << " at " << start_time << "s for " << duration << "s";
    LOG_QUEUE(oss.str());
    return true;
}

void AudioQueueManager::on_node_ended(uint64_t sequence) {
    active_nodes_.erase(sequence);
    if (queued_.erase(sequence) > 0) {
        notify_queue_changed();
    }
    check_drained();
}

void AudioQueueManager::check_drained() {
    if (!queued_.empty() || !pending_.empty() || !completion_handler_) return;

    LOG_QUEUE("Playback drained");
    CompletionHandler handler = std::move(completion_handler_);
    completion_handler_ = nullptr;
    handler();
}

void AudioQueueManager::notify_queue_changed() {
    if (queue_changed_handler_) {
        queue_changed_handler_(queued_.size());
    }
}

} // namespace parley
