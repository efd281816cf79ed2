#pragma once

#include "audio_chunk_decoder.h"
#include "audio_output.h"
#include "config.h"
#include "errors.h"
#include "event_loop.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace parley {

/**
 * @brief Sequences decoded synthesis audio onto an AudioOutput
 *
 * Chunks get a monotonic sequence number at arrival and are played strictly
 * in that order, each starting at
 *
 *     max(now + lookahead, previous_end - crossfade)
 *
 * with its own exponential fade-in/fade-out envelope so adjacent chunks
 * overlap without clicks. Scheduling runs as event-loop steps one
 * scheduling interval apart.
 *
 * Two queues are tracked:
 * - pending: accepted, not yet handed to the device (sorted by sequence)
 * - queued: every accepted chunk whose device node has not reported ended
 *
 * The completion handler fires exactly once, when both are empty.
 *
 * All methods must be called on the event loop thread.
 */
class AudioQueueManager {
public:
    using CompletionHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const Error&)>;
    using QueueChangedHandler = std::function<void(size_t queued)>;

    AudioQueueManager(EventLoop& loop, std::shared_ptr<AudioOutput> output,
                      AudioChunkDecoder decoder, const PlaybackConfig& config);
    ~AudioQueueManager();

    // Non-copyable
    AudioQueueManager(const AudioQueueManager&) = delete;
    AudioQueueManager& operator=(const AudioQueueManager&) = delete;

    /**
     * @brief Decode and enqueue one chunk of transport audio
     *
     * A sequence number is reserved before decoding. A chunk that fails to
     * decode is logged and replaced by an empty placeholder, which the
     * scheduler skips without waiting, so later chunks never stall behind it.
     *
     * @param on_complete If set, replaces the remembered drain handler and
     *                    forces scheduling even below the buffer threshold
     * @return The decode error, if any (the placeholder is still queued)
     */
    VoidResult add_to_queue(const std::vector<uint8_t>& bytes,
                            std::optional<Alignment> alignment = std::nullopt,
                            CompletionHandler on_complete = nullptr);

    /**
     * @brief Enqueue an already-decoded chunk carrying its own sequence
     *
     * Sequences below the last processed one are dropped as stale.
     */
    void add_chunk(AudioChunk chunk, CompletionHandler on_complete = nullptr);

    /**
     * @brief Attach the drain handler to whatever is already queued
     *
     * Also flushes a below-threshold remainder to the device.
     * @return false when nothing is queued (the handler is not kept)
     */
    bool attach_completion(CompletionHandler on_complete);

    /**
     * @brief Stop every scheduled node and reset to the freshly-constructed state
     *
     * The drain handler is dropped without firing. Safe from any state,
     * including between scheduling steps; stale callbacks no-op.
     */
    void clear();

    /// Master gain in [0, 1]
    void set_volume(float volume);
    float volume() const { return volume_; }

    /// Device failures while scheduling (DeviceError)
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }

    /// Fired whenever the visible queue grows or shrinks
    void set_queue_changed_handler(QueueChangedHandler handler) { queue_changed_handler_ = std::move(handler); }

    size_t queued_count() const { return queued_.size(); }
    size_t pending_count() const { return pending_.size(); }
    size_t active_node_count() const { return active_nodes_.size(); }
    bool is_idle() const { return queued_.empty() && pending_.empty(); }
    bool is_scheduling() const { return scheduling_; }
    bool has_completion_handler() const { return static_cast<bool>(completion_handler_); }
    double last_scheduled_end_time() const { return last_scheduled_end_time_; }

    /// Sequence of the last chunk handed to the device or skipped; -1 when none
    int64_t last_processed_sequence() const { return last_processed_sequence_; }

private:
    void insert_pending(AudioChunk chunk);
    void maybe_start_scheduling();
    void post_step(int64_t delay_ms);
    void schedule_step(uint64_t epoch);
    bool play_chunk(AudioChunk& chunk, uint64_t epoch);
    void on_node_ended(uint64_t sequence);
    void check_drained();
    void notify_queue_changed();

    EventLoop& loop_;
    std::shared_ptr<AudioOutput> output_;
    AudioChunkDecoder decoder_;
    PlaybackConfig config_;

    std::map<uint64_t, AudioChunk> pending_;
    std::set<uint64_t> queued_;
    std::map<uint64_t, AudioOutput::NodeId> active_nodes_;

    uint64_t next_sequence_ = 0;
    int64_t last_processed_sequence_ = -1;
    double last_scheduled_end_time_ = 0.0;
    int64_t gap_started_ms_ = -1;

    bool scheduling_ = false;
    EventLoop::TimerId step_timer_ = 0;
    uint64_t epoch_ = 0;

    float volume_ = 1.0f;
    CompletionHandler completion_handler_;
    ErrorHandler error_handler_;
    QueueChangedHandler queue_changed_handler_;

    // Expires with this object so tasks already posted to the loop no-op
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace parley
