#pragma once

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace parley {

/**
 * @brief Per-source gain automation on the device clock
 *
 * floor at start_time, exponential ramp to 1.0 at fade_in_end, hold,
 * exponential ramp back to floor at end_time starting from fade_out_start.
 * floor must be > 0: an exponential ramp cannot start or end at zero.
 */
struct GainEnvelope {
    double start_time = 0.0;
    double fade_in_end = 0.0;
    double fade_out_start = 0.0;
    double end_time = 0.0;
    float floor = 0.0001f;

    /// Gain at absolute device time t (seconds)
    float gain_at(double t) const;

    /**
     * @brief Build the crossfade envelope for a source of the given duration
     *
     * Ramps are shortened to half the duration for sources shorter than
     * two crossfade windows, so fade-in and fade-out never overlap.
     */
    static GainEnvelope crossfade(double start_time, double duration, double crossfade_seconds, float floor);
};

/**
 * @brief Output device with a sample clock and time-scheduled sources
 *
 * Models a playback graph: each schedule() call creates one source node that
 * starts at an absolute device time, plays its buffer once through its own
 * gain envelope into a master gain, and then reports completion.
 *
 * Threading contract: every method is called from the event loop thread, and
 * implementations deliver EndedHandler callbacks on the event loop thread.
 */
class AudioOutput {
public:
    using NodeId = uint64_t;
    using EndedHandler = std::function<void()>;

    enum class DeviceState {
        Running,
        Suspended,
        Closed
    };

    virtual ~AudioOutput() = default;

    /// Device clock in seconds; advances only while Running
    virtual double current_time() const = 0;

    virtual int sample_rate() const = 0;

    virtual DeviceState state() const = 0;

    /**
     * @brief Schedule a buffer to start at an absolute device time
     *
     * A start time already in the past plays immediately.
     * @param on_ended Fired once after the last sample has been rendered
     * @return Node id, or DeviceError when the device is closed
     */
    virtual Result<NodeId> schedule(const PcmBuffer& buffer, double start_time,
                                    const GainEnvelope& envelope, EndedHandler on_ended) = 0;

    /// Stop and release a node; its EndedHandler is never fired
    virtual void stop(NodeId node) = 0;

    /// Master gain applied after every source envelope
    virtual void set_master_gain(float gain) = 0;

    virtual VoidResult suspend() = 0;
    virtual VoidResult resume() = 0;

    /// Release the device; every pending node is dropped without firing
    virtual void close() = 0;
};

/// Creates (or re-creates after close) the output device
using AudioOutputFactory = std::function<Result<std::shared_ptr<AudioOutput>>()>;

} // namespace parley
