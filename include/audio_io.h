#pragma once

#include "audio_output.h"
#include "common.h"
#include "errors.h"
#include "event_loop.h"
#include <string>
#include <memory>

namespace parley {

/**
 * @brief PortAudio device helpers
 */
class AudioIO {
public:
    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

    /**
     * @brief Verify the microphone can actually be opened
     *
     * Opens and immediately closes a capture stream on the device.
     * @param device Device name, index, or "default"
     * @return PermissionDenied when the device is missing, has no input
     *         channels, or the OS refuses access
     */
    static VoidResult check_microphone(const std::string& device);
};

/**
 * @brief Blocking microphone capture, 16 kHz mono 16-bit
 *
 * Thread Safety:
 * - read_frame() is meant for one capture thread
 * - stop() may be called from any thread; a blocked read_frame() returns false
 */
class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief Open and start the input stream
     * @param device Device name, index, or "default"
     */
    VoidResult start(const std::string& device);

    /**
     * @brief Read a frame of audio from input stream (blocking)
     * @param frame Output frame buffer (will be resized to SAMPLES_PER_FRAME)
     * @return True if frame read successfully, false on error or stream closed
     */
    bool read_frame(AudioFrame& frame);

    /**
     * @brief Stop and close the input stream; releases the microphone
     */
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief AudioOutput backed by a PortAudio float32 mono output stream
 *
 * The device clock is the number of frames rendered by the stream callback,
 * so it freezes while suspended. Scheduled sources are mixed sample by sample
 * in the callback through their envelopes and the master gain; ended
 * handlers are posted to the event loop once a source's last sample has
 * been rendered.
 */
class PortAudioOutput : public AudioOutput {
public:
    /**
     * @brief Open and start the output stream
     * @param device Device name, index, or "default"
     * @return DeviceError when PortAudio or the device fails
     */
    static Result<std::shared_ptr<AudioOutput>> open(EventLoop& loop, const std::string& device,
                                                     int sample_rate);

    ~PortAudioOutput() override;

    double current_time() const override;
    int sample_rate() const override;
    DeviceState state() const override;

    Result<NodeId> schedule(const PcmBuffer& buffer, double start_time,
                            const GainEnvelope& envelope, EndedHandler on_ended) override;
    void stop(NodeId node) override;
    void set_master_gain(float gain) override;

    VoidResult suspend() override;
    VoidResult resume() override;
    void close() override;

private:
    explicit PortAudioOutput(EventLoop& loop);

    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
