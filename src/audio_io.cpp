#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <sstream>
#include <vector>

namespace parley {

namespace {

std::string pa_error(const std::string& what, PaError err) {
    std::ostringstream oss;
    oss << what << ": " << Pa_GetErrorText(err) << " (Error code: " << err << ")";
    return oss.str();
}

/// Resolve "default", a numeric index, or an exact device name. Pa_Initialize must be held.
int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    // Try default device first (most common case)
    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
            return default_idx;
        }
        return -1;
    }

    // Try parsing as numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices &&
            Pa_GetDeviceInfo(device_idx)) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    // Try exact name match
    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || name != info->name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) return i;
    }

    return -1;
}

/// Balances Pa_Initialize/Pa_Terminate within one scope
class PortAudioSession {
public:
    PortAudioSession() : err_(Pa_Initialize()) {}
    ~PortAudioSession() {
        if (err_ == paNoError) Pa_Terminate();
    }
    PortAudioSession(const PortAudioSession&) = delete;
    PortAudioSession& operator=(const PortAudioSession&) = delete;

    bool ok() const { return err_ == paNoError; }
    PaError error() const { return err_; }

private:
    PaError err_;
};

} // anonymous namespace

// =============================================================================
// AudioIO
// =============================================================================

void AudioIO::list_devices() {
    PortAudioSession pa;
    if (!pa.ok()) {
        Logger::error(pa_error("PortAudio init error", pa.error()));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        oss << " default rate " << static_cast<int>(info->defaultSampleRate);
        Logger::info(oss.str());
    }
}

VoidResult AudioIO::check_microphone(const std::string& device) {
    PortAudioSession pa;
    if (!pa.ok()) {
        return make_device_error(pa_error("PortAudio init error", pa.error()));
    }

    int input_idx = find_device(device, true);
    if (input_idx < 0) {
        return make_permission_error("Input device not found: " + device);
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(input_idx);
    if (!info || info->maxInputChannels == 0) {
        return make_permission_error("Device '" + device + "' reports no input channels");
    }

    PaStreamParameters params;
    params.device = input_idx;
    params.channelCount = 1;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &params, nullptr, CAPTURE_SAMPLE_RATE,
                                SAMPLES_PER_FRAME, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        return make_permission_error(pa_error("Microphone unavailable", err));
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        // Host errors on start are how a denied OS microphone permission surfaces
        if (err == paUnanticipatedHostError) {
            Logger::error("This may be an OS microphone permission issue.");
            Logger::error("Check the privacy settings and grant this terminal microphone access.");
        }
        Pa_CloseStream(stream);
        return make_permission_error(pa_error("Microphone access denied", err));
    }

    Pa_StopStream(stream);
    Pa_CloseStream(stream);
    Logger::info(std::string("Microphone available: [") + std::to_string(input_idx) + "] " + info->name);
    return VoidResult();
}

// =============================================================================
// AudioCapture
// =============================================================================

class AudioCapture::Impl {
public:
    ~Impl() {
        stop();
    }

    VoidResult start(const std::string& device) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) return VoidResult();

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error(pa_error("PortAudio init error", err));
        }

        int input_idx = find_device(device, true);
        const PaDeviceInfo* info = input_idx >= 0 ? Pa_GetDeviceInfo(input_idx) : nullptr;
        if (!info || info->maxInputChannels == 0) {
            Pa_Terminate();
            return make_permission_error("Input device not usable: " + device);
        }

        PaStreamParameters params;
        params.device = input_idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &params, nullptr, CAPTURE_SAMPLE_RATE,
                            SAMPLES_PER_FRAME, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error(pa_error("Failed to open input stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            Pa_Terminate();
            return make_device_error(pa_error("Failed to start input stream", err));
        }

        running_ = true;
        LOG_AUDIO(std::string("Capture started on [") + std::to_string(input_idx) + "] " + info->name);
        return VoidResult();
    }

    bool read_frame(AudioFrame& frame) {
        if (!running_) return false;

        frame.resize(SAMPLES_PER_FRAME);
        PaError err = Pa_ReadStream(stream_, frame.data(), SAMPLES_PER_FRAME);

        if (err == paInputOverflowed) {
            Logger::warn("Input overflow");
        } else if (err != paNoError) {
            return false;
        }
        return running_;
    }

    void stop() {
        running_ = false;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return;

        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        Pa_Terminate();
        LOG_AUDIO("Capture stopped");
    }

private:
    std::mutex mutex_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> running_{false};
};

AudioCapture::AudioCapture() : pimpl_(std::make_unique<Impl>()) {}
AudioCapture::~AudioCapture() = default;

VoidResult AudioCapture::start(const std::string& device) {
    return pimpl_->start(device);
}

bool AudioCapture::read_frame(AudioFrame& frame) {
    return pimpl_->read_frame(frame);
}

void AudioCapture::stop() {
    pimpl_->stop();
}

// =============================================================================
// PortAudioOutput
// =============================================================================

class PortAudioOutput::Impl {
public:
    explicit Impl(EventLoop& loop) : loop_(loop) {}

    ~Impl() {
        close();
    }

    VoidResult open(const std::string& device, int sample_rate) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error(pa_error("PortAudio init error", err));
        }
        initialized_ = true;
        sample_rate_ = sample_rate;

        int output_idx = find_device(device, false);
        const PaDeviceInfo* info = output_idx >= 0 ? Pa_GetDeviceInfo(output_idx) : nullptr;
        if (!info) {
            return make_device_error("Output device not found: " + device);
        }

        PaStreamParameters params;
        params.device = output_idx;
        params.channelCount = 1;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, nullptr, &params, sample_rate_,
                            paFramesPerBufferUnspecified, paClipOff, audio_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            return make_device_error(pa_error("Failed to open output stream", err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            return make_device_error(pa_error("Failed to start output stream", err));
        }

        state_ = DeviceState::Running;
        std::ostringstream oss;
        oss << "Using output device: [" << output_idx << "] " << info->name << " @ " << sample_rate_ << "Hz";
        Logger::info(oss.str());
        return VoidResult();
    }

    double current_time() const {
        return sample_rate_ > 0 ? static_cast<double>(frames_rendered_.load()) / sample_rate_ : 0.0;
    }

    int sample_rate() const {
        return sample_rate_;
    }

    DeviceState state() const {
        return state_;
    }

    Result<NodeId> schedule(const PcmBuffer& buffer, double start_time,
                            const GainEnvelope& envelope, EndedHandler on_ended) {
        if (state_ == DeviceState::Closed) {
            return make_device_error("Output device is closed");
        }

        Source source;
        source.samples = buffer.samples;
        if (buffer.sample_rate != sample_rate_ && buffer.sample_rate > 0) {
            LOG_WARN("Scheduling " + std::to_string(buffer.sample_rate) + "Hz buffer on " +
                     std::to_string(sample_rate_) + "Hz device without resampling");
        }
        source.start_frame = std::max<int64_t>(0, std::llround(start_time * sample_rate_));
        source.envelope = envelope;
        source.on_ended = std::move(on_ended);

        std::lock_guard<std::mutex> lock(mutex_);
        source.id = ++next_node_id_;
        sources_.push_back(std::move(source));
        return sources_.back().id;
    }

    void stop(NodeId node) {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_.erase(std::remove_if(sources_.begin(), sources_.end(),
                                      [node](const Source& s) { return s.id == node; }),
                       sources_.end());
    }

    void set_master_gain(float gain) {
        master_gain_ = std::clamp(gain, 0.0f, 1.0f);
    }

    VoidResult suspend() {
        if (state_ != DeviceState::Running) return VoidResult();
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            return make_device_error(pa_error("Failed to suspend output", err));
        }
        state_ = DeviceState::Suspended;
        LOG_AUDIO("Output suspended at " + std::to_string(current_time()) + "s");
        return VoidResult();
    }

    VoidResult resume() {
        if (state_ == DeviceState::Closed) {
            return make_device_error("Output device is closed");
        }
        if (state_ == DeviceState::Running) return VoidResult();
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            return make_device_error(pa_error("Failed to resume output", err));
        }
        state_ = DeviceState::Running;
        LOG_AUDIO("Output resumed");
        return VoidResult();
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sources_.clear();
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
        state_ = DeviceState::Closed;
    }

private:
    struct Source {
        NodeId id = 0;
        std::vector<float> samples;
        int64_t start_frame = 0;
        size_t position = 0;
        GainEnvelope envelope;
        EndedHandler on_ended;
    };

    static int audio_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        float* out = static_cast<float*>(output);
        std::fill(out, out + frame_count, 0.0f);

        int64_t base = self->frames_rendered_.load();
        float master = self->master_gain_.load();
        double rate = static_cast<double>(self->sample_rate_);

        std::lock_guard<std::mutex> lock(self->mutex_);
        for (auto& source : self->sources_) {
            for (unsigned long i = 0; i < frame_count; i++) {
                int64_t frame = base + static_cast<int64_t>(i);
                if (frame < source.start_frame) continue;
                if (source.position >= source.samples.size()) break;
                float gain = source.envelope.gain_at(static_cast<double>(frame) / rate);
                out[i] += source.samples[source.position++] * gain;
            }
        }

        for (unsigned long i = 0; i < frame_count; i++) {
            out[i] = std::clamp(out[i] * master, -1.0f, 1.0f);
        }

        // Hand finished sources back to the loop
        auto finished = std::stable_partition(self->sources_.begin(), self->sources_.end(),
                                              [](const Source& s) { return s.position < s.samples.size(); });
        for (auto it = finished; it != self->sources_.end(); ++it) {
            if (it->on_ended) self->loop_.post(std::move(it->on_ended));
        }
        self->sources_.erase(finished, self->sources_.end());

        self->frames_rendered_ += static_cast<int64_t>(frame_count);
        return paContinue;
    }

    EventLoop& loop_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    int sample_rate_ = 0;
    DeviceState state_ = DeviceState::Closed;

    std::mutex mutex_;
    std::vector<Source> sources_;
    NodeId next_node_id_ = 0;

    std::atomic<int64_t> frames_rendered_{0};
    std::atomic<float> master_gain_{1.0f};
};

PortAudioOutput::PortAudioOutput(EventLoop& loop) : pimpl_(std::make_unique<Impl>(loop)) {}
PortAudioOutput::~PortAudioOutput() = default;

Result<std::shared_ptr<AudioOutput>> PortAudioOutput::open(EventLoop& loop, const std::string& device,
                                                           int sample_rate) {
    std::shared_ptr<PortAudioOutput> output(new PortAudioOutput(loop));
    auto opened = output->pimpl_->open(device, sample_rate);
    if (opened.is_error()) {
        return opened.error();
    }
    return std::shared_ptr<AudioOutput>(output);
}

double PortAudioOutput::current_time() const {
    return pimpl_->current_time();
}

int PortAudioOutput::sample_rate() const {
    return pimpl_->sample_rate();
}

AudioOutput::DeviceState PortAudioOutput::state() const {
    return pimpl_->state();
}

Result<AudioOutput::NodeId> PortAudioOutput::schedule(const PcmBuffer& buffer, double start_time,
                                                      const GainEnvelope& envelope, EndedHandler on_ended) {
    return pimpl_->schedule(buffer, start_time, envelope, std::move(on_ended));
}

void PortAudioOutput::stop(NodeId node) {
    pimpl_->stop(node);
}

void PortAudioOutput::set_master_gain(float gain) {
    pimpl_->set_master_gain(gain);
}

VoidResult PortAudioOutput::suspend() {
    return pimpl_->suspend();
}

VoidResult PortAudioOutput::resume() {
    return pimpl_->resume();
}

void PortAudioOutput::close() {
    pimpl_->close();
}

} // namespace parley
