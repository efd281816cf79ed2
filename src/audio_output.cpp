#include "audio_output.h"
#include <algorithm>
#include <cmath>

namespace parley {

float GainEnvelope::gain_at(double t) const {
    if (t <= start_time || t >= end_time) return floor;

    // floor * (1/floor)^progress ramps exponentially from floor to 1
    auto ramp_up = [this](double progress) {
        return static_cast<float>(floor * std::pow(1.0 / floor, progress));
    };

    if (t < fade_in_end) {
        double span = fade_in_end - start_time;
        return span > 0.0 ? ramp_up((t - start_time) / span) : 1.0f;
    }
    if (t > fade_out_start) {
        double span = end_time - fade_out_start;
        return span > 0.0 ? ramp_up((end_time - t) / span) : 1.0f;
    }
    return 1.0f;
}

GainEnvelope GainEnvelope::crossfade(double start_time, double duration, double crossfade_seconds, float floor) {
    double ramp = std::max(0.0, std::min(crossfade_seconds, duration / 2.0));

    GainEnvelope env;
    env.start_time = start_time;
    env.end_time = start_time + duration;
    env.fade_in_end = start_time + ramp;
    env.fade_out_start = env.end_time - ramp;
    env.floor = floor;
    return env;
}

} // namespace parley
