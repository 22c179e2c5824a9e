#include "pong/audio/tone.hpp"

#include <cmath>

namespace Audio {

std::vector<std::int16_t> squareWave(float frequency,
                                     float seconds,
                                     unsigned int sampleRate,
                                     std::int16_t amplitude) {
    if (seconds <= 0.0f || sampleRate == 0) {
        return {};
    }
    auto const count = static_cast<std::size_t>(std::lround(seconds * static_cast<float>(sampleRate)));
    std::vector<std::int16_t> samples(count, 0);
    if (frequency <= 0.0f) {
        return samples;
    }

    double const cyclesPerSample = static_cast<double>(frequency) / sampleRate;
    for (std::size_t i = 0; i < count; ++i) {
        double const phase = std::fmod(static_cast<double>(i) * cyclesPerSample, 1.0);
        samples[i] = phase < 0.5 ? amplitude : static_cast<std::int16_t>(-amplitude);
    }
    return samples;
}

} // namespace Audio
