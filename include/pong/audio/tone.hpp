/**
 * @file tone.hpp
 * @brief Synthesized sound effects
 *
 * The game's bounce and score sounds are short square-wave beeps generated at
 * startup, so no audio files need to ship with the executable.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace Audio {

/**
 * @brief Mono 16-bit square wave
 *
 * @param frequency Tone frequency in Hz; 0 or less gives silence
 * @param seconds Duration
 * @param sampleRate Samples per second
 * @param amplitude Peak sample value
 * @return round(seconds * sampleRate) samples, each +amplitude, -amplitude or 0
 */
std::vector<std::int16_t> squareWave(float frequency,
                                     float seconds,
                                     unsigned int sampleRate,
                                     std::int16_t amplitude);

} // namespace Audio
