/**
 * @fileoverview sound_board.cpp
 * @brief Implementation of SoundBoard.
 */

#include "pong/audio/sound_board.hpp"

#include "pong/audio/tone.hpp"
#include "pong/core/constants.hpp"
#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"

namespace {
constexpr std::int16_t ToneAmplitude = 6000;
}

bool SoundBoard::synthesize(Effect& effect, float frequency, float seconds) {
    auto const samples = Audio::squareWave(frequency, seconds,
                                           PongConstants::AudioSampleRate, ToneAmplitude);
    if (!effect.buffer.loadFromSamples(samples.data(), samples.size(), 1,
                                       PongConstants::AudioSampleRate)) {
        return false;
    }
    effect.sound.setBuffer(effect.buffer);
    return true;
}

bool SoundBoard::init() {
    ready = synthesize(paddleHit, PongConstants::PaddleToneHz, 0.05f) &&
            synthesize(wallHit, PongConstants::WallToneHz, 0.05f) &&
            synthesize(point, PongConstants::PointToneHz, 0.25f);
    return ready;
}

void SoundBoard::update(const entt::registry& registry) {
    auto state = Match::findMatchState(registry);
    if (state == entt::null) {
        return;
    }
    const auto* events = registry.try_get<Components::MatchEvents>(state);
    if (!events) {
        return;
    }

    if (events->paddleHits < lastSeen.paddleHits ||
        events->wallHits < lastSeen.wallHits ||
        events->points < lastSeen.points) {
        lastSeen = *events;
        return;
    }

    if (ready) {
        if (events->points > lastSeen.points) {
            point.sound.play();
        } else if (events->paddleHits > lastSeen.paddleHits) {
            paddleHit.sound.play();
        } else if (events->wallHits > lastSeen.wallHits) {
            wallHit.sound.play();
        }
    }
    lastSeen = *events;
}
