#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include "pong/audio/tone.hpp"

TEST(ToneTest, LengthMatchesDuration) {
    auto samples = Audio::squareWave(440.0f, 0.05f, 44100, 1000);
    EXPECT_EQ(samples.size(), 2205u);
}

TEST(ToneTest, AlternatesBetweenPeaks) {
    // 1 kHz at 8 kHz: four samples high then four low
    auto samples = Audio::squareWave(1000.0f, 0.001f, 8000, 1000);
    std::vector<std::int16_t> expected{1000, 1000, 1000, 1000, -1000, -1000, -1000, -1000};
    EXPECT_EQ(samples, expected);
}

TEST(ToneTest, NonPositiveFrequencyIsSilence) {
    auto samples = Audio::squareWave(0.0f, 0.01f, 8000, 1000);
    ASSERT_EQ(samples.size(), 80u);
    for (auto s : samples) {
        EXPECT_EQ(s, 0);
    }
}

TEST(ToneTest, EmptyForZeroDurationOrRate) {
    EXPECT_TRUE(Audio::squareWave(440.0f, 0.0f, 44100, 1000).empty());
    EXPECT_TRUE(Audio::squareWave(440.0f, 1.0f, 0, 1000).empty());
}
