#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "pong/core/assets.hpp"

class AssetsTest : public ::testing::Test {
protected:
    std::string existing;

    void SetUp() override {
        existing = ::testing::TempDir() + "pong_assets_test_font.ttf";
        std::ofstream file(existing, std::ios::binary);
        file << "font";
    }

    void TearDown() override {
        std::remove(existing.c_str());
    }
};

TEST_F(AssetsTest, MissingCandidatesGiveEmptyPath) {
    std::vector<std::string> candidates{"does/not/exist.ttf", "neither/does/this.ttf"};
    EXPECT_TRUE(Assets::findFirstReadable(candidates).empty());
}

TEST_F(AssetsTest, EmptyCandidateListGivesEmptyPath) {
    EXPECT_TRUE(Assets::findFirstReadable({}).empty());
}

TEST_F(AssetsTest, SkipsMissingFilesAndReturnsFirstReadable) {
    std::vector<std::string> candidates{"does/not/exist.ttf", existing, "also/missing.ttf"};
    EXPECT_EQ(Assets::findFirstReadable(candidates), existing);
}

TEST_F(AssetsTest, PrefersEarlierCandidates) {
    std::vector<std::string> candidates{existing, existing + ".other"};
    EXPECT_EQ(Assets::findFirstReadable(candidates), existing);
}
