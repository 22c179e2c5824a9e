#include <gtest/gtest.h>
#include "pong/input/axis.hpp"

TEST(AxisTest, UpOnlyMovesTowardTop) {
    EXPECT_FLOAT_EQ(Input::axisFromKeys(true, false), 1.0f);
}

TEST(AxisTest, DownOnlyMovesTowardBottom) {
    EXPECT_FLOAT_EQ(Input::axisFromKeys(false, true), -1.0f);
}

TEST(AxisTest, OpposingKeysCancel) {
    EXPECT_FLOAT_EQ(Input::axisFromKeys(true, true), 0.0f);
}

TEST(AxisTest, NoKeysIsNeutral) {
    EXPECT_FLOAT_EQ(Input::axisFromKeys(false, false), 0.0f);
}
