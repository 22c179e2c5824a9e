#include "pong/core/constants.hpp"

namespace PongConstants {

    // Display
    const unsigned int ScreenLength   = 600;
    const char* const WindowTitle     = "Pong";

    const std::vector<std::string> FontSearchPaths = {
        "assets/fonts/square.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/System/Library/Fonts/Supplemental/Arial.ttf"
    };

    const std::string LeftPaddleAction  = "left_paddle";
    const std::string RightPaddleAction = "right_paddle";

    const unsigned int AudioSampleRate = 44100;
    const float PaddleToneHz = 440.0f;
    const float WallToneHz   = 220.0f;
    const float PointToneHz  = 880.0f;

    const float ProfilerPrintIntervalSeconds = 10.0f;

} // namespace PongConstants
