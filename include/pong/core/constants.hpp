#ifndef PONG_CONSTANTS_HPP
#define PONG_CONSTANTS_HPP

#include <string>
#include <vector>

namespace PongConstants {

    // Display
    extern const unsigned int ScreenLength;
    extern const char* const WindowTitle;

    // Tried in order; the bundled font path first, then common system fonts
    extern const std::vector<std::string> FontSearchPaths;

    // Input action names, one axis per paddle
    extern const std::string LeftPaddleAction;
    extern const std::string RightPaddleAction;

    // Sound effects
    extern const unsigned int AudioSampleRate;
    extern const float PaddleToneHz;
    extern const float WallToneHz;
    extern const float PointToneHz;

    // Seconds between profiler dumps from the main loop
    extern const float ProfilerPrintIntervalSeconds;

} // namespace PongConstants

#endif // PONG_CONSTANTS_HPP
