#include "pong/input/axis.hpp"

namespace Input {

float axisFromKeys(bool upPressed, bool downPressed) {
    if (upPressed == downPressed) {
        return 0.0f;
    }
    return upPressed ? 1.0f : -1.0f;
}

} // namespace Input
