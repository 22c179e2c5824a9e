#pragma once

namespace Input {

/**
 * @brief Axis value for a pair of opposing keys
 *
 * +1 with only the up key held, -1 with only the down key held, 0 when both
 * or neither are held.
 */
float axisFromKeys(bool upPressed, bool downPressed);

} // namespace Input
