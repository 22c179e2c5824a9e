#ifndef PONG_COMPONENTS_BASIC_HPP
#define PONG_COMPONENTS_BASIC_HPP

#include <string>
#include "pong/math/vector_math.hpp"

namespace Components {

    enum class Side {
        Left,
        Right
    };

    // Arena-space position. z only orders drawing.
    struct Transform {
        float x = 0.0f;
        float y = 0.0f;
        float z = 0.0f;

        Transform(float x = 0.0f, float y = 0.0f, float z = 0.0f)
            : x(x), y(y), z(z) {}

        Vector translation() const { return {x, y}; }
    };

    struct Paddle {
        Side side;
        float width;
        float height;

        Paddle(Side side, float width, float height)
            : side(side), width(width), height(height) {}
    };

    struct Ball {
        Vector velocity;
        float radius;

        Ball(const Vector& velocity, float radius)
            : velocity(velocity), radius(radius) {}
    };

    /**
     * @brief A line of on-screen text owned by the presentation layer
     *
     * offsetX/offsetY are pixels relative to the top-middle of the window.
     */
    struct UiText {
        std::string text;
        float offsetX = 0.0f;
        float offsetY = 0.0f;
        unsigned int characterSize = 50;
    };

    inline const char* sideName(Side side) {
        return side == Side::Left ? "left" : "right";
    }

} // namespace Components

#endif
