/**
 * @file shapes.hpp
 * @brief Axis-aligned rectangle and circle primitives with overlap tests
 */

#pragma once

#include "pong/math/vector_math.hpp"

namespace Shapes {

// Axis-aligned rectangle described by its centre and half extents
struct Rect {
    Vector center;
    Vector halfExtents;
};

struct Circle {
    Vector center;
    float radius;
};

/**
 * @brief Closest point inside (or on) the rectangle to a given point
 *
 * Clamps each coordinate of @p point into the rectangle's span. A point
 * inside the rectangle is returned unchanged.
 */
Vector closestPointOnRect(const Rect& rect, const Vector& point);

/**
 * @brief True if the circle touches or overlaps the rectangle
 *
 * Compares the squared distance from the circle centre to the rectangle's
 * closest point against the squared radius, so touching counts as contact.
 */
bool circleIntersectsRect(const Circle& circle, const Rect& rect);

} // namespace Shapes
