#include "pong/math/shapes.hpp"

namespace Shapes {

Vector closestPointOnRect(const Rect& rect, const Vector& point) {
    Vector const minCorner = rect.center - rect.halfExtents;
    Vector const maxCorner = rect.center + rect.halfExtents;
    return {clampf(point.x, minCorner.x, maxCorner.x),
            clampf(point.y, minCorner.y, maxCorner.y)};
}

bool circleIntersectsRect(const Circle& circle, const Rect& rect) {
    Vector const closest = closestPointOnRect(rect, circle.center);
    Vector const delta = circle.center - closest;
    return delta.lengthSquared() <= circle.radius * circle.radius;
}

} // namespace Shapes
