#include "pong/systems/bounce.hpp"

#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"
#include "pong/math/shapes.hpp"

namespace Systems {

void BounceSystem::setGameConfig(const GameConfig& config) {
    gameConfig = config;
}

bool BounceSystem::movingToward(Components::Side side, float vx) {
    return (side == Components::Side::Left && vx < 0.0f) ||
           (side == Components::Side::Right && vx > 0.0f);
}

void BounceSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BounceSystem");

    auto ballEntity = Match::findBall(registry);
    if (!ballEntity) {
        return;
    }

    const auto& ballTransform = registry.get<Components::Transform>(*ballEntity);
    auto& ball = registry.get<Components::Ball>(*ballEntity);

    // The two checks touch orthogonal velocity components, so order is irrelevant
    unsigned int const paddleHits = bounceOffPaddles(registry, ballTransform, ball);
    unsigned int const wallHits = bounceOffWalls(ballTransform, ball);

    if (auto* events = Match::matchEvents(registry)) {
        events->paddleHits += paddleHits;
        events->wallHits += wallHits;
    }
}

unsigned int BounceSystem::bounceOffPaddles(entt::registry &registry,
                                            const Components::Transform& ballTransform,
                                            Components::Ball& ball) const {
    unsigned int hits = 0;
    Shapes::Circle const circle{ballTransform.translation(), ball.radius};

    auto view = registry.view<const Components::Paddle, const Components::Transform>();
    for (auto &&[entity, paddle, transform] : view.each()) {
        Shapes::Rect const rect{transform.translation(),
                                Vector(paddle.width * 0.5f, paddle.height * 0.5f)};

        if (!Shapes::circleIntersectsRect(circle, rect)) {
            continue;
        }
        if (movingToward(paddle.side, ball.velocity.x)) {
            ball.velocity.x = -ball.velocity.x;
            ++hits;
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
                      "Ball bounced off " << Components::sideName(paddle.side) << " paddle\n");
        }
    }
    return hits;
}

unsigned int BounceSystem::bounceOffWalls(const Components::Transform& ballTransform,
                                          Components::Ball& ball) const {
    bool const touchingBottom = ballTransform.y - ball.radius <= 0.0f;
    bool const touchingTop = ballTransform.y + ball.radius >= gameConfig.ArenaHeight;

    if ((touchingBottom && ball.velocity.y < 0.0f) ||
        (touchingTop && ball.velocity.y > 0.0f)) {
        ball.velocity.y = -ball.velocity.y;
        return 1;
    }
    return 0;
}

} // namespace Systems
