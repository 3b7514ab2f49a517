// Brickfall Destruction System
// ball_effects.cpp - Portal and chaos ball effects

#include <brickfall/destruction/ball_effects.hpp>
#include <cmath>

namespace brickfall::destruction {

void randomize_ball_direction(BallState& ball, std::mt19937& rng) {
    const double speed = glm::length(ball.velocity);
    std::uniform_int_distribution<int> angle_dist(-CHAOS_MAX_ANGLE_DEG, CHAOS_MAX_ANGLE_DEG);
    const double angle = glm::radians(static_cast<double>(angle_dist(rng)));

    // Screen space: negative y points up
    ball.velocity = glm::dvec2(std::sin(angle) * speed, -std::abs(std::cos(angle) * speed));
}

const grid::Brick* find_portal_partner(const grid::BrickStore& store, const grid::Brick& portal) {
    if (!portal.pair_id) {
        return nullptr;
    }
    for (grid::BrickId id : store.snapshot()) {
        if (id == portal.id) {
            continue;
        }
        const grid::Brick* candidate = store.find(id);
        if (candidate != nullptr && candidate->type == grid::BrickType::Portal && !candidate->is_destroyed() &&
            candidate->pair_id == portal.pair_id) {
            return candidate;
        }
    }
    return nullptr;
}

bool teleport_ball(BallState& ball, const grid::BrickStore& store, const grid::Brick& portal) {
    if (portal.is_one_way) {
        return false;
    }
    const grid::Brick* partner = find_portal_partner(store, portal);
    if (partner == nullptr) {
        return false;
    }
    ball.position = partner->position;
    ball.velocity = ball.pre_collision_velocity;
    return true;
}

}  // namespace brickfall::destruction
