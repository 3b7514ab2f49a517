// Brickfall Destruction System
// ball_effects.hpp - Ball state and the portal/chaos effects applied to it

#pragma once

#include <brickfall/grid/brick_store.hpp>

#include <glm/glm.hpp>
#include <random>

namespace brickfall::destruction {

// Ball handle exchanged with the physics collaborator
struct BallState {
    grid::PixelPos position{0.0, 0.0};
    glm::dvec2 velocity{0.0, 0.0};

    // Captured before the physics engine resolved the collision
    glm::dvec2 pre_collision_velocity{0.0, 0.0};
};

// Chaos arc: integer degrees from vertical, inclusive
inline constexpr int CHAOS_MAX_ANGLE_DEG = 90;

// New direction sampled uniformly in the upward +/-90 degree arc, same speed
void randomize_ball_direction(BallState& ball, std::mt19937& rng);

// Another live portal sharing the pair id, or nullptr
[[nodiscard]] const grid::Brick* find_portal_partner(const grid::BrickStore& store, const grid::Brick& portal);

// Moves the ball onto the partner portal and restores its pre-collision
// velocity. One-way and unpaired portals do nothing and return false.
bool teleport_ball(BallState& ball, const grid::BrickStore& store, const grid::Brick& portal);

}  // namespace brickfall::destruction
