// Brickfall Destruction System
// collision_debounce.cpp - Collision debounce implementation

#include <brickfall/destruction/collision_debounce.hpp>

namespace brickfall::destruction {

CollisionDebouncer::CollisionDebouncer(const DebounceConfig& config) : config_(config) {}

bool CollisionDebouncer::should_accept(grid::BrickId id, double now_ms) {
    auto it = last_hit_.find(id);
    if (it != last_hit_.end() && now_ms - it->second < config_.window_ms) {
        return false;
    }
    last_hit_[id] = now_ms;

    if (last_hit_.size() > config_.prune_threshold) {
        prune(now_ms);
    }
    return true;
}

void CollisionDebouncer::forget(grid::BrickId id) {
    last_hit_.erase(id);
}

void CollisionDebouncer::clear() {
    last_hit_.clear();
}

void CollisionDebouncer::prune(double now_ms) {
    for (auto it = last_hit_.begin(); it != last_hit_.end();) {
        if (now_ms - it->second > config_.prune_max_age_ms) {
            it = last_hit_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace brickfall::destruction
