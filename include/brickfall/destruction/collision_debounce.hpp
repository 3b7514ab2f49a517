// Brickfall Destruction System
// collision_debounce.hpp - Per-brick duplicate collision suppression

#pragma once

#include <brickfall/grid/brick.hpp>

#include <cstddef>
#include <unordered_map>

namespace brickfall::destruction {

struct DebounceConfig {
    double window_ms = 50.0;          // Callbacks closer than this to the last accepted one are dropped
    size_t prune_threshold = 100;     // Prune once more bricks than this are tracked
    double prune_max_age_ms = 1000.0; // Entries older than this are pruned
};

// Expiry map of last accepted hit time per brick
class CollisionDebouncer {
public:
    explicit CollisionDebouncer(const DebounceConfig& config = {});

    // Records the hit and returns true if it falls outside the window
    bool should_accept(grid::BrickId id, double now_ms);

    // Drop tracking for a destroyed brick
    void forget(grid::BrickId id);

    void clear();

    [[nodiscard]] size_t tracked_count() const { return last_hit_.size(); }
    [[nodiscard]] const DebounceConfig& get_config() const { return config_; }
    void set_config(const DebounceConfig& config) { config_ = config; }

private:
    DebounceConfig config_;
    std::unordered_map<grid::BrickId, double> last_hit_;

    void prune(double now_ms);
};

}  // namespace brickfall::destruction
