// Brickfall Grid System
// brick_store.hpp - Live brick collection indexed by id and grid cell

#pragma once

#include "brick.hpp"
#include "types.hpp"

#include <functional>
#include <unordered_map>
#include <vector>

namespace brickfall::grid {

// ============================================================================
// Cell Occupancy
// ============================================================================

// A cell holds either one full brick or up to two half bricks, never both
struct CellOccupancy {
    BrickId full = INVALID_BRICK;
    BrickId left = INVALID_BRICK;
    BrickId right = INVALID_BRICK;

    [[nodiscard]] bool empty() const {
        return full == INVALID_BRICK && left == INVALID_BRICK && right == INVALID_BRICK;
    }

    // Whether a brick with the given slot may be placed here
    [[nodiscard]] bool accepts(HalfSlot slot) const {
        switch (slot) {
            case HalfSlot::Left:
                return full == INVALID_BRICK && left == INVALID_BRICK;
            case HalfSlot::Right:
                return full == INVALID_BRICK && right == INVALID_BRICK;
            default:
                return empty();
        }
    }

    [[nodiscard]] BrickId& slot_ref(HalfSlot slot) {
        switch (slot) {
            case HalfSlot::Left:
                return left;
            case HalfSlot::Right:
                return right;
            default:
                return full;
        }
    }

    [[nodiscard]] BrickId get(HalfSlot slot) const {
        switch (slot) {
            case HalfSlot::Left:
                return left;
            case HalfSlot::Right:
                return right;
            default:
                return full;
        }
    }
};

// ============================================================================
// Brick Store
// ============================================================================

// Owns every live brick of the playfield. The grid index is maintained on
// add/remove/relocate, so a removed brick vanishes from spatial queries at once.
// Callers may mutate brick state through find(), but grid and half_slot must
// only change through relocate().
class BrickStore {
public:
    explicit BrickStore(const GridBounds& bounds = {});
    ~BrickStore() = default;

    // Non-copyable (ids are handed out to collaborators), movable
    BrickStore(const BrickStore&) = delete;
    BrickStore& operator=(const BrickStore&) = delete;
    BrickStore(BrickStore&&) = default;
    BrickStore& operator=(BrickStore&&) = default;

    // ========================================================================
    // Bounds
    // ========================================================================

    [[nodiscard]] const GridBounds& get_bounds() const { return bounds_; }

    // Only valid on an empty store
    bool set_bounds(const GridBounds& bounds);

    // ========================================================================
    // Mutation
    // ========================================================================

    // Returns the assigned id, or INVALID_BRICK when the cell is out of
    // bounds or the slot is already taken
    BrickId add(Brick brick);

    // Returns false if the id is unknown
    bool remove(BrickId id);

    // Move a gridded brick to another cell, keeping its slot
    bool relocate(BrickId id, const GridCoord& cell);

    void clear();

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] Brick* find(BrickId id);
    [[nodiscard]] const Brick* find(BrickId id) const;

    [[nodiscard]] bool contains(BrickId id) const { return bricks_.count(id) != 0; }

    // Slot-less query sees only a full-size occupant; a slotted query sees
    // only the half-size occupant of that slot
    [[nodiscard]] Brick* find_by_grid(int32_t col, int32_t row, HalfSlot slot = HalfSlot::None);
    [[nodiscard]] const Brick* find_by_grid(int32_t col, int32_t row, HalfSlot slot = HalfSlot::None) const;

    // Every brick in a cell regardless of size
    [[nodiscard]] std::vector<BrickId> occupants(const GridCoord& cell) const;

    // Whether a brick with the given slot could be placed in the cell
    [[nodiscard]] bool can_place(const GridCoord& cell, HalfSlot slot) const;

    // Live ids in creation order; stable under later mutation
    [[nodiscard]] std::vector<BrickId> snapshot() const;

    void for_each(const std::function<void(const Brick&)>& fn) const;

    [[nodiscard]] size_t size() const { return bricks_.size(); }
    [[nodiscard]] bool empty() const { return bricks_.empty(); }

    // Bricks that must be destroyed to complete the level
    [[nodiscard]] size_t required_count() const;

private:
    GridBounds bounds_;
    BrickId next_id_ = 1;
    std::unordered_map<BrickId, Brick> bricks_;
    std::unordered_map<GridCoord, CellOccupancy> grid_index_;

    void unindex(const Brick& brick);
};

}  // namespace brickfall::grid
