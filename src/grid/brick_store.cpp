// Brickfall Grid System
// brick_store.cpp - Brick store implementation

#include <algorithm>
#include <brickfall/core/logger.hpp>
#include <brickfall/grid/brick_store.hpp>

namespace brickfall::grid {

BrickStore::BrickStore(const GridBounds& bounds) : bounds_(bounds) {}

bool BrickStore::set_bounds(const GridBounds& bounds) {
    if (!bricks_.empty()) {
        BRICKFALL_LOG_WARN(core::log_category::GRID, "Cannot resize a populated brick store");
        return false;
    }
    bounds_ = bounds;
    return true;
}

BrickId BrickStore::add(Brick brick) {
    if (brick.grid) {
        const GridCoord cell = *brick.grid;
        if (!bounds_.contains(cell)) {
            BRICKFALL_LOG_DEBUG(core::log_category::GRID, "Rejected brick at ({}, {}): out of bounds {}x{}", cell.x,
                                cell.y, bounds_.width, bounds_.height);
            return INVALID_BRICK;
        }
        if (!can_place(cell, brick.half_slot)) {
            BRICKFALL_LOG_DEBUG(core::log_category::GRID, "Rejected brick at ({}, {}) slot {}: cell occupied", cell.x,
                                cell.y, half_slot_to_string(brick.half_slot));
            return INVALID_BRICK;
        }
    }

    const BrickId id = next_id_++;
    brick.id = id;
    brick.health = std::clamp(brick.health, 0, std::max(brick.max_health, 0));

    if (brick.grid) {
        grid_index_[*brick.grid].slot_ref(brick.half_slot) = id;
    }
    bricks_.emplace(id, std::move(brick));
    return id;
}

bool BrickStore::remove(BrickId id) {
    auto it = bricks_.find(id);
    if (it == bricks_.end()) {
        return false;
    }
    unindex(it->second);
    bricks_.erase(it);
    return true;
}

bool BrickStore::relocate(BrickId id, const GridCoord& cell) {
    auto it = bricks_.find(id);
    if (it == bricks_.end() || !it->second.grid) {
        return false;
    }

    Brick& brick = it->second;
    if (*brick.grid == cell) {
        return true;
    }
    if (!bounds_.contains(cell) || !can_place(cell, brick.half_slot)) {
        return false;
    }

    unindex(brick);
    brick.grid = cell;
    grid_index_[cell].slot_ref(brick.half_slot) = id;
    return true;
}

void BrickStore::clear() {
    bricks_.clear();
    grid_index_.clear();
}

Brick* BrickStore::find(BrickId id) {
    auto it = bricks_.find(id);
    return it != bricks_.end() ? &it->second : nullptr;
}

const Brick* BrickStore::find(BrickId id) const {
    auto it = bricks_.find(id);
    return it != bricks_.end() ? &it->second : nullptr;
}

Brick* BrickStore::find_by_grid(int32_t col, int32_t row, HalfSlot slot) {
    auto it = grid_index_.find(GridCoord(col, row));
    if (it == grid_index_.end()) {
        return nullptr;
    }
    return find(it->second.get(slot));
}

const Brick* BrickStore::find_by_grid(int32_t col, int32_t row, HalfSlot slot) const {
    auto it = grid_index_.find(GridCoord(col, row));
    if (it == grid_index_.end()) {
        return nullptr;
    }
    return find(it->second.get(slot));
}

std::vector<BrickId> BrickStore::occupants(const GridCoord& cell) const {
    std::vector<BrickId> result;
    auto it = grid_index_.find(cell);
    if (it == grid_index_.end()) {
        return result;
    }
    for (BrickId id : {it->second.full, it->second.left, it->second.right}) {
        if (id != INVALID_BRICK) {
            result.push_back(id);
        }
    }
    return result;
}

bool BrickStore::can_place(const GridCoord& cell, HalfSlot slot) const {
    auto it = grid_index_.find(cell);
    if (it == grid_index_.end()) {
        return true;
    }
    return it->second.accepts(slot);
}

std::vector<BrickId> BrickStore::snapshot() const {
    std::vector<BrickId> ids;
    ids.reserve(bricks_.size());
    for (const auto& [id, brick] : bricks_) {
        ids.push_back(id);
    }
    // Ids are monotonic, so sorting restores creation order
    std::sort(ids.begin(), ids.end());
    return ids;
}

void BrickStore::for_each(const std::function<void(const Brick&)>& fn) const {
    for (BrickId id : snapshot()) {
        fn(bricks_.at(id));
    }
}

size_t BrickStore::required_count() const {
    return static_cast<size_t>(std::count_if(bricks_.begin(), bricks_.end(),
                                             [](const auto& entry) { return entry.second.counts_for_completion(); }));
}

void BrickStore::unindex(const Brick& brick) {
    if (!brick.grid) {
        return;
    }
    auto it = grid_index_.find(*brick.grid);
    if (it == grid_index_.end()) {
        return;
    }
    BrickId& slot = it->second.slot_ref(brick.half_slot);
    if (slot == brick.id) {
        slot = INVALID_BRICK;
    }
    if (it->second.empty()) {
        grid_index_.erase(it);
    }
}

}  // namespace brickfall::grid
