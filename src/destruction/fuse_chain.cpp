// Brickfall Destruction System
// fuse_chain.cpp - Fuse flood fill implementation

#include <brickfall/destruction/fuse_chain.hpp>
#include <queue>
#include <unordered_set>

namespace brickfall::destruction {

namespace {

// Fuse bricks in a cell, full-size occupant first
std::vector<grid::BrickId> fuses_in_cell(const grid::BrickStore& store, const grid::GridCoord& cell) {
    std::vector<grid::BrickId> result;
    for (grid::BrickId id : store.occupants(cell)) {
        const grid::Brick* brick = store.find(id);
        if (brick != nullptr && brick->is_fuse()) {
            result.push_back(id);
        }
    }
    return result;
}

}  // namespace

std::vector<grid::BrickId> find_connected_fuses(const grid::BrickStore& store, grid::BrickId start) {
    std::vector<grid::BrickId> chain;
    const grid::Brick* origin = store.find(start);
    if (origin == nullptr || !origin->grid || !origin->is_fuse()) {
        return chain;
    }

    const grid::GridBounds& bounds = store.get_bounds();
    std::unordered_set<grid::GridCoord> visited;
    std::unordered_set<grid::BrickId> collected;
    std::queue<grid::GridCoord> queue;

    chain.push_back(start);
    collected.insert(start);
    queue.push(*origin->grid);
    visited.insert(*origin->grid);

    while (!queue.empty()) {
        const grid::GridCoord current = queue.front();
        queue.pop();

        const auto fuses = fuses_in_cell(store, current);
        if (fuses.empty()) {
            continue;
        }
        for (grid::BrickId id : fuses) {
            if (collected.insert(id).second) {
                chain.push_back(id);
            }
        }

        for (const auto& offset : grid::CARDINAL_OFFSETS) {
            const grid::GridCoord neighbor = current + offset;
            if (!bounds.contains(neighbor) || visited.count(neighbor) != 0) {
                continue;
            }
            visited.insert(neighbor);
            queue.push(neighbor);
        }
    }

    return chain;
}

std::vector<grid::BrickId> splash_targets(const grid::BrickStore& store, const grid::GridCoord& cell) {
    std::vector<grid::BrickId> targets;
    for (const auto& offset : grid::CARDINAL_OFFSETS) {
        for (grid::BrickId id : store.occupants(cell + offset)) {
            const grid::Brick* brick = store.find(id);
            if (brick == nullptr || brick->is_fuse() || brick->type == grid::BrickType::Unbreakable) {
                continue;
            }
            targets.push_back(id);
        }
    }
    return targets;
}

}  // namespace brickfall::destruction
