// Brickfall Destruction System
// blast.cpp - TNT blast ring resolution implementation

#include <algorithm>
#include <brickfall/destruction/blast.hpp>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace brickfall::destruction {

namespace {

struct HalfPlacement {
    int32_t col;
    grid::HalfSlot half;
};

// A full brick covers both halves of its cell
int expand_halves(int32_t col, grid::HalfSlot slot, HalfPlacement out[2]) {
    if (slot == grid::HalfSlot::None) {
        out[0] = {col, grid::HalfSlot::Left};
        out[1] = {col, grid::HalfSlot::Right};
        return 2;
    }
    out[0] = {col, slot};
    return 1;
}

// Halves facing each other across the column gap
bool halves_face(const HalfPlacement& from, const HalfPlacement& to) {
    return (from.col > to.col && from.half == grid::HalfSlot::Left && to.half == grid::HalfSlot::Right) ||
           (from.col < to.col && from.half == grid::HalfSlot::Right && to.half == grid::HalfSlot::Left);
}

double column_distance(const HalfPlacement& from, const HalfPlacement& to) {
    const int32_t col_diff = std::abs(from.col - to.col);
    if (col_diff == 0) {
        return 0.0;
    }
    const double edge = halves_face(from, to) ? 0.5 : 1.5;
    return (col_diff - 1) * 2.0 + edge;
}

}  // namespace

double half_block_distance(const grid::GridCoord& a, grid::HalfSlot a_slot, const grid::GridCoord& b,
                           grid::HalfSlot b_slot) {
    HalfPlacement a_halves[2];
    HalfPlacement b_halves[2];
    const int a_count = expand_halves(a.x, a_slot, a_halves);
    const int b_count = expand_halves(b.x, b_slot, b_halves);
    const int32_t row_diff = std::abs(a.y - b.y);

    double best = std::numeric_limits<double>::infinity();
    for (int i = 0; i < a_count; ++i) {
        for (int j = 0; j < b_count; ++j) {
            double distance;
            if (a_halves[i].col == b_halves[j].col && row_diff == 0) {
                distance = a_halves[i].half != b_halves[j].half ? 0.5 : 0.0;
            } else {
                distance = std::max(column_distance(a_halves[i], b_halves[j]), static_cast<double>(row_diff));
            }
            best = std::min(best, distance);
        }
    }
    return best;
}

int32_t blast_ring(double distance) {
    return static_cast<int32_t>(std::ceil(distance));
}

int32_t blast_damage_for_ring(int32_t ring) {
    if (ring < 0 || ring > BLAST_MAX_RING) {
        return 0;
    }
    return ring < BLAST_MAX_RING ? BLAST_HEAVY_DAMAGE : BLAST_LIGHT_DAMAGE;
}

std::vector<BlastTarget> plan_blast(const grid::BrickStore& store, grid::BrickId tnt) {
    std::vector<BlastTarget> targets;
    const grid::Brick* source = store.find(tnt);
    if (source == nullptr || !source->grid) {
        return targets;
    }

    for (grid::BrickId id : store.snapshot()) {
        if (id == tnt) {
            continue;
        }
        const grid::Brick* brick = store.find(id);
        if (brick == nullptr || !brick->grid || brick->is_destroyed()) {
            continue;
        }

        BlastTarget target;
        target.id = id;
        target.distance = half_block_distance(*source->grid, source->half_slot, *brick->grid, brick->half_slot);
        target.ring = blast_ring(target.distance);
        target.source = target.ring <= BLAST_UNBREAKABLE_MAX_RING ? DamageSource::BlastInner : DamageSource::Blast;

        if (brick->type == grid::BrickType::Unbreakable) {
            if (target.ring > BLAST_UNBREAKABLE_MAX_RING) {
                continue;
            }
            target.damage = LETHAL_DAMAGE;
        } else {
            target.damage = blast_damage_for_ring(target.ring);
        }

        if (target.damage > 0) {
            targets.push_back(target);
        }
    }
    return targets;
}

std::vector<grid::BrickId> plan_fallback_blast(const grid::BrickStore& store, grid::BrickId tnt, double radius) {
    std::vector<grid::BrickId> targets;
    const grid::Brick* source = store.find(tnt);
    if (source == nullptr) {
        return targets;
    }

    for (grid::BrickId id : store.snapshot()) {
        if (id == tnt) {
            continue;
        }
        const grid::Brick* brick = store.find(id);
        if (brick == nullptr || brick->type == grid::BrickType::Unbreakable) {
            continue;
        }
        if (glm::length(brick->position - source->position) <= radius) {
            targets.push_back(id);
        }
    }
    return targets;
}

}  // namespace brickfall::destruction
