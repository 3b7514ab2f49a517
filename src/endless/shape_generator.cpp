// Brickfall Endless Mode
// shape_generator.cpp - Random brick formations for the 16x16 endless grid

#include <brickfall/core/logger.hpp>
#include <brickfall/endless/shape_generator.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <random>

namespace brickfall::endless {

namespace {

// ============================================================================
// Containment Tests
// ============================================================================

bool in_rectangle(const grid::GridCoord& p, const grid::GridCoord& c, int32_t w, int32_t h) {
    return p.x >= c.x - w / 2 && p.x <= c.x + w / 2 && p.y >= c.y - h / 2 && p.y <= c.y + h / 2;
}

bool in_ellipse(const grid::GridCoord& p, const grid::GridCoord& c, int32_t w, int32_t h) {
    const double dx = (p.x - c.x) / (w / 2.0);
    const double dy = (p.y - c.y) / (h / 2.0);
    return dx * dx + dy * dy <= 1.0;
}

// Barycentric test against the apex (c.x, top) and the two base corners
bool in_triangle(const grid::GridCoord& p, const grid::GridCoord& c, int32_t w, int32_t h) {
    const glm::dvec2 top(c.x, c.y - h / 2);
    const glm::dvec2 bottom_left(c.x - w / 2, c.y + h / 2);
    const glm::dvec2 bottom_right(c.x + w / 2, c.y + h / 2);

    const glm::dvec2 v0 = bottom_right - top;
    const glm::dvec2 v1 = bottom_left - top;
    const glm::dvec2 v2 = glm::dvec2(p) - top;

    const double dot00 = glm::dot(v0, v0);
    const double dot01 = glm::dot(v0, v1);
    const double dot02 = glm::dot(v0, v2);
    const double dot11 = glm::dot(v1, v1);
    const double dot12 = glm::dot(v1, v2);

    const double denom = dot00 * dot11 - dot01 * dot01;
    if (denom == 0.0) {
        return false;
    }
    const double u = (dot11 * dot02 - dot01 * dot12) / denom;
    const double v = (dot00 * dot12 - dot01 * dot02) / denom;
    return u >= 0.0 && v >= 0.0 && u + v <= 1.0;
}

bool in_diamond(const grid::GridCoord& p, const grid::GridCoord& c, int32_t w, int32_t h) {
    const double dx = std::abs(p.x - c.x);
    const double dy = std::abs(p.y - c.y);
    return dx / (w / 2.0) + dy / (h / 2.0) <= 1.0;
}

bool in_cross(const grid::GridCoord& p, const grid::GridCoord& c, int32_t w, int32_t h) {
    const int32_t arm_width = std::max(1, w / 3);
    const int32_t arm_height = std::max(1, h / 3);
    const int32_t dx = std::abs(p.x - c.x);
    const int32_t dy = std::abs(p.y - c.y);

    const bool in_horizontal = dy <= arm_height && dx <= w / 2;
    const bool in_vertical = dx <= arm_width && dy <= h / 2;
    return in_horizontal || in_vertical;
}

constexpr std::array<grid::BrickType, 3> UNLOCKABLE_TYPES = {grid::BrickType::Default, grid::BrickType::Metal,
                                                              grid::BrickType::Gold};

}  // namespace

const char* shape_type_to_string(ShapeType type) {
    switch (type) {
        case ShapeType::Rectangle:
            return "rectangle";
        case ShapeType::Ellipse:
            return "ellipse";
        case ShapeType::Triangle:
            return "triangle";
        case ShapeType::Diamond:
            return "diamond";
        case ShapeType::Cross:
            return "cross";
        default:
            return "unknown";
    }
}

// ============================================================================
// ShapeParams
// ============================================================================

bool ShapeParams::contains(const grid::GridCoord& cell) const {
    switch (type) {
        case ShapeType::Rectangle:
            return in_rectangle(cell, center, width, height);
        case ShapeType::Ellipse:
            return in_ellipse(cell, center, width, height);
        case ShapeType::Triangle:
            return in_triangle(cell, center, width, height);
        case ShapeType::Diamond:
            return in_diamond(cell, center, width, height);
        case ShapeType::Cross:
            return in_cross(cell, center, width, height);
        default:
            return false;
    }
}

bool ShapeParams::on_border(const grid::GridCoord& cell) const {
    if (!contains(cell)) {
        return false;
    }
    return std::any_of(std::begin(grid::CARDINAL_OFFSETS), std::end(grid::CARDINAL_OFFSETS),
                       [&](const grid::GridCoord& offset) { return !contains(cell + offset); });
}

// ============================================================================
// ShapeGenerator::Impl
// ============================================================================

struct ShapeGenerator::Impl {
    ShapeGeneratorConfig config;
    std::mt19937 rng;

    explicit Impl(const ShapeGeneratorConfig& cfg) : config(cfg) { reseed(cfg.seed); }

    void reseed(uint32_t seed) {
        config.seed = seed;
        rng.seed(seed != 0 ? seed : std::random_device{}());
    }

    // Uniform [0, 1)
    double uniform() { return std::uniform_real_distribution<double>(0.0, 1.0)(rng); }

    // Uniform index in [0, count)
    int32_t pick(int32_t count) {
        if (count <= 1) {
            return 0;
        }
        return std::min(static_cast<int32_t>(std::floor(uniform() * count)), count - 1);
    }
};

// ============================================================================
// ShapeGenerator
// ============================================================================

ShapeGenerator::ShapeGenerator(const ShapeGeneratorConfig& config) : impl_(std::make_unique<Impl>(config)) {}

ShapeGenerator::~ShapeGenerator() = default;

ShapeGenerator::ShapeGenerator(ShapeGenerator&&) noexcept = default;
ShapeGenerator& ShapeGenerator::operator=(ShapeGenerator&&) noexcept = default;

ShapeParams ShapeGenerator::random_shape() {
    const auto& cfg = impl_->config;
    const int32_t size_range = cfg.max_size - cfg.min_size + 1;

    ShapeParams shape;
    shape.type = static_cast<ShapeType>(impl_->pick(static_cast<int32_t>(ShapeType::Count)));
    shape.width = cfg.min_size + impl_->pick(size_range);
    shape.height = cfg.min_size + impl_->pick(size_range);
    shape.center.x = impl_->pick(cfg.grid_size - shape.width) + shape.width / 2;
    shape.center.y = impl_->pick(cfg.grid_size - shape.height) + shape.height / 2;
    shape.filled = impl_->uniform() > cfg.outline_chance;
    return shape;
}

std::vector<level::BrickRecord> ShapeGenerator::generate_bricks(int32_t level, const ShapeParams& shape,
                                                                const grid::CellMetrics& metrics) {
    std::vector<level::BrickRecord> bricks;
    const int32_t size = impl_->config.grid_size;

    for (int32_t row = 0; row < size; ++row) {
        for (int32_t col = 0; col < size; ++col) {
            const grid::GridCoord cell(col, row);
            if (shape.covers(cell)) {
                bricks.push_back(random_brick(level, cell, metrics));
            }
        }
    }

    BRICKFALL_LOG_DEBUG(core::log_category::ENDLESS, "Generated {} {} {}x{} at ({}, {}): {} bricks",
                        shape.filled ? "filled" : "outline", shape_type_to_string(shape.type), shape.width,
                        shape.height, shape.center.x, shape.center.y, bricks.size());
    return bricks;
}

std::vector<level::BrickRecord> ShapeGenerator::generate(int32_t level, const grid::CellMetrics& metrics) {
    const ShapeParams shape = random_shape();
    return generate_bricks(level, shape, metrics);
}

std::vector<level::BrickRecord> ShapeGenerator::generate_row(int32_t level, int32_t row,
                                                             const grid::CellMetrics& metrics) {
    const auto& cfg = impl_->config;
    const int32_t count =
        std::min(cfg.row_min_bricks + impl_->pick(cfg.row_max_bricks - cfg.row_min_bricks + 1), cfg.grid_size);

    std::vector<int32_t> columns;
    while (static_cast<int32_t>(columns.size()) < count) {
        const int32_t col = impl_->pick(cfg.grid_size);
        if (std::find(columns.begin(), columns.end(), col) == columns.end()) {
            columns.push_back(col);
        }
    }

    std::vector<level::BrickRecord> bricks;
    bricks.reserve(columns.size());
    for (int32_t col : columns) {
        bricks.push_back(random_brick(level, grid::GridCoord(col, row), metrics));
    }
    return bricks;
}

level::BrickRecord ShapeGenerator::random_brick(int32_t level, const grid::GridCoord& cell,
                                                const grid::CellMetrics& metrics) {
    level::BrickRecord brick;
    brick.col = cell.x;
    brick.row = cell.y;

    const bool half = impl_->uniform() < impl_->config.half_size_chance;
    brick.is_half_size = half;
    if (half) {
        brick.half_size_align = impl_->uniform() < 0.5 ? grid::HalfSlot::Left : grid::HalfSlot::Right;
    }

    const grid::PixelPos position = grid::to_pixel(cell, brick.slot(), metrics);
    brick.x = position.x;
    brick.y = position.y;

    const int32_t unlocked = std::clamp(level, 1, static_cast<int32_t>(UNLOCKABLE_TYPES.size()));
    brick.type = UNLOCKABLE_TYPES[static_cast<size_t>(impl_->pick(unlocked))];
    brick.color = ENDLESS_PALETTE[impl_->pick(static_cast<int32_t>(std::size(ENDLESS_PALETTE)))];

    int32_t health = 1;
    if (brick.type == grid::BrickType::Metal) {
        health = 3 + level / 3;
    } else if (brick.type == grid::BrickType::Gold) {
        health = 2 + level / 2;
    }
    brick.health = health;
    brick.max_health = health;
    brick.drop_chance = 0.1 + level * 0.02;
    brick.coin_value = (level + 1) * 2;
    return brick;
}

const ShapeGeneratorConfig& ShapeGenerator::get_config() const {
    return impl_->config;
}

void ShapeGenerator::reseed(uint32_t seed) {
    impl_->reseed(seed);
}

}  // namespace brickfall::endless
