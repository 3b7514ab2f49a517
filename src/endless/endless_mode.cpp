// Brickfall Endless Mode
// endless_mode.cpp - Shape levels that descend one row per unproductive shot

#include <brickfall/core/logger.hpp>
#include <brickfall/endless/endless_mode.hpp>
#include <brickfall/level/level_loader.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace brickfall::endless {

// ============================================================================
// EndlessModeManager::Impl
// ============================================================================

struct EndlessModeManager::Impl {
    grid::BrickStore* store = nullptr;
    gameplay::GameSession* session = nullptr;
    destruction::IPresentationSink* presentation = nullptr;
    grid::CellMetrics metrics;
    std::unique_ptr<ShapeGenerator> generator;

    int32_t level = 1;
    bool bricks_hit_this_shot = false;
    double last_paddle_hit_time = 0.0;
    bool initialized = false;

    Stats stats;

    [[nodiscard]] grid::GridBounds bounds() const {
        const int32_t size = generator->get_config().grid_size;
        return grid::GridBounds{size, size};
    }

    void show(const grid::Brick& brick) {
        if (presentation != nullptr) {
            presentation->update_brick_appearance(brick);
        }
    }

    void hide(const grid::Brick& brick) {
        if (presentation != nullptr) {
            presentation->remove_brick_visual(brick);
        }
    }

    void generate_shape() {
        store->for_each([this](const grid::Brick& brick) { hide(brick); });

        level::LevelData shape;
        shape.name = "Endless " + std::to_string(level);
        shape.width = bounds().width;
        shape.height = bounds().height;
        shape.bricks = generator->generate(level, metrics);

        const auto result = level::populate_store(shape, *store, metrics);
        store->for_each([this](const grid::Brick& brick) { show(brick); });

        if (session != nullptr) {
            session->begin_level(result.required);
        }
        ++stats.shapes_generated;
    }

    int32_t shift_down() {
        const int32_t bottom_row = bounds().height - 1;

        // Bottom-up so every target cell has already been vacated
        std::vector<grid::BrickId> ids = store->snapshot();
        std::stable_sort(ids.begin(), ids.end(), [this](grid::BrickId a, grid::BrickId b) {
            return store->find(a)->grid.value_or(grid::GridCoord(0, -1)).y >
                   store->find(b)->grid.value_or(grid::GridCoord(0, -1)).y;
        });

        size_t discarded = 0;
        int32_t lost_required = 0;

        for (grid::BrickId id : ids) {
            grid::Brick* brick = store->find(id);
            if (brick == nullptr || !brick->has_grid()) {
                continue;
            }

            const grid::GridCoord target = *brick->grid + grid::GridCoord(0, 1);
            if (brick->grid->y >= bottom_row) {
                if (brick->counts_for_completion()) {
                    ++lost_required;
                }
                hide(*brick);
                store->remove(id);
                ++discarded;
                continue;
            }

            if (!store->relocate(id, target)) {
                BRICKFALL_LOG_WARN(core::log_category::ENDLESS, "Brick {} could not move to ({}, {})", id, target.x,
                                   target.y);
                continue;
            }
            brick->position = grid::to_pixel(target, brick->half_slot, metrics);
            show(*brick);
        }

        if (session != nullptr && lost_required > 0) {
            session->remove_required_bricks(static_cast<size_t>(lost_required));
        }

        const size_t added_required = add_top_row();
        if (session != nullptr) {
            session->add_required_bricks(added_required);
            session->lose_lives(lost_required);
        }

        ++stats.shifts;
        stats.bricks_discarded += discarded;
        stats.lives_lost += static_cast<size_t>(lost_required);

        BRICKFALL_LOG_DEBUG(core::log_category::ENDLESS, "Shifted board: {} discarded, {} lives lost, {} bricks left",
                            discarded, lost_required, store->size());
        return lost_required;
    }

    // Returns the number of required bricks added
    size_t add_top_row() {
        size_t required = 0;
        for (const auto& record : generator->generate_row(level, 0, metrics)) {
            const grid::GridCoord cell(*record.col, *record.row);
            grid::Brick brick = level::brick_from_record(record, cell, metrics);
            const bool counts = brick.counts_for_completion();

            const grid::BrickId id = store->add(std::move(brick));
            if (id == grid::INVALID_BRICK) {
                BRICKFALL_LOG_DEBUG(core::log_category::ENDLESS, "Top row cell ({}, {}) occupied", cell.x, cell.y);
                continue;
            }
            show(*store->find(id));
            if (counts) {
                ++required;
            }
        }
        ++stats.rows_added;
        return required;
    }
};

// ============================================================================
// EndlessModeManager
// ============================================================================

EndlessModeManager::EndlessModeManager() : impl_(std::make_unique<Impl>()) {}

EndlessModeManager::~EndlessModeManager() {
    if (impl_ && impl_->initialized) {
        shutdown();
    }
}

bool EndlessModeManager::initialize(grid::BrickStore* store, gameplay::GameSession* session,
                                    destruction::IPresentationSink* presentation, const grid::CellMetrics& metrics,
                                    const ShapeGeneratorConfig& config) {
    if (impl_->initialized) {
        BRICKFALL_LOG_WARN(core::log_category::ENDLESS, "EndlessModeManager already initialized");
        return true;
    }
    if (store == nullptr) {
        BRICKFALL_LOG_ERROR(core::log_category::ENDLESS, "EndlessModeManager requires a brick store");
        return false;
    }
    if (config.grid_size <= 0 || config.min_size <= 0 || config.max_size < config.min_size ||
        config.max_size > config.grid_size) {
        BRICKFALL_LOG_ERROR(core::log_category::ENDLESS, "Invalid shape generator config (grid {}, size {}-{})",
                            config.grid_size, config.min_size, config.max_size);
        return false;
    }

    impl_->store = store;
    impl_->session = session;
    impl_->presentation = presentation;
    impl_->metrics = metrics;
    impl_->generator = std::make_unique<ShapeGenerator>(config);
    impl_->level = 1;
    impl_->bricks_hit_this_shot = false;
    impl_->last_paddle_hit_time = 0.0;
    impl_->stats = {};
    impl_->initialized = true;

    impl_->generate_shape();

    BRICKFALL_LOG_INFO(core::log_category::ENDLESS, "Endless mode started with {} bricks", store->size());
    return true;
}

void EndlessModeManager::shutdown() {
    if (!impl_->initialized) {
        return;
    }
    impl_->store = nullptr;
    impl_->session = nullptr;
    impl_->presentation = nullptr;
    impl_->generator.reset();
    impl_->initialized = false;
}

bool EndlessModeManager::is_initialized() const {
    return impl_->initialized;
}

void EndlessModeManager::on_brick_hit() {
    impl_->bricks_hit_this_shot = true;
}

void EndlessModeManager::reset_hit_tracking() {
    impl_->bricks_hit_this_shot = false;
}

int32_t EndlessModeManager::check_and_shift(double paddle_hit_time, bool ball_missed) {
    if (!impl_->initialized) {
        return 0;
    }

    const bool empty_shot = !impl_->bricks_hit_this_shot && paddle_hit_time > impl_->last_paddle_hit_time;
    if (!empty_shot && !ball_missed) {
        return 0;
    }

    const int32_t lost = impl_->shift_down();
    impl_->bricks_hit_this_shot = false;
    impl_->last_paddle_hit_time = paddle_hit_time;
    return lost;
}

int32_t EndlessModeManager::shift_down() {
    if (!impl_->initialized) {
        return 0;
    }
    return impl_->shift_down();
}

void EndlessModeManager::next_level() {
    if (!impl_->initialized) {
        return;
    }
    ++impl_->level;
    if (impl_->session != nullptr) {
        impl_->session->advance_level();
    }
    impl_->bricks_hit_this_shot = false;
    impl_->generate_shape();
    BRICKFALL_LOG_INFO(core::log_category::ENDLESS, "Endless level {}: {} bricks", impl_->level,
                       impl_->store->size());
}

int32_t EndlessModeManager::get_level() const {
    return impl_->level;
}

bool EndlessModeManager::all_bricks_destroyed() const {
    if (!impl_->initialized) {
        return false;
    }
    if (impl_->session != nullptr) {
        return impl_->session->get_required_remaining() == 0;
    }
    return impl_->store->required_count() == 0;
}

void EndlessModeManager::set_metrics(const grid::CellMetrics& metrics) {
    impl_->metrics = metrics;
    if (!impl_->initialized) {
        return;
    }
    for (grid::BrickId id : impl_->store->snapshot()) {
        grid::Brick* brick = impl_->store->find(id);
        if (brick != nullptr && brick->has_grid()) {
            brick->position = grid::to_pixel(*brick->grid, brick->half_slot, metrics);
            impl_->show(*brick);
        }
    }
}

const grid::CellMetrics& EndlessModeManager::get_metrics() const {
    return impl_->metrics;
}

EndlessModeManager::Stats EndlessModeManager::get_stats() const {
    return impl_->stats;
}

}  // namespace brickfall::endless
