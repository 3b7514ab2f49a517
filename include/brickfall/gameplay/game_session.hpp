// Brickfall Gameplay
// game_session.hpp - Rewards, lives and level completion bookkeeping

#pragma once

#include <brickfall/grid/brick.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace brickfall::core {
class Config;
}

namespace brickfall::gameplay {

// ============================================================================
// Game Event Listener
// ============================================================================

class IGameEventListener {
public:
    virtual ~IGameEventListener() = default;

    // Fired once per level when the last required brick is destroyed
    virtual void on_level_complete() = 0;

    virtual void on_lives_lost(int32_t count) = 0;

    // Spawn an item pickup at the destroyed brick's position
    virtual void on_item_drop(const grid::PixelPos& position) = 0;
};

// ============================================================================
// Session Configuration
// ============================================================================

struct GameSessionConfig {
    double coin_multiplier = 1.0;
    double drop_chance_bonus = 0.0;
    int32_t starting_lives = 3;
    uint32_t seed = 0;  // 0 = random

    [[nodiscard]] static GameSessionConfig from_config(const core::Config& config);
};

struct DestructionReward {
    int32_t coins_awarded = 0;
    bool drop_triggered = false;
};

// Score awarded per coin of a destroyed brick's value
inline constexpr int32_t SCORE_PER_COIN_VALUE = 10;

// ============================================================================
// Game Session
// ============================================================================

class GameSession {
public:
    explicit GameSession(const GameSessionConfig& config = {});
    ~GameSession();

    // Non-copyable, non-movable
    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;
    GameSession(GameSession&&) = delete;
    GameSession& operator=(GameSession&&) = delete;

    // ========================================================================
    // Level Lifecycle
    // ========================================================================

    // Reset the required-brick counter for a freshly populated playfield
    void begin_level(size_t required_bricks);

    // Count bricks added after population (endless rows)
    void add_required_bricks(size_t count);

    // Bricks that left the playfield without being destroyed (never completes a level)
    void remove_required_bricks(size_t count);

    void advance_level();

    // ========================================================================
    // Events
    // ========================================================================

    // Award coins/score, roll an item drop and update the required counter
    DestructionReward on_brick_destroyed(const grid::Brick& brick);

    void lose_lives(int32_t count);

    void set_listener(IGameEventListener* listener);

    // Uniform [0, 1) source for drop rolls
    void set_random_source(std::function<double()> source);

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] int64_t get_coins() const;
    [[nodiscard]] int64_t get_score() const;
    [[nodiscard]] int32_t get_lives() const;
    [[nodiscard]] int32_t get_level() const;
    [[nodiscard]] int64_t get_required_remaining() const;
    [[nodiscard]] bool is_level_complete() const;
    [[nodiscard]] bool is_game_over() const;
    [[nodiscard]] size_t get_bricks_destroyed() const;

    [[nodiscard]] const GameSessionConfig& get_config() const;
    void set_coin_multiplier(double multiplier);
    void set_drop_chance_bonus(double bonus);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace brickfall::gameplay
