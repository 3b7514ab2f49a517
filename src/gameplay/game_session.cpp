// Brickfall Gameplay
// game_session.cpp - Game session implementation

#include <algorithm>
#include <brickfall/core/config.hpp>
#include <brickfall/core/logger.hpp>
#include <brickfall/gameplay/game_session.hpp>
#include <cmath>
#include <random>

namespace brickfall::gameplay {

GameSessionConfig GameSessionConfig::from_config(const core::Config& config) {
    using namespace core;

    GameSessionConfig result;
    result.coin_multiplier =
        config.get_double(config_section::GAMEPLAY, config_key::COIN_MULTIPLIER, result.coin_multiplier);
    result.drop_chance_bonus =
        config.get_double(config_section::GAMEPLAY, config_key::DROP_CHANCE_BONUS, result.drop_chance_bonus);
    result.starting_lives =
        config.get_int(config_section::GAMEPLAY, config_key::STARTING_LIVES, result.starting_lives);
    result.seed = static_cast<uint32_t>(std::max(0, config.get_int(config_section::ENDLESS, config_key::SEED, 0)));
    return result;
}

struct GameSession::Impl {
    GameSessionConfig config;
    IGameEventListener* listener = nullptr;

    int64_t coins = 0;
    int64_t score = 0;
    int32_t lives = 3;
    int32_t level = 1;
    int64_t required_remaining = 0;
    bool level_complete = false;
    size_t bricks_destroyed = 0;

    std::mt19937 rng;
    std::uniform_real_distribution<double> unit_dist{0.0, 1.0};
    std::function<double()> random_source;

    double roll() { return random_source ? random_source() : unit_dist(rng); }

    void check_completion() {
        if (level_complete || required_remaining > 0) {
            return;
        }
        level_complete = true;
        BRICKFALL_LOG_INFO(core::log_category::GAMEPLAY, "Level {} complete (score {}, coins {})", level, score,
                           coins);
        if (listener != nullptr) {
            listener->on_level_complete();
        }
    }
};

GameSession::GameSession(const GameSessionConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->lives = config.starting_lives;
    impl_->rng.seed(config.seed != 0 ? config.seed : std::random_device{}());
}

GameSession::~GameSession() = default;

void GameSession::begin_level(size_t required_bricks) {
    impl_->required_remaining = static_cast<int64_t>(required_bricks);
    impl_->level_complete = false;
    BRICKFALL_LOG_DEBUG(core::log_category::GAMEPLAY, "Level {} started with {} required bricks", impl_->level,
                        required_bricks);
}

void GameSession::add_required_bricks(size_t count) {
    impl_->required_remaining += static_cast<int64_t>(count);
}

void GameSession::remove_required_bricks(size_t count) {
    impl_->required_remaining = std::max<int64_t>(impl_->required_remaining - static_cast<int64_t>(count), 0);
}

void GameSession::advance_level() {
    ++impl_->level;
}

DestructionReward GameSession::on_brick_destroyed(const grid::Brick& brick) {
    DestructionReward reward;
    reward.coins_awarded = static_cast<int32_t>(std::floor(brick.coin_value * impl_->config.coin_multiplier));
    impl_->coins += reward.coins_awarded;
    impl_->score += static_cast<int64_t>(brick.coin_value) * SCORE_PER_COIN_VALUE;
    ++impl_->bricks_destroyed;

    const double drop_chance = std::min(brick.drop_chance + impl_->config.drop_chance_bonus, 1.0);
    if (impl_->roll() < drop_chance) {
        reward.drop_triggered = true;
        if (impl_->listener != nullptr) {
            impl_->listener->on_item_drop(brick.position);
        }
    }

    if (brick.counts_for_completion()) {
        --impl_->required_remaining;
        impl_->check_completion();
    }
    return reward;
}

void GameSession::lose_lives(int32_t count) {
    if (count <= 0) {
        return;
    }
    impl_->lives = std::max(impl_->lives - count, 0);
    BRICKFALL_LOG_INFO(core::log_category::GAMEPLAY, "Lost {} lives, {} remaining", count, impl_->lives);
    if (impl_->listener != nullptr) {
        impl_->listener->on_lives_lost(count);
    }
}

void GameSession::set_listener(IGameEventListener* listener) {
    impl_->listener = listener;
}

void GameSession::set_random_source(std::function<double()> source) {
    impl_->random_source = std::move(source);
}

int64_t GameSession::get_coins() const {
    return impl_->coins;
}

int64_t GameSession::get_score() const {
    return impl_->score;
}

int32_t GameSession::get_lives() const {
    return impl_->lives;
}

int32_t GameSession::get_level() const {
    return impl_->level;
}

int64_t GameSession::get_required_remaining() const {
    return impl_->required_remaining;
}

bool GameSession::is_level_complete() const {
    return impl_->level_complete;
}

bool GameSession::is_game_over() const {
    return impl_->lives <= 0;
}

size_t GameSession::get_bricks_destroyed() const {
    return impl_->bricks_destroyed;
}

const GameSessionConfig& GameSession::get_config() const {
    return impl_->config;
}

void GameSession::set_coin_multiplier(double multiplier) {
    impl_->config.coin_multiplier = multiplier;
}

void GameSession::set_drop_chance_bonus(double bonus) {
    impl_->config.drop_chance_bonus = bonus;
}

}  // namespace brickfall::gameplay
