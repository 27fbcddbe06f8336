#pragma once

#include "state.hpp"
#include "../mcts/environment.hpp"
#include "../mcts/value_estimator.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace world {

// Resource item ids shared with the settlement economy
namespace items {
constexpr int32_t IRON = 0;
constexpr int32_t GOLD_ORE = 1;
constexpr int32_t STONE = 2;
constexpr int32_t WOOD = 3;
constexpr int32_t HERBS = 4;
constexpr int32_t FISH = 5;
constexpr int32_t FOOD = 6;
constexpr int32_t WATER = 7;
} // namespace items

enum class Season : uint8_t {
    SPRING = 0,
    SUMMER = 1,
    AUTUMN = 2,
    WINTER = 3
};

const char* season_name(Season season);

struct Route {
    int32_t to = 0;
    int32_t travel_turns = 1;
    double toll = 0.0;
};

// What a settlement market trades in one item
struct MarketListing {
    int32_t item_id = 0;
    double buy_price = 0.0;    // per unit paid by the trader (0 = not for sale)
    double sell_price = 0.0;   // per unit received by the trader (0 = not bought)
    int32_t lot_size = 1;      // units per BUY action
};

struct Settlement {
    int32_t id = 0;
    std::string name;
    std::vector<Route> routes;
    std::vector<MarketListing> market;

    const MarketListing* find_listing(int32_t item_id) const;
    const Route* find_route(int32_t to) const;
};

struct TraderWorldConfig {
    double reward_scale = 100.0;        // wealth change mapped to tanh(delta / scale)
    int32_t season_length = 0;          // turns per season (0 disables seasons)
    Season start_season = Season::SPRING;
    bool allow_wait = true;             // WAIT is a legal action
};

// Trader navigation over a graph of settlements with local markets.
//
// Build the world (add_settlement / add_route / set_listing /
// set_seasonal_modifier) before searching; once shared with a search the
// world is read-only and safe to use from every worker.
//
// Legal actions, in order: MOVE along each affordable route, BUY one lot of
// each affordable item that fits, SELL all held units of each item the local
// market buys, WAIT. MOVE costs the route's travel turns and toll, every other
// action one turn. The episode ends when turn >= horizon.
class TraderWorld : public mcts::Environment {
public:
    explicit TraderWorld(const TraderWorldConfig& config = TraderWorldConfig());

    // Throws std::invalid_argument on duplicate or negative ids
    void add_settlement(int32_t id, const std::string& name);

    void add_route(int32_t from, int32_t to, int32_t travel_turns = 1, double toll = 0.0,
                   bool bidirectional = true);

    // Replaces an existing listing for the same item
    void set_listing(int32_t settlement_id, const MarketListing& listing);

    void set_seasonal_modifier(Season season, int32_t item_id, double multiplier);

    const Settlement* find_settlement(int32_t id) const;
    size_t num_settlements() const { return settlements_.size(); }
    const TraderWorldConfig& config() const { return config_; }

    Season season_at(int32_t turn) const;

    // Seasonal price multiplier for item at the given turn (1.0 when unset)
    double price_modifier(int32_t item_id, int32_t turn) const;

    // Gold plus cargo valued at the local sell prices
    double wealth(const State& state) const;

    // Fresh episode state at a settlement; initial_wealth = gold
    State make_state(int32_t location, double gold, int32_t capacity, int32_t horizon) const;

    // Environment
    std::vector<Action> legal_actions(const State& state) const override;
    State apply(const State& state, const Action& action) const override;
    bool is_terminal(const State& state) const override;
    float reward(const State& state) const override;
    // State::validate() plus a known location; throws mcts::InvalidState
    void validate(const State& state) const override;

private:
    Settlement& mutable_settlement(int32_t id);
    const Settlement& settlement_at(int32_t id) const;

    TraderWorldConfig config_;
    std::vector<Settlement> settlements_;
    std::unordered_map<int32_t, size_t> index_;
    std::map<std::pair<int, int32_t>, double> seasonal_modifiers_;  // (season, item) -> multiplier
};

// Heuristic estimator: tanh of the wealth change, as the terminal reward would
// score it if the episode ended now
class WealthEstimator : public mcts::ValueEstimator {
public:
    explicit WealthEstimator(std::shared_ptr<const TraderWorld> world);

    float estimate(const State& state) const override;

private:
    std::shared_ptr<const TraderWorld> world_;
};

} // namespace world
