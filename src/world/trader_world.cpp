#include "world/trader_world.hpp"
#include "mcts/errors.hpp"
#include <cmath>
#include <stdexcept>

namespace world {

const char* season_name(Season season) {
    switch (season) {
        case Season::SPRING: return "spring";
        case Season::SUMMER: return "summer";
        case Season::AUTUMN: return "autumn";
        case Season::WINTER: return "winter";
    }
    return "unknown";
}

const MarketListing* Settlement::find_listing(int32_t item_id) const {
    for (const auto& listing : market) {
        if (listing.item_id == item_id) {
            return &listing;
        }
    }
    return nullptr;
}

const Route* Settlement::find_route(int32_t destination) const {
    for (const auto& route : routes) {
        if (route.to == destination) {
            return &route;
        }
    }
    return nullptr;
}

TraderWorld::TraderWorld(const TraderWorldConfig& config)
    : config_(config)
{
    if (!(config_.reward_scale > 0.0)) {
        throw std::invalid_argument("TraderWorld: reward_scale must be > 0");
    }
    if (config_.season_length < 0) {
        throw std::invalid_argument("TraderWorld: season_length must be >= 0");
    }
}

void TraderWorld::add_settlement(int32_t id, const std::string& name) {
    if (id < 0) {
        throw std::invalid_argument("TraderWorld: settlement id must be non-negative");
    }
    if (index_.count(id) != 0) {
        throw std::invalid_argument("TraderWorld: duplicate settlement id " + std::to_string(id));
    }
    Settlement settlement;
    settlement.id = id;
    settlement.name = name;
    index_[id] = settlements_.size();
    settlements_.push_back(std::move(settlement));
}

void TraderWorld::add_route(int32_t from, int32_t to, int32_t travel_turns, double toll,
                            bool bidirectional) {
    if (travel_turns < 1) {
        throw std::invalid_argument("TraderWorld: travel_turns must be >= 1");
    }
    if (toll < 0.0) {
        throw std::invalid_argument("TraderWorld: toll must be >= 0");
    }
    // Both ends must exist before either is modified
    settlement_at(from);
    settlement_at(to);

    auto link = [&](int32_t a, int32_t b) {
        Settlement& s = mutable_settlement(a);
        for (auto& route : s.routes) {
            if (route.to == b) {
                route.travel_turns = travel_turns;
                route.toll = toll;
                return;
            }
        }
        s.routes.push_back(Route{b, travel_turns, toll});
    };

    link(from, to);
    if (bidirectional) {
        link(to, from);
    }
}

void TraderWorld::set_listing(int32_t settlement_id, const MarketListing& listing) {
    if (listing.item_id < 0 || listing.lot_size < 1 ||
        listing.buy_price < 0.0 || listing.sell_price < 0.0) {
        throw std::invalid_argument("TraderWorld: invalid market listing for item "
                                    + std::to_string(listing.item_id));
    }
    Settlement& s = mutable_settlement(settlement_id);
    for (auto& existing : s.market) {
        if (existing.item_id == listing.item_id) {
            existing = listing;
            return;
        }
    }
    s.market.push_back(listing);
}

void TraderWorld::set_seasonal_modifier(Season season, int32_t item_id, double multiplier) {
    if (!(multiplier >= 0.0) || !std::isfinite(multiplier)) {
        throw std::invalid_argument("TraderWorld: seasonal multiplier must be finite and >= 0");
    }
    seasonal_modifiers_[{static_cast<int>(season), item_id}] = multiplier;
}

const Settlement* TraderWorld::find_settlement(int32_t id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &settlements_[it->second];
}

Settlement& TraderWorld::mutable_settlement(int32_t id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::invalid_argument("TraderWorld: unknown settlement " + std::to_string(id));
    }
    return settlements_[it->second];
}

const Settlement& TraderWorld::settlement_at(int32_t id) const {
    const Settlement* s = find_settlement(id);
    if (s == nullptr) {
        throw std::invalid_argument("TraderWorld: unknown settlement " + std::to_string(id));
    }
    return *s;
}

Season TraderWorld::season_at(int32_t turn) const {
    if (config_.season_length <= 0) {
        return config_.start_season;
    }
    int index = (static_cast<int>(config_.start_season) + turn / config_.season_length) % 4;
    return static_cast<Season>(index);
}

double TraderWorld::price_modifier(int32_t item_id, int32_t turn) const {
    if (config_.season_length <= 0) {
        return 1.0;
    }
    auto it = seasonal_modifiers_.find({static_cast<int>(season_at(turn)), item_id});
    return it != seasonal_modifiers_.end() ? it->second : 1.0;
}

double TraderWorld::wealth(const State& state) const {
    double total = state.gold;
    const Settlement* here = find_settlement(state.location);
    if (here == nullptr) {
        return total;
    }
    for (const auto& slot : state.inventory) {
        const MarketListing* listing = here->find_listing(slot.item_id);
        if (listing != nullptr) {
            total += slot.quantity * listing->sell_price * price_modifier(slot.item_id, state.turn);
        }
    }
    return total;
}

State TraderWorld::make_state(int32_t location, double gold, int32_t capacity, int32_t horizon) const {
    State state;
    state.location = location;
    state.turn = 0;
    state.horizon = horizon;
    state.player = 0;
    state.capacity = capacity;
    state.gold = gold;
    state.initial_wealth = gold;
    validate(state);
    return state;
}

std::vector<Action> TraderWorld::legal_actions(const State& state) const {
    std::vector<Action> actions;
    if (is_terminal(state)) {
        return actions;
    }

    const Settlement& here = settlement_at(state.location);
    int32_t free_capacity = state.capacity - state.cargo_units();

    for (const auto& route : here.routes) {
        if (state.gold >= route.toll) {
            actions.push_back(Action::move(route.to));
        }
    }

    for (const auto& listing : here.market) {
        if (listing.buy_price <= 0.0 || listing.lot_size > free_capacity) {
            continue;
        }
        double cost = listing.lot_size * listing.buy_price * price_modifier(listing.item_id, state.turn);
        if (state.gold >= cost) {
            actions.push_back(Action::buy(listing.item_id, listing.lot_size));
        }
    }

    for (const auto& slot : state.inventory) {
        const MarketListing* listing = here.find_listing(slot.item_id);
        if (listing != nullptr && listing->sell_price > 0.0) {
            actions.push_back(Action::sell(slot.item_id, slot.quantity));
        }
    }

    if (config_.allow_wait) {
        actions.push_back(Action::wait());
    }

    return actions;
}

State TraderWorld::apply(const State& state, const Action& action) const {
    if (is_terminal(state)) {
        throw std::invalid_argument("TraderWorld: episode already over at turn " + std::to_string(state.turn));
    }

    const Settlement& here = settlement_at(state.location);
    State next = state;

    switch (action.kind) {
        case ActionKind::MOVE: {
            const Route* route = here.find_route(action.target);
            if (route == nullptr) {
                throw std::invalid_argument("TraderWorld: no route from " + std::to_string(state.location)
                                            + " to " + std::to_string(action.target));
            }
            if (state.gold < route->toll) {
                throw std::invalid_argument("TraderWorld: cannot afford toll to " + std::to_string(action.target));
            }
            next.location = route->to;
            next.gold -= route->toll;
            next.turn += route->travel_turns;
            break;
        }
        case ActionKind::BUY: {
            const MarketListing* listing = here.find_listing(action.target);
            if (listing == nullptr || listing->buy_price <= 0.0 || action.quantity < 1) {
                throw std::invalid_argument("TraderWorld: item " + std::to_string(action.target)
                                            + " not for sale here");
            }
            double cost = action.quantity * listing->buy_price * price_modifier(action.target, state.turn);
            if (state.gold < cost) {
                throw std::invalid_argument("TraderWorld: cannot afford " + action.key());
            }
            if (state.cargo_units() + action.quantity > state.capacity) {
                throw std::invalid_argument("TraderWorld: no room for " + action.key());
            }
            next.gold -= cost;
            next.adjust_inventory(action.target, action.quantity);
            next.turn += 1;
            break;
        }
        case ActionKind::SELL: {
            const MarketListing* listing = here.find_listing(action.target);
            if (listing == nullptr || listing->sell_price <= 0.0 || action.quantity < 1) {
                throw std::invalid_argument("TraderWorld: item " + std::to_string(action.target)
                                            + " not bought here");
            }
            next.gold += action.quantity * listing->sell_price * price_modifier(action.target, state.turn);
            next.adjust_inventory(action.target, -action.quantity);
            next.turn += 1;
            break;
        }
        case ActionKind::WAIT:
            if (!config_.allow_wait) {
                throw std::invalid_argument("TraderWorld: waiting is disabled");
            }
            next.turn += 1;
            break;
    }

    return next;
}

bool TraderWorld::is_terminal(const State& state) const {
    return state.turn >= state.horizon;
}

float TraderWorld::reward(const State& state) const {
    double delta = wealth(state) - state.initial_wealth;
    return static_cast<float>(std::tanh(delta / config_.reward_scale));
}

void TraderWorld::validate(const State& state) const {
    state.validate();
    if (find_settlement(state.location) == nullptr) {
        throw mcts::InvalidState("unknown settlement " + std::to_string(state.location));
    }
}

WealthEstimator::WealthEstimator(std::shared_ptr<const TraderWorld> world)
    : world_(std::move(world))
{
    if (!world_) {
        throw std::invalid_argument("WealthEstimator: world is null");
    }
}

float WealthEstimator::estimate(const State& state) const {
    double delta = world_->wealth(state) - state.initial_wealth;
    return static_cast<float>(std::tanh(delta / world_->config().reward_scale));
}

} // namespace world
