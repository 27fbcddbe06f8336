#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace world {

// Kinds of move a trader can make in one decision step
enum class ActionKind : uint8_t {
    MOVE = 0,   // travel along a route to another settlement
    BUY = 1,    // buy one lot of an item at the local market
    SELL = 2,   // sell held cargo of an item at the local market
    WAIT = 3    // spend a turn in place
};

const char* action_kind_name(ActionKind kind);

// A discrete choice for the deciding agent.
//
// The aggregation key is derived from the whole payload (kind, target,
// quantity), so two structurally different actions never share a key.
struct Action {
    ActionKind kind = ActionKind::WAIT;
    int32_t target = -1;      // destination settlement (MOVE) or item id (BUY/SELL)
    int32_t quantity = 0;     // units traded (BUY/SELL), 0 otherwise

    static Action move(int32_t destination) { return Action{ActionKind::MOVE, destination, 0}; }
    static Action buy(int32_t item_id, int32_t units) { return Action{ActionKind::BUY, item_id, units}; }
    static Action sell(int32_t item_id, int32_t units) { return Action{ActionKind::SELL, item_id, units}; }
    static Action wait() { return Action{ActionKind::WAIT, -1, 0}; }

    // "move:3", "buy:2x5", "sell:2x5", "wait"
    std::string key() const;

    bool operator==(const Action& other) const {
        return kind == other.kind && target == other.target && quantity == other.quantity;
    }
    bool operator!=(const Action& other) const { return !(*this == other); }
};

// One cargo slot: item type and units held
struct InventorySlot {
    int32_t item_id = 0;
    int32_t quantity = 0;

    bool operator==(const InventorySlot& other) const {
        return item_id == other.item_id && quantity == other.quantity;
    }
    bool operator!=(const InventorySlot& other) const { return !(*this == other); }
};

// Snapshot of the world as seen by the deciding trader.
//
// Treated as an immutable value: transitions build a new State. Inventory is
// kept sorted by item_id with one slot per item so equal cargo compares equal.
struct State {
    int32_t location = 0;            // current settlement id
    int32_t turn = 0;                // turns elapsed in this episode
    int32_t horizon = 0;             // episode ends when turn >= horizon
    int32_t player = 0;              // acting player (0 = deciding trader)
    int32_t capacity = 0;            // max total cargo units
    double gold = 0.0;
    double initial_wealth = 0.0;     // baseline for reward / value
    std::vector<InventorySlot> inventory;

    // Total units of cargo carried
    int32_t cargo_units() const;

    // Units held of one item (0 when absent)
    int32_t quantity_of(int32_t item_id) const;

    int32_t turns_remaining() const { return horizon > turn ? horizon - turn : 0; }

    // Add (positive) or remove (negative) units, keeping slots canonical.
    // Throws std::invalid_argument if the result would be negative.
    void adjust_inventory(int32_t item_id, int32_t delta);

    // Structural checks; throws mcts::InvalidState
    void validate() const;

    std::string to_string() const;

    bool operator==(const State& other) const;
    bool operator!=(const State& other) const { return !(*this == other); }
};

} // namespace world
