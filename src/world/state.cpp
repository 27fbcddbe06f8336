#include "world/state.hpp"
#include "mcts/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace world {

const char* action_kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::MOVE: return "move";
        case ActionKind::BUY:  return "buy";
        case ActionKind::SELL: return "sell";
        case ActionKind::WAIT: return "wait";
    }
    return "unknown";
}

std::string Action::key() const {
    switch (kind) {
        case ActionKind::MOVE:
            return "move:" + std::to_string(target);
        case ActionKind::BUY:
        case ActionKind::SELL:
            return std::string(action_kind_name(kind)) + ":" + std::to_string(target)
                 + "x" + std::to_string(quantity);
        case ActionKind::WAIT:
            break;
    }
    return "wait";
}

int32_t State::cargo_units() const {
    int32_t total = 0;
    for (const auto& slot : inventory) {
        total += slot.quantity;
    }
    return total;
}

int32_t State::quantity_of(int32_t item_id) const {
    for (const auto& slot : inventory) {
        if (slot.item_id == item_id) {
            return slot.quantity;
        }
    }
    return 0;
}

void State::adjust_inventory(int32_t item_id, int32_t delta) {
    auto it = std::lower_bound(inventory.begin(), inventory.end(), item_id,
                               [](const InventorySlot& slot, int32_t id) { return slot.item_id < id; });

    if (it == inventory.end() || it->item_id != item_id) {
        if (delta < 0) {
            throw std::invalid_argument("cannot remove item " + std::to_string(item_id) + ": not held");
        }
        if (delta > 0) {
            inventory.insert(it, InventorySlot{item_id, delta});
        }
        return;
    }

    int32_t updated = it->quantity + delta;
    if (updated < 0) {
        throw std::invalid_argument("cannot remove " + std::to_string(-delta) + " of item "
                                    + std::to_string(item_id) + ": only "
                                    + std::to_string(it->quantity) + " held");
    }
    if (updated == 0) {
        inventory.erase(it);
    } else {
        it->quantity = updated;
    }
}

void State::validate() const {
    if (location < 0) {
        throw mcts::InvalidState("location must be non-negative, got " + std::to_string(location));
    }
    if (turn < 0 || horizon < 0) {
        throw mcts::InvalidState("turn and horizon must be non-negative");
    }
    if (capacity < 0) {
        throw mcts::InvalidState("capacity must be non-negative, got " + std::to_string(capacity));
    }
    if (!std::isfinite(gold) || !std::isfinite(initial_wealth)) {
        throw mcts::InvalidState("gold and initial_wealth must be finite");
    }

    int64_t cargo = 0;
    for (size_t i = 0; i < inventory.size(); ++i) {
        const auto& slot = inventory[i];
        if (slot.item_id < 0) {
            throw mcts::InvalidState("inventory item id must be non-negative");
        }
        if (slot.quantity <= 0) {
            throw mcts::InvalidState("inventory slot for item " + std::to_string(slot.item_id)
                                     + " has non-positive quantity");
        }
        if (i > 0 && inventory[i - 1].item_id >= slot.item_id) {
            throw mcts::InvalidState("inventory slots must be unique and ordered by item id");
        }
        cargo += slot.quantity;
    }
    if (cargo > capacity) {
        throw mcts::InvalidState("cargo (" + std::to_string(cargo) + ") exceeds capacity ("
                                 + std::to_string(capacity) + ")");
    }
}

std::string State::to_string() const {
    std::ostringstream out;
    out << "State(location=" << location
        << ", turn=" << turn << "/" << horizon
        << ", player=" << player
        << ", gold=" << gold
        << ", cargo=" << cargo_units() << "/" << capacity
        << ", inventory=[";
    for (size_t i = 0; i < inventory.size(); ++i) {
        if (i > 0) out << ", ";
        out << inventory[i].item_id << ":" << inventory[i].quantity;
    }
    out << "])";
    return out.str();
}

bool State::operator==(const State& other) const {
    return location == other.location
        && turn == other.turn
        && horizon == other.horizon
        && player == other.player
        && capacity == other.capacity
        && gold == other.gold
        && initial_wealth == other.initial_wealth
        && inventory == other.inventory;
}

} // namespace world
