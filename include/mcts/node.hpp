#pragma once

#include <cstdint>
#include <vector>
#include <utility>
#include "../world/state.hpp"

namespace mcts {

// Node structure for MCTS tree
//
// Each tree belongs to exactly one search (one worker thread), so counters are
// plain integers. Children form a singly linked list in expansion order; the
// order is what breaks ties during selection and best-action choice.
struct Node {
    // Parent node (nullptr for root)
    Node* parent;

    // First / last child in linked list (nullptr if no children)
    Node* first_child;
    Node* last_child;

    // Next sibling in parent's child list (nullptr if last child)
    Node* next_sibling;

    // World snapshot at this node
    world::State state;

    // Action that led to this node (from parent's perspective, unset at root)
    world::Action action;

    // Player that chose `action`; values are stored from this player's perspective
    int32_t mover;

    // Number of backpropagated simulations through this node
    uint32_t visit_count;

    // Sum of backpropagated outcomes
    double value_sum;

    // Selection prior from the value estimator, in [0, 1]
    float prior;

    // Legal actions not yet materialized as children, in legal order
    std::vector<world::Action> untried_actions;
    uint32_t next_untried;

    // Flags: terminal (bit 0), legal actions generated (bit 1)
    uint8_t flags;

    explicit Node(world::State s)
        : parent(nullptr)
        , first_child(nullptr)
        , last_child(nullptr)
        , next_sibling(nullptr)
        , state(std::move(s))
        , action()
        , mover(0)
        , visit_count(0)
        , value_sum(0.0)
        , prior(0.0f)
        , next_untried(0)
        , flags(0)
    {}

    // Mean value (0 for unvisited nodes)
    double q_value() const {
        if (visit_count == 0) {
            return 0.0;
        }
        return value_sum / visit_count;
    }

    bool is_terminal() const {
        return flags & 0x01;
    }

    void set_terminal(bool terminal) {
        if (terminal) {
            flags |= 0x01;
        } else {
            flags &= ~0x01;
        }
    }

    bool actions_generated() const {
        return flags & 0x02;
    }

    void set_actions(std::vector<world::Action> actions) {
        untried_actions = std::move(actions);
        next_untried = 0;
        flags |= 0x02;
    }

    bool has_untried_actions() const {
        return next_untried < untried_actions.size();
    }

    // Next legal action to expand (caller checks has_untried_actions())
    const world::Action& take_untried_action() {
        return untried_actions[next_untried++];
    }

    // Append child at the end of the sibling list
    void add_child(Node* child) {
        child->parent = this;
        if (last_child == nullptr) {
            first_child = child;
        } else {
            last_child->next_sibling = child;
        }
        last_child = child;
    }

    int num_children() const {
        int n = 0;
        for (const Node* c = first_child; c != nullptr; c = c->next_sibling) ++n;
        return n;
    }

    // Update node with backpropagation value
    void update(double value) {
        visit_count++;
        value_sum += value;
    }
};

} // namespace mcts
