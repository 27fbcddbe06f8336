#pragma once

#include "node.hpp"
#include "node_pool.hpp"
#include "environment.hpp"
#include "value_estimator.hpp"
#include "../world/state.hpp"
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace mcts {

// Configuration for a single-threaded search
struct SearchConfig {
    int num_simulations = 800;              // Select/Expand/Simulate/Backpropagate iterations
    float exploration_weight = 1.41421356f; // UCB constant c (> 0)
    int max_rollout_depth = 256;            // Rollout steps before truncation
    bool use_estimator_for_leaves = true;   // Estimator replaces rollouts when supplied
    float prior_weight = 0.0f;              // Estimator prior bonus in selection (0 = off)
    int64_t seed = -1;                      // RNG seed (< 0 draws from std::random_device)

    // Throws std::invalid_argument on out-of-range values
    void validate() const;
};

// Per-root-action statistics
struct ActionStats {
    world::Action action;
    uint32_t visits = 0;
    double value_sum = 0.0;

    double mean_value() const { return visits > 0 ? value_sum / visits : 0.0; }
};

struct SearchStats {
    int simulations_evaluated = 0;      // Completed iterations
    double value = 0.0;                 // Accumulated value of the chosen branch
    uint32_t best_visits = 0;           // Visits of the chosen branch
    int max_depth = 0;                  // Deepest selection path
    size_t nodes_allocated = 0;
    int estimator_calls = 0;
    int truncated_rollouts = 0;
    std::vector<ActionStats> root_actions;  // One entry per expanded root child, expansion order
};

struct SearchResult {
    std::optional<world::Action> best_action;  // Empty = no decision
    SearchStats stats;

    bool has_decision() const { return best_action.has_value(); }
};

// UCB1 score of a visited child: Q + c * sqrt(ln(N_parent) / n_child)
inline double ucb_score(double child_q, uint32_t child_visits, uint32_t parent_visits, float c) {
    return child_q + c * std::sqrt(std::log(static_cast<double>(parent_visits)) / child_visits);
}

// Single-threaded Monte-Carlo Tree Search over caller-supplied capabilities
//
// Each search() call builds a fresh tree in the pool (the pool is reset first)
// and runs exactly config.num_simulations iterations. A root with no legal
// actions, or a terminal root, yields a result without a best action.
class MCTSSearch {
public:
    MCTSSearch(NodePool& pool, const SearchConfig& config = SearchConfig());

    // Throws InvalidState for a malformed root, CapabilityFailure when a
    // capability fails, std::invalid_argument for a bad config
    SearchResult search(const world::State& root_state, const Capabilities& capabilities);

    // Get the root node after search (valid until the next search or pool reset)
    Node* get_root() const { return root_; }

    const SearchConfig& config() const { return config_; }

private:
    // Selection: descend from root to a node that is terminal or has untried actions
    Node* select(Node* node, int& depth);

    // Expansion: materialize the next untried action as a child
    Node* expand(Node* node);

    // Simulation: value of node's state from player 0's perspective
    double simulate(const Node* node);

    // Random rollout to a terminal state
    double rollout(const world::State& start);

    // Backpropagate value up the tree, flipping sign for other players' nodes
    void backpropagate(Node* node, double value);

    double selection_score(const Node* parent, const Node* child) const;

    // Capability wrappers: rethrow failures as CapabilityFailure
    std::vector<world::Action> call_legal_actions(const world::State& state) const;
    world::State call_apply(const world::State& state, const world::Action& action) const;
    bool call_is_terminal(const world::State& state) const;
    double call_reward(const world::State& state) const;
    int call_player_to_move(const world::State& state) const;
    double call_estimate(const world::State& state);

    void generate_actions(Node* node);

    SearchResult make_result(bool decided) const;

    NodePool& pool_;
    SearchConfig config_;
    std::mt19937_64 rng_;

    // Valid during search()
    const Environment* env_ = nullptr;
    const ValueEstimator* estimator_ = nullptr;

    Node* root_ = nullptr;

    // Simulation tracking
    int simulations_completed_ = 0;
    int max_depth_ = 0;
    int estimator_calls_ = 0;
    int truncated_rollouts_ = 0;
};

// Convenience: one search with num_simulations overriding config
SearchResult search(const world::State& root_state,
                    const Capabilities& capabilities,
                    int num_simulations,
                    SearchConfig config = SearchConfig());

} // namespace mcts
