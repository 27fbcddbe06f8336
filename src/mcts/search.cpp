#include "mcts/search.hpp"
#include "mcts/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace mcts {

namespace {

// Run a capability call, converting any failure into CapabilityFailure
template<typename Fn>
auto guarded(const char* capability, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const CapabilityFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw CapabilityFailure(capability, e.what());
    } catch (...) {
        throw CapabilityFailure(capability, "unknown exception");
    }
}

} // namespace

void SearchConfig::validate() const {
    if (num_simulations < 1) {
        throw std::invalid_argument("num_simulations must be >= 1, got " + std::to_string(num_simulations));
    }
    if (!(exploration_weight > 0.0f) || !std::isfinite(exploration_weight)) {
        throw std::invalid_argument("exploration_weight must be a finite value > 0");
    }
    if (max_rollout_depth < 1) {
        throw std::invalid_argument("max_rollout_depth must be >= 1, got " + std::to_string(max_rollout_depth));
    }
    if (!(prior_weight >= 0.0f) || !std::isfinite(prior_weight)) {
        throw std::invalid_argument("prior_weight must be a finite value >= 0");
    }
}

MCTSSearch::MCTSSearch(NodePool& pool, const SearchConfig& config)
    : pool_(pool)
    , config_(config)
    , rng_(config.seed >= 0 ? static_cast<uint64_t>(config.seed) : std::random_device{}())
{}

SearchResult MCTSSearch::search(const world::State& root_state, const Capabilities& capabilities) {
    config_.validate();
    if (!capabilities.environment) {
        throw std::invalid_argument("MCTSSearch: capabilities carry no environment");
    }

    // Domain checks before any simulation
    try {
        capabilities.environment->validate(root_state);
    } catch (const InvalidState&) {
        throw;
    } catch (const std::exception& e) {
        throw CapabilityFailure("validate", e.what());
    }

    env_ = capabilities.environment.get();
    estimator_ = capabilities.estimator.get();

    // Reset state
    if (config_.seed >= 0) {
        rng_.seed(static_cast<uint64_t>(config_.seed));
    }
    simulations_completed_ = 0;
    max_depth_ = 0;
    estimator_calls_ = 0;
    truncated_rollouts_ = 0;
    pool_.reset();

    // Create root node
    root_ = pool_.allocate(root_state);
    root_->mover = call_player_to_move(root_state);

    if (call_is_terminal(root_state)) {
        root_->set_terminal(true);
        return make_result(false);
    }

    generate_actions(root_);
    if (!root_->has_untried_actions()) {
        // No legal actions: explicit no-decision
        return make_result(false);
    }

    for (int sim = 0; sim < config_.num_simulations; ++sim) {
        int depth = 0;
        Node* leaf = select(root_, depth);

        if (!leaf->is_terminal() && leaf->has_untried_actions()) {
            leaf = expand(leaf);
            depth++;
        }
        if (depth > max_depth_) max_depth_ = depth;

        double value = simulate(leaf);
        backpropagate(leaf, value);
        simulations_completed_++;
    }

    return make_result(true);
}

Node* MCTSSearch::select(Node* node, int& depth) {
    depth = 0;
    while (!node->is_terminal()) {
        if (!node->actions_generated()) {
            generate_actions(node);
        }

        // Expand before descending further
        if (node->has_untried_actions()) {
            break;
        }

        if (node->first_child == nullptr) {
            throw CapabilityFailure("legal_actions",
                                    "non-terminal state has no legal actions: " + node->state.to_string());
        }

        Node* best_child = nullptr;
        double best_score = -std::numeric_limits<double>::infinity();

        for (Node* child = node->first_child; child != nullptr; child = child->next_sibling) {
            double score = selection_score(node, child);
            // Strict comparison: ties keep the earlier child
            if (best_child == nullptr || score > best_score) {
                best_score = score;
                best_child = child;
            }
        }

        node = best_child;
        depth++;
    }
    return node;
}

Node* MCTSSearch::expand(Node* node) {
    const world::Action action = node->take_untried_action();

    Node* child = pool_.allocate(call_apply(node->state, action));
    child->action = action;
    child->mover = call_player_to_move(node->state);
    child->set_terminal(call_is_terminal(child->state));

    if (estimator_ != nullptr && config_.prior_weight > 0.0f) {
        // Prior is from the chooser's side, like the child's value
        double estimate = call_estimate(child->state);
        if (child->mover != 0) {
            estimate = -estimate;
        }
        child->prior = static_cast<float>((estimate + 1.0) / 2.0);
    }

    node->add_child(child);
    return child;
}

double MCTSSearch::simulate(const Node* node) {
    if (node->is_terminal()) {
        return call_reward(node->state);
    }
    if (estimator_ != nullptr && config_.use_estimator_for_leaves) {
        return call_estimate(node->state);
    }
    return rollout(node->state);
}

double MCTSSearch::rollout(const world::State& start) {
    world::State state = start;

    for (int depth = 0; ; ++depth) {
        if (call_is_terminal(state)) {
            return call_reward(state);
        }

        if (depth >= config_.max_rollout_depth) {
            truncated_rollouts_++;
            return estimator_ != nullptr ? call_estimate(state) : 0.0;
        }

        std::vector<world::Action> actions = call_legal_actions(state);
        if (actions.empty()) {
            throw CapabilityFailure("legal_actions",
                                    "rollout reached a non-terminal state with no legal actions: "
                                    + state.to_string());
        }

        // Uniform-random rollout policy
        std::uniform_int_distribution<size_t> pick(0, actions.size() - 1);
        state = call_apply(state, actions[pick(rng_)]);
    }
}

void MCTSSearch::backpropagate(Node* node, double value) {
    while (node != nullptr) {
        // Value is from player 0's perspective; flip for every other player's choices
        node->update(node->mover == 0 ? value : -value);
        node = node->parent;
    }
}

double MCTSSearch::selection_score(const Node* parent, const Node* child) const {
    // Unvisited children are always tried first
    if (child->visit_count == 0) {
        return std::numeric_limits<double>::infinity();
    }

    double score = ucb_score(child->q_value(), child->visit_count, parent->visit_count,
                             config_.exploration_weight);

    if (config_.prior_weight > 0.0f) {
        score += config_.prior_weight * child->prior / (1.0 + child->visit_count);
    }
    return score;
}

void MCTSSearch::generate_actions(Node* node) {
    node->set_actions(call_legal_actions(node->state));
}

std::vector<world::Action> MCTSSearch::call_legal_actions(const world::State& state) const {
    return guarded("legal_actions", [&] { return env_->legal_actions(state); });
}

world::State MCTSSearch::call_apply(const world::State& state, const world::Action& action) const {
    return guarded("apply", [&] { return env_->apply(state, action); });
}

bool MCTSSearch::call_is_terminal(const world::State& state) const {
    return guarded("is_terminal", [&] { return env_->is_terminal(state); });
}

double MCTSSearch::call_reward(const world::State& state) const {
    double reward = guarded("reward", [&] { return static_cast<double>(env_->reward(state)); });
    if (!std::isfinite(reward)) {
        throw CapabilityFailure("reward", "non-finite reward at " + state.to_string());
    }
    return reward;
}

int MCTSSearch::call_player_to_move(const world::State& state) const {
    return guarded("player_to_move", [&] { return env_->player_to_move(state); });
}

double MCTSSearch::call_estimate(const world::State& state) {
    estimator_calls_++;
    double value = guarded("estimate", [&] { return static_cast<double>(estimator_->estimate(state)); });
    if (!std::isfinite(value)) {
        throw CapabilityFailure("estimate", "non-finite estimate at " + state.to_string());
    }
    return std::clamp(value, -1.0, 1.0);
}

SearchResult MCTSSearch::make_result(bool decided) const {
    SearchResult result;
    SearchStats& stats = result.stats;
    stats.simulations_evaluated = simulations_completed_;
    stats.max_depth = max_depth_;
    stats.nodes_allocated = pool_.size();
    stats.estimator_calls = estimator_calls_;
    stats.truncated_rollouts = truncated_rollouts_;

    if (root_ == nullptr) {
        return result;
    }

    const Node* best_child = nullptr;
    for (const Node* child = root_->first_child; child != nullptr; child = child->next_sibling) {
        stats.root_actions.push_back(ActionStats{child->action, child->visit_count, child->value_sum});

        // Most visited wins; ties keep encounter order
        if (best_child == nullptr || child->visit_count > best_child->visit_count) {
            best_child = child;
        }
    }

    if (decided && best_child != nullptr) {
        result.best_action = best_child->action;
        stats.value = best_child->value_sum;
        stats.best_visits = best_child->visit_count;
    }

    return result;
}

SearchResult search(const world::State& root_state,
                    const Capabilities& capabilities,
                    int num_simulations,
                    SearchConfig config) {
    config.num_simulations = num_simulations;
    NodePool pool;
    MCTSSearch engine(pool, config);
    return engine.search(root_state, capabilities);
}

} // namespace mcts
