#pragma once

#include "../world/state.hpp"
#include <memory>
#include <vector>

namespace mcts {

class ValueEstimator;

// Domain rules supplied by the caller.
//
// The search treats these as opaque capabilities. All methods are const and
// must be safe to call concurrently from several worker threads; apply() must
// not mutate shared state. Throwing from any of them aborts the search with a
// CapabilityFailure.
class Environment {
public:
    virtual ~Environment() = default;

    // Finite, ordered set of legal moves (order is the expansion order)
    virtual std::vector<world::Action> legal_actions(const world::State& state) const = 0;

    // Pure transition: returns the successor state
    virtual world::State apply(const world::State& state, const world::Action& action) const = 0;

    virtual bool is_terminal(const world::State& state) const = 0;

    // Outcome at a terminal state, from the deciding agent's (player 0) perspective
    virtual float reward(const world::State& state) const = 0;

    // Player choosing the next action. Single-agent domains keep the default.
    virtual int player_to_move(const world::State& state) const {
        (void)state;
        return 0;
    }

    // Domain-specific structural checks on a root state; throw InvalidState
    virtual void validate(const world::State& state) const {
        (void)state;
    }
};

// Capability bundle handed to every search entry point
struct Capabilities {
    std::shared_ptr<const Environment> environment;
    std::shared_ptr<const ValueEstimator> estimator;  // optional (nullptr = rollouts)

    Capabilities() = default;
    Capabilities(std::shared_ptr<const Environment> env,
                 std::shared_ptr<const ValueEstimator> est = nullptr)
        : environment(std::move(env))
        , estimator(std::move(est))
    {}
};

} // namespace mcts
