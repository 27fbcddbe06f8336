#include "mcts/search.hpp"
#include "mcts/node_pool.hpp"
#include "mcts/errors.hpp"
#include "test_environments.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

using namespace mcts;
using world::Action;

static const ActionStats* stats_for(const SearchResult& result, const Action& action) {
    for (const auto& stats : result.stats.root_actions) {
        if (stats.action == action) return &stats;
    }
    return nullptr;
}

static std::string chosen(const SearchResult& result) {
    return result.has_decision() ? result.best_action->key() : std::string("<none>");
}

// Root offers one action whose successor is a non-terminal dead end
class DeadEndBelowRoot : public Environment {
public:
    std::vector<Action> legal_actions(const world::State& state) const override {
        if (state.location == 0) return {Action::move(1)};
        return {};
    }
    world::State apply(const world::State& state, const Action& action) const override {
        world::State next = state;
        next.location = action.target;
        next.turn += 1;
        return next;
    }
    bool is_terminal(const world::State&) const override { return false; }
    float reward(const world::State&) const override { return 0.0f; }
};

bool test_basic_search() {
    std::cout << "=== Test 1: Basic MCTS Search ===" << std::endl;

    auto env = std::make_shared<test_envs::TwoArmEnvironment>(1.0f, 0.0f);
    NodePool pool;
    SearchConfig config;
    config.num_simulations = 100;
    MCTSSearch search(pool, config);

    SearchResult result = search.search(test_envs::decision_root(), Capabilities(env));

    const ActionStats* a = stats_for(result, Action::move(1));
    const ActionStats* b = stats_for(result, Action::move(2));
    if (a == nullptr || b == nullptr) {
        std::cout << "  ✗ FAIL: root children missing" << std::endl;
        return false;
    }

    std::cout << "  Visits: A=" << a->visits << " B=" << b->visits
              << "  Q(A)=" << std::fixed << std::setprecision(3) << a->mean_value() << std::endl;

    if (chosen(result) != "move:1" || a->visits + b->visits != 100 || a->visits <= b->visits) {
        std::cout << "  ✗ FAIL: expected A with all 100 visits split A > B" << std::endl;
        return false;
    }
    if (result.stats.simulations_evaluated != 100 || result.stats.best_visits != a->visits
        || result.stats.value != a->value_sum || search.get_root()->visit_count != 100) {
        std::cout << "  ✗ FAIL: stats inconsistent with the tree" << std::endl;
        return false;
    }
    if (result.stats.nodes_allocated != 3 || pool.size() != 3) {
        std::cout << "  ✗ FAIL: expected root + 2 children, got " << result.stats.nodes_allocated << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_converges_on_signed_rewards() {
    std::cout << "=== Test 2: Converges with +1 / -1 outcomes ===" << std::endl;

    auto env = std::make_shared<test_envs::TwoArmEnvironment>(-1.0f, 1.0f);
    SearchResult result = search(test_envs::decision_root(), Capabilities(env), 200);

    const ActionStats* b = stats_for(result, Action::move(2));
    if (chosen(result) != "move:2" || b == nullptr || b->mean_value() != 1.0) {
        std::cout << "  ✗ FAIL: chose " << chosen(result) << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS (B visits " << b->visits << "/200)" << std::endl << std::endl;
    return true;
}

bool test_no_decision() {
    std::cout << "=== Test 3: No legal actions yields no decision ===" << std::endl;

    auto dead_end = std::make_shared<test_envs::DeadEndEnvironment>();
    SearchResult stuck = search(test_envs::decision_root(5), Capabilities(dead_end), 50);

    auto arms = std::make_shared<test_envs::TwoArmEnvironment>(1.0f, 0.0f);
    world::State finished = test_envs::decision_root(1);
    finished.turn = 1;
    SearchResult over = search(finished, Capabilities(arms), 50);

    if (stuck.has_decision() || stuck.stats.simulations_evaluated != 0 || !stuck.stats.root_actions.empty()) {
        std::cout << "  ✗ FAIL: dead-end root produced " << chosen(stuck) << std::endl;
        return false;
    }
    if (over.has_decision() || over.stats.simulations_evaluated != 0) {
        std::cout << "  ✗ FAIL: terminal root produced " << chosen(over) << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_deterministic_with_seed() {
    std::cout << "=== Test 4: Fixed seed reproduces the search ===" << std::endl;

    auto world = test_envs::make_trade_line();
    world::State root = world->make_state(0, 100.0, 20, 12);

    SearchConfig config;
    config.num_simulations = 300;
    config.seed = 42;

    NodePool pool;
    MCTSSearch engine(pool, config);
    SearchResult first = engine.search(root, Capabilities(world));
    SearchResult again = engine.search(root, Capabilities(world));  // same engine, reseeded
    SearchResult fresh = search(root, Capabilities(world), 300, config);

    for (const SearchResult* other : {&again, &fresh}) {
        if (other->best_action != first.best_action
            || other->stats.root_actions.size() != first.stats.root_actions.size()
            || other->stats.nodes_allocated != first.stats.nodes_allocated) {
            std::cout << "  ✗ FAIL: results differ" << std::endl;
            return false;
        }
        for (size_t i = 0; i < first.stats.root_actions.size(); ++i) {
            if (other->stats.root_actions[i].visits != first.stats.root_actions[i].visits
                || other->stats.root_actions[i].value_sum != first.stats.root_actions[i].value_sum) {
                std::cout << "  ✗ FAIL: root action " << i << " differs" << std::endl;
                return false;
            }
        }
    }

    std::cout << "  ✓ PASS (best " << chosen(first) << ")" << std::endl << std::endl;
    return true;
}

bool test_capability_failures() {
    std::cout << "=== Test 5: Capability failures propagate ===" << std::endl;

    using Failure = test_envs::FailingEnvironment::Failure;
    struct Case { Failure failure; const char* capability; };
    const Case cases[] = {
        {Failure::LEGAL_ACTIONS, "legal_actions"},
        {Failure::APPLY, "apply"},
        {Failure::REWARD, "reward"},
        {Failure::NAN_REWARD, "reward"},
    };

    for (const auto& c : cases) {
        auto env = std::make_shared<test_envs::FailingEnvironment>(c.failure);
        std::string got = "<nothing thrown>";
        try {
            search(test_envs::decision_root(), Capabilities(env), 20);
        } catch (const CapabilityFailure& e) {
            got = e.capability();
            if (e.worker_id() != -1) got += " (unexpected worker id)";
        }
        if (got != c.capability) {
            std::cout << "  ✗ FAIL: expected " << c.capability << ", got " << got << std::endl;
            return false;
        }
    }

    // A non-terminal state without actions below the root is a domain bug
    bool dead_end_failed = false;
    try {
        search(test_envs::decision_root(), Capabilities(std::make_shared<DeadEndBelowRoot>()), 20);
    } catch (const CapabilityFailure& e) {
        dead_end_failed = e.capability() == "legal_actions";
    }
    if (!dead_end_failed) {
        std::cout << "  ✗ FAIL: dead end below root was not a CapabilityFailure" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_invalid_inputs() {
    std::cout << "=== Test 6: Invalid roots and configs fail before searching ===" << std::endl;

    auto world = test_envs::make_trade_line();
    world::State unknown_location = world->make_state(0, 100.0, 20, 10);
    unknown_location.location = 17;
    world::State negative_gold_cap = world->make_state(0, 100.0, 20, 10);
    negative_gold_cap.capacity = -1;

    int invalid_states = 0;
    for (const world::State* root : {&unknown_location, &negative_gold_cap}) {
        try {
            search(*root, Capabilities(world), 10);
        } catch (const InvalidState&) {
            invalid_states++;
        }
    }

    int bad_configs = 0;
    SearchConfig zero_sims;
    zero_sims.num_simulations = 0;
    SearchConfig zero_c;
    zero_c.exploration_weight = 0.0f;
    SearchConfig zero_depth;
    zero_depth.max_rollout_depth = 0;
    for (const SearchConfig* config : {&zero_sims, &zero_c, &zero_depth}) {
        try {
            NodePool pool;
            MCTSSearch engine(pool, *config);
            engine.search(world->make_state(0, 100.0, 20, 10), Capabilities(world));
        } catch (const std::invalid_argument&) {
            bad_configs++;
        }
    }

    bool missing_env = false;
    try {
        search(test_envs::decision_root(), Capabilities(), 10);
    } catch (const std::invalid_argument&) {
        missing_env = true;
    }

    if (invalid_states != 2 || bad_configs != 3 || !missing_env) {
        std::cout << "  ✗ FAIL: invalid_states=" << invalid_states << " bad_configs=" << bad_configs
                  << " missing_env=" << missing_env << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_truncated_rollouts() {
    std::cout << "=== Test 7: Rollouts stop at max_rollout_depth ===" << std::endl;

    auto world = test_envs::make_trade_line();
    world::State root = world->make_state(0, 100.0, 20, 1000);

    SearchConfig config;
    config.num_simulations = 30;
    config.max_rollout_depth = 5;
    config.seed = 11;
    SearchResult result = search(root, Capabilities(world), 30, config);

    // No estimator: truncated rollouts score 0
    if (result.stats.truncated_rollouts != 30 || result.stats.value != 0.0 || !result.has_decision()) {
        std::cout << "  ✗ FAIL: truncated=" << result.stats.truncated_rollouts
                  << " value=" << result.stats.value << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_engine_skips_trader_rules() {
    std::cout << "=== Test 8: Root checks go through Environment::validate only ===" << std::endl;

    // The toy domain has no validate hook, so trader constraints do not apply
    auto env = std::make_shared<test_envs::TwoArmEnvironment>(1.0f, 0.0f);
    SearchConfig config;
    config.seed = 2;
    SearchResult result = search(test_envs::carrier_root(), Capabilities(env), 50, config);
    if (chosen(result) != "move:1" || result.stats.simulations_evaluated != 50) {
        std::cout << "  ✗ FAIL: carrier root chose " << chosen(result) << std::endl;
        return false;
    }

    // TraderWorld::validate still applies the structural checks
    auto world = test_envs::make_trade_line();
    world::State overloaded = world->make_state(0, 100.0, 2, 10);
    overloaded.inventory = {world::InventorySlot{world::items::FISH, 5}};
    bool rejected = false;
    try {
        search(overloaded, Capabilities(world), 10);
    } catch (const InvalidState&) {
        rejected = true;
    }
    if (!rejected) {
        std::cout << "  ✗ FAIL: cargo above capacity accepted by TraderWorld" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << "MCTS Search Tests" << std::endl;
    std::cout << "==========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int failed = 0;

    auto run = [&](bool (*test)()) {
        try {
            if (test()) { passed++; } else { failed++; }
        } catch (const std::exception& e) {
            std::cout << "  EXCEPTION: " << e.what() << std::endl;
            failed++;
        }
    };

    run(test_basic_search);
    run(test_converges_on_signed_rewards);
    run(test_no_decision);
    run(test_deterministic_with_seed);
    run(test_capability_failures);
    run(test_invalid_inputs);
    run(test_truncated_rollouts);
    run(test_engine_skips_trader_rules);

    std::cout << "==========================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    std::cout << "==========================================" << std::endl;

    return (failed > 0) ? 1 : 0;
}
