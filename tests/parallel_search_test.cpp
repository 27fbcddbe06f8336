// Tests for the parallel coordinator and the aggregation table.

#include "parallel/aggregation.hpp"
#include "parallel/parallel_coordinator.hpp"
#include "mcts/errors.hpp"
#include "test_environments.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace parallel;
using world::Action;

static std::string chosen(const ParallelSearchResult& result) {
    return result.has_decision() ? result.action->key() : std::string("<none>");
}

bool test_aggregates_agreeing_workers() {
    std::cout << "=== Test 1: Four agreeing workers aggregate 100 visits ===" << std::endl;

    auto env = std::make_shared<test_envs::TwoArmEnvironment>(1.0f, 0.0f);
    ParallelSearchResult result = parallel_search(test_envs::decision_root(),
                                                  mcts::Capabilities(env), 4, 25);

    if (chosen(result) != "move:1" || result.visits != 100 || result.total_simulations != 100) {
        std::cout << "  ✗ FAIL: action=" << chosen(result) << " visits=" << result.visits << std::endl;
        return false;
    }
    if (result.records.size() != 1 || result.records[0].contributors != 4) {
        std::cout << "  ✗ FAIL: expected one record with 4 contributors" << std::endl;
        return false;
    }
    if (result.workers.size() != 4 || result.workers_completed != 4 || result.workers_failed != 0) {
        std::cout << "  ✗ FAIL: worker reports" << std::endl;
        return false;
    }

    // value is the sum of each worker's best-branch value
    double worker_values = 0.0;
    for (int i = 0; i < 4; ++i) {
        const WorkerReport& report = result.workers[i];
        if (report.worker_id != i || !report.completed || !report.action
            || *report.action != Action::move(1) || report.simulations_evaluated != 25) {
            std::cout << "  ✗ FAIL: worker " << i << " report" << std::endl;
            return false;
        }
        worker_values += report.value;
    }
    if (result.value != worker_values) {
        std::cout << "  ✗ FAIL: aggregated value " << result.value << " != " << worker_values << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_all_workers_without_decision() {
    std::cout << "=== Test 2: No worker decision yields no decision ===" << std::endl;

    auto env = std::make_shared<test_envs::DeadEndEnvironment>();
    ParallelSearchResult result = parallel_search(test_envs::decision_root(5),
                                                  mcts::Capabilities(env), 3, 10);

    if (result.has_decision() || !result.records.empty() || result.workers_without_decision != 3
        || result.workers_completed != 3 || result.visits != 0) {
        std::cout << "  ✗ FAIL: got " << chosen(result) << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_table_order_independence() {
    std::cout << "=== Test 3: Aggregation is independent of arrival order ===" << std::endl;

    struct Contribution { Action action; int64_t visits; double value; };
    std::vector<Contribution> contributions = {
        {Action::move(1), 25, 20.0},
        {Action::move(2), 25, 10.0},
        {Action::move(1), 25, 22.0},
        {Action::wait(), 25, 5.0},
        {Action::move(2), 25, 12.0},
        {Action::move(1), 25, 19.0},
    };
    std::vector<int> order = {0, 1, 2, 3, 4, 5};

    int permutations = 0;
    do {
        AggregationTable table;
        for (int i : order) {
            table.add(contributions[i].action, contributions[i].visits, contributions[i].value);
        }
        const AggregationRecord* best = table.best();
        const AggregationRecord* second = table.find("move:2");
        if (best == nullptr || best->action != Action::move(1) || best->visits != 75
            || best->value != 61.0 || best->contributors != 3
            || second == nullptr || second->visits != 50 || table.size() != 3) {
            std::cout << "  ✗ FAIL: permutation " << permutations << std::endl;
            return false;
        }
        permutations++;
    } while (std::next_permutation(order.begin(), order.end()));

    std::cout << "  ✓ PASS (" << permutations << " orders)" << std::endl << std::endl;
    return true;
}

bool test_table_ties_and_policies() {
    std::cout << "=== Test 4: Ties, merge and aggregation policies ===" << std::endl;

    AggregationTable table;
    table.add(Action::move(2), 10, 1.0);
    table.add(Action::move(1), 10, 9.0);
    if (table.best()->action != Action::move(2)) {
        std::cout << "  ✗ FAIL: tie did not keep encounter order" << std::endl;
        return false;
    }

    AggregationTable other;
    other.add(Action::move(1), 5, 1.0);
    other.add(Action::wait(), 1, 0.0);
    table.merge(other);
    if (table.best()->action != Action::move(1) || table.best()->visits != 15 || table.size() != 3
        || table.records()[2].action != Action::wait()) {
        std::cout << "  ✗ FAIL: merge" << std::endl;
        return false;
    }

    mcts::SearchResult worker;
    worker.best_action = Action::move(1);
    worker.stats.simulations_evaluated = 30;
    worker.stats.value = 12.0;
    worker.stats.root_actions = {
        mcts::ActionStats{Action::move(1), 20, 12.0},
        mcts::ActionStats{Action::move(2), 10, 3.0},
    };

    AggregationTable credit;
    AggregationTable per_action;
    credit.add_worker_result(worker, AggregationPolicy::BestActionCredit);
    per_action.add_worker_result(worker, AggregationPolicy::PerActionVisits);

    if (credit.size() != 1 || credit.best()->visits != 30 || credit.best()->value != 12.0) {
        std::cout << "  ✗ FAIL: best-action credit" << std::endl;
        return false;
    }
    if (per_action.size() != 2 || per_action.find("move:1")->visits != 20
        || per_action.find("move:2")->visits != 10 || per_action.find("move:2")->value != 3.0) {
        std::cout << "  ✗ FAIL: per-action visits" << std::endl;
        return false;
    }

    mcts::SearchResult undecided;
    if (credit.add_worker_result(undecided, AggregationPolicy::BestActionCredit) || credit.size() != 1) {
        std::cout << "  ✗ FAIL: undecided worker was aggregated" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_fail_fast() {
    std::cout << "=== Test 5: Fail-fast rethrows with the worker id ===" << std::endl;

    using Failure = test_envs::FailingEnvironment::Failure;
    auto env = std::make_shared<test_envs::FailingEnvironment>(Failure::APPLY, 1);

    bool caught = false;
    try {
        parallel_search(test_envs::decision_root(), mcts::Capabilities(env), 4, 25);
    } catch (const mcts::CapabilityFailure& e) {
        caught = e.capability() == "apply" && e.worker_id() >= 0 && e.worker_id() < 4;
        std::cout << "  Caught: " << e.what() << std::endl;
    }

    if (!caught) {
        std::cout << "  ✗ FAIL: expected CapabilityFailure from apply with a worker id" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_best_effort() {
    std::cout << "=== Test 6: Best-effort excludes failed workers ===" << std::endl;

    using Failure = test_envs::FailingEnvironment::Failure;
    auto flaky = std::make_shared<test_envs::FailingEnvironment>(Failure::APPLY, 1);

    ParallelSearchConfig config;
    config.failure_policy = FailurePolicy::BestEffort;
    ParallelSearchResult result = parallel_search(test_envs::decision_root(),
                                                  mcts::Capabilities(flaky), 4, 25, config);

    int with_error = 0;
    for (const auto& report : result.workers) {
        if (!report.error.empty()) with_error++;
    }
    if (result.workers_failed != 1 || result.workers_completed != 3 || with_error != 1
        || chosen(result) != "move:1" || result.visits != 75) {
        std::cout << "  ✗ FAIL: failed=" << result.workers_failed << " completed=" << result.workers_completed
                  << " visits=" << result.visits << std::endl;
        return false;
    }

    // Every worker failing still raises
    auto broken = std::make_shared<test_envs::FailingEnvironment>(Failure::REWARD);
    bool raised = false;
    try {
        parallel_search(test_envs::decision_root(), mcts::Capabilities(broken), 3, 10, config);
    } catch (const mcts::CapabilityFailure& e) {
        raised = e.capability() == "reward" && e.worker_id() >= 0;
    }
    if (!raised) {
        std::cout << "  ✗ FAIL: all-failed search did not raise" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_collection_orders_agree() {
    std::cout << "=== Test 7: Completion order matches dispatch order ===" << std::endl;

    auto world = test_envs::make_trade_line();
    world::State root = world->make_state(0, 100.0, 20, 8);

    ParallelSearchConfig config;
    config.seed = 100;
    config.aggregation = AggregationPolicy::PerActionVisits;

    ParallelSearchResult dispatch = parallel_search(root, mcts::Capabilities(world), 6, 150, config);
    config.collection_order = CollectionOrder::Completion;
    ParallelSearchResult completion = parallel_search(root, mcts::Capabilities(world), 6, 150, config);

    // Same winning total; the action may only differ on an exact tie
    const AggregationRecord* completion_pick_in_dispatch = nullptr;
    for (const auto& record : dispatch.records) {
        if (completion.action && record.action == *completion.action) {
            completion_pick_in_dispatch = &record;
        }
    }
    if (dispatch.visits != completion.visits || completion_pick_in_dispatch == nullptr
        || completion_pick_in_dispatch->visits != dispatch.visits
        || dispatch.total_simulations != 900 || completion.total_simulations != 900) {
        std::cout << "  ✗ FAIL: dispatch=" << chosen(dispatch) << " completion=" << chosen(completion) << std::endl;
        return false;
    }

    // Per-action totals match whatever order the records were created in
    for (const auto& record : dispatch.records) {
        bool matched = false;
        for (const auto& other : completion.records) {
            if (other.action == record.action) {
                matched = other.visits == record.visits;
            }
        }
        if (!matched) {
            std::cout << "  ✗ FAIL: record " << record.action.key() << " differs" << std::endl;
            return false;
        }
    }

    std::cout << "  ✓ PASS (best " << chosen(dispatch) << ")" << std::endl << std::endl;
    return true;
}

bool test_seeded_workers_reproduce() {
    std::cout << "=== Test 8: Seeded parallel search is reproducible ===" << std::endl;

    auto world = test_envs::make_trade_line();
    auto estimator = std::make_shared<world::WealthEstimator>(world);
    world::State root = world->make_state(0, 100.0, 20, 8);

    ParallelSearchConfig config;
    config.seed = 9;
    ParallelSearchResult first = parallel_search(root, mcts::Capabilities(world, estimator), 4, 100, config);
    ParallelSearchResult second = parallel_search(root, mcts::Capabilities(world, estimator), 4, 100, config);

    if (first.action != second.action || first.visits != second.visits || first.value != second.value) {
        std::cout << "  ✗ FAIL: runs differ" << std::endl;
        return false;
    }
    if (config.worker_search_config(3).seed != 12 || ParallelSearchConfig().worker_search_config(3).seed != -1) {
        std::cout << "  ✗ FAIL: worker seeds" << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_invalid_inputs() {
    std::cout << "=== Test 9: Invalid roots and configs ===" << std::endl;

    auto world = test_envs::make_trade_line();
    world::State lost = world->make_state(0, 100.0, 20, 8);
    lost.location = 99;

    bool invalid_state = false;
    try {
        parallel_search(lost, mcts::Capabilities(world), 4, 10);
    } catch (const mcts::InvalidState&) {
        invalid_state = true;
    }

    int bad_configs = 0;
    world::State root = world->make_state(0, 100.0, 20, 8);
    for (int workers : {0, ParallelSearchConfig::MAX_WORKERS + 1}) {
        try {
            parallel_search(root, mcts::Capabilities(world), workers, 10);
        } catch (const std::invalid_argument&) {
            bad_configs++;
        }
    }
    try {
        parallel_search(root, mcts::Capabilities(world), 2, 0);
    } catch (const std::invalid_argument&) {
        bad_configs++;
    }

    if (!invalid_state || bad_configs != 3) {
        std::cout << "  ✗ FAIL: invalid_state=" << invalid_state << " bad_configs=" << bad_configs << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_carrier_root_reaches_workers() {
    std::cout << "=== Test 10: Workers receive the root exactly as given ===" << std::endl;

    // Trader rules reject this root; the two-arm domain does not care
    auto env = std::make_shared<test_envs::TwoArmEnvironment>(1.0f, 0.0f);
    ParallelSearchConfig config;
    config.num_workers = 3;
    config.simulations_per_worker = 20;
    config.seed = 4;
    ParallelSearchCoordinator coordinator(config);
    ParallelSearchResult result = coordinator.parallel_search(test_envs::carrier_root(),
                                                              mcts::Capabilities(env));

    if (chosen(result) != "move:1" || result.workers_completed != 3 || result.visits != 60) {
        std::cout << "  ✗ FAIL: action=" << chosen(result) << " completed=" << result.workers_completed
                  << " visits=" << result.visits << std::endl;
        return false;
    }

    std::cout << "  ✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << "Parallel Search Tests" << std::endl;
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

    run(test_aggregates_agreeing_workers);
    run(test_all_workers_without_decision);
    run(test_table_order_independence);
    run(test_table_ties_and_policies);
    run(test_fail_fast);
    run(test_best_effort);
    run(test_collection_orders_agree);
    run(test_seeded_workers_reproduce);
    run(test_invalid_inputs);
    run(test_carrier_root_reaches_workers);

    std::cout << "==========================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    std::cout << "==========================================" << std::endl;

    return (failed > 0) ? 1 : 0;
}
