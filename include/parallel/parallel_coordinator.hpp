#pragma once

#include "aggregation.hpp"
#include "completion_queue.hpp"
#include "../mcts/environment.hpp"
#include "../mcts/search.hpp"
#include "../world/state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parallel {

// ============================================================================
// Configuration
// ============================================================================

// Order in which worker results are folded into the table
enum class CollectionOrder : uint8_t {
    Dispatch = 0,       // block on worker 0, then 1, ...
    Completion = 1      // fold each worker as soon as it finishes
};

enum class FailurePolicy : uint8_t {
    FailFast = 0,       // first failure (in collection order) aborts the call
    BestEffort = 1      // failed workers are excluded; all failing rethrows the first
};

const char* collection_order_name(CollectionOrder order);
const char* failure_policy_name(FailurePolicy policy);

struct ParallelSearchConfig {
    static constexpr int MAX_WORKERS = 256;

    // Worker configuration
    int num_workers = 4;                    // Independent searches (1..MAX_WORKERS)
    int simulations_per_worker = 200;       // Simulations each worker runs

    // MCTS configuration (see mcts::SearchConfig)
    float exploration_weight = 1.41421356f;
    int max_rollout_depth = 256;
    bool use_estimator_for_leaves = true;
    float prior_weight = 0.0f;
    int64_t seed = -1;                      // Worker i uses seed + i (< 0 = nondeterministic)

    // Coordination
    AggregationPolicy aggregation = AggregationPolicy::BestActionCredit;
    CollectionOrder collection_order = CollectionOrder::Dispatch;
    FailurePolicy failure_policy = FailurePolicy::FailFast;
    bool verbose = false;                   // Per-call summary on stderr

    // Throws std::invalid_argument on out-of-range values
    void validate() const;

    mcts::SearchConfig worker_search_config(int worker_id) const;
};

// ============================================================================
// Results
// ============================================================================

struct WorkerReport {
    int worker_id = 0;
    bool completed = false;                 // search returned (decision or not)
    std::optional<world::Action> action;    // empty = no decision or failure
    int simulations_evaluated = 0;
    double value = 0.0;
    uint32_t best_visits = 0;
    double elapsed_ms = 0.0;
    std::string error;                      // set when the worker failed
};

struct ParallelSearchResult {
    std::optional<world::Action> action;    // empty = no worker produced a decision
    int64_t visits = 0;                     // aggregated visits of the chosen action
    double value = 0.0;                     // aggregated value of the chosen action
    int64_t total_simulations = 0;          // across all completed workers
    std::vector<AggregationRecord> records; // encounter order
    std::vector<WorkerReport> workers;      // dispatch order
    int workers_completed = 0;
    int workers_failed = 0;
    int workers_without_decision = 0;
    double elapsed_ms = 0.0;

    bool has_decision() const { return action.has_value(); }
};

// ============================================================================
// Parallel Search Coordinator
// ============================================================================
//
// Fans one decision out across independent searches and merges the results:
// - The root is checked through Environment::validate and serialized once
// - Each worker thread decodes its own copy and owns its NodePool and
//   MCTSSearch; only the snapshot and the const capabilities are shared
// - Results come back through futures, completion ids through a CompletionQueue
// - Every worker is joined before parallel_search() returns or throws
//
class ParallelSearchCoordinator {
public:
    explicit ParallelSearchCoordinator(const ParallelSearchConfig& config = ParallelSearchConfig());

    // Throws InvalidState for a malformed root, CapabilityFailure (carrying
    // the worker id) when a worker's capability fails, std::invalid_argument
    // for a bad config
    ParallelSearchResult parallel_search(const world::State& root_state,
                                         const mcts::Capabilities& capabilities);

    const ParallelSearchConfig& config() const { return config_; }

private:
    ParallelSearchConfig config_;
};

// Convenience: num_workers and simulations_per_worker override config
ParallelSearchResult parallel_search(const world::State& root_state,
                                     const mcts::Capabilities& capabilities,
                                     int num_workers,
                                     int simulations_per_worker,
                                     ParallelSearchConfig config = ParallelSearchConfig());

} // namespace parallel
