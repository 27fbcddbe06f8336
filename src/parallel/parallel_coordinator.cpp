#include "parallel/parallel_coordinator.hpp"
#include "mcts/errors.hpp"
#include "mcts/node_pool.hpp"
#include "world/serialization.hpp"

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

namespace parallel {

namespace {

double ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Joins every launched worker when it goes out of scope
class WorkerThreads {
public:
    WorkerThreads() = default;
    WorkerThreads(const WorkerThreads&) = delete;
    WorkerThreads& operator=(const WorkerThreads&) = delete;

    ~WorkerThreads() {
        join_all();
    }

    template<typename Fn>
    void launch(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void join_all() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread> threads_;
};

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

// Rethrow a worker failure; capability failures gain the worker id
[[noreturn]] void rethrow_for_worker(const std::exception_ptr& error, int worker_id) {
    try {
        std::rethrow_exception(error);
    } catch (const mcts::CapabilityFailure& e) {
        if (e.worker_id() >= 0) {
            throw;
        }
        throw e.with_worker(worker_id);
    }
}

} // namespace

const char* collection_order_name(CollectionOrder order) {
    switch (order) {
        case CollectionOrder::Dispatch: return "dispatch";
        case CollectionOrder::Completion: return "completion";
    }
    return "unknown";
}

const char* failure_policy_name(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::FailFast: return "fail_fast";
        case FailurePolicy::BestEffort: return "best_effort";
    }
    return "unknown";
}

void ParallelSearchConfig::validate() const {
    if (num_workers < 1 || num_workers > MAX_WORKERS) {
        throw std::invalid_argument("num_workers must be in [1, " + std::to_string(MAX_WORKERS)
                                    + "], got " + std::to_string(num_workers));
    }
    if (simulations_per_worker < 1) {
        throw std::invalid_argument("simulations_per_worker must be >= 1, got "
                                    + std::to_string(simulations_per_worker));
    }
    worker_search_config(0).validate();
}

mcts::SearchConfig ParallelSearchConfig::worker_search_config(int worker_id) const {
    mcts::SearchConfig config;
    config.num_simulations = simulations_per_worker;
    config.exploration_weight = exploration_weight;
    config.max_rollout_depth = max_rollout_depth;
    config.use_estimator_for_leaves = use_estimator_for_leaves;
    config.prior_weight = prior_weight;
    config.seed = seed >= 0 ? seed + worker_id : -1;
    return config;
}

ParallelSearchCoordinator::ParallelSearchCoordinator(const ParallelSearchConfig& config)
    : config_(config)
{}

ParallelSearchResult ParallelSearchCoordinator::parallel_search(
    const world::State& root_state,
    const mcts::Capabilities& capabilities)
{
    config_.validate();
    if (!capabilities.environment) {
        throw std::invalid_argument("ParallelSearchCoordinator: capabilities carry no environment");
    }

    auto start = std::chrono::steady_clock::now();

    // Malformed roots fail before any worker starts
    try {
        capabilities.environment->validate(root_state);
    } catch (const mcts::InvalidState&) {
        throw;
    } catch (const std::exception& e) {
        throw mcts::CapabilityFailure("validate", e.what());
    }

    const std::vector<uint8_t> snapshot = world::serialize(root_state);
    const int num_workers = config_.num_workers;

    std::vector<std::promise<mcts::SearchResult>> promises(num_workers);
    std::vector<std::future<mcts::SearchResult>> futures;
    futures.reserve(num_workers);
    for (auto& promise : promises) {
        futures.push_back(promise.get_future());
    }
    std::vector<double> worker_ms(num_workers, 0.0);
    CompletionQueue finished;

    // Declared last so threads are joined before the state they touch is destroyed
    WorkerThreads workers;

    for (int i = 0; i < num_workers; ++i) {
        workers.launch([this, i, &snapshot, &capabilities, &promises, &worker_ms, &finished]() {
            auto worker_start = std::chrono::steady_clock::now();
            try {
                // Private copy of the root, private tree
                world::State state = world::decode_state(snapshot);
                mcts::NodePool pool;
                mcts::MCTSSearch search(pool, config_.worker_search_config(i));
                mcts::SearchResult search_result = search.search(state, capabilities);
                worker_ms[i] = ms_since(worker_start);
                promises[i].set_value(std::move(search_result));
            } catch (...) {
                worker_ms[i] = ms_since(worker_start);
                promises[i].set_exception(std::current_exception());
            }
            finished.mark_finished(i);
        });
    }

    ParallelSearchResult result;
    result.workers.resize(num_workers);
    AggregationTable table;
    std::exception_ptr first_failure;
    int first_failed_worker = -1;

    for (int n = 0; n < num_workers; ++n) {
        const int id = config_.collection_order == CollectionOrder::Completion ? finished.next_finished() : n;

        mcts::SearchResult worker_result;
        std::exception_ptr error;
        try {
            worker_result = futures[id].get();
        } catch (...) {
            error = std::current_exception();
        }

        WorkerReport& report = result.workers[id];
        report.worker_id = id;
        report.elapsed_ms = worker_ms[id];

        if (error) {
            report.error = describe(error);
            result.workers_failed++;

            if (config_.failure_policy == FailurePolicy::FailFast) {
                fprintf(stderr, "[ParallelSearch] Worker %d failed, aborting search: %s\n",
                        id, report.error.c_str());
                workers.join_all();
                rethrow_for_worker(error, id);
            }

            fprintf(stderr, "[WARNING] Worker %d failed, excluded from aggregation: %s\n",
                    id, report.error.c_str());
            if (!first_failure) {
                first_failure = error;
                first_failed_worker = id;
            }
            continue;
        }

        report.completed = true;
        report.action = worker_result.best_action;
        report.simulations_evaluated = worker_result.stats.simulations_evaluated;
        report.value = worker_result.stats.value;
        report.best_visits = worker_result.stats.best_visits;

        result.workers_completed++;
        result.total_simulations += worker_result.stats.simulations_evaluated;

        if (!table.add_worker_result(worker_result, config_.aggregation)) {
            result.workers_without_decision++;
        }
    }

    workers.join_all();

    if (result.workers_completed == 0 && first_failure) {
        rethrow_for_worker(first_failure, first_failed_worker);
    }

    if (const AggregationRecord* best = table.best()) {
        result.action = best->action;
        result.visits = best->visits;
        result.value = best->value;
    }
    result.records = table.records();
    result.elapsed_ms = ms_since(start);

    if (config_.verbose) {
        fprintf(stderr,
                "[ParallelSearch] %d workers x %d sims (%s, %s): best=%s visits=%" PRId64
                " value=%.3f completed=%d failed=%d no_decision=%d (%.1f ms)\n",
                num_workers, config_.simulations_per_worker,
                aggregation_policy_name(config_.aggregation),
                collection_order_name(config_.collection_order),
                result.action ? result.action->key().c_str() : "none",
                result.visits, result.value,
                result.workers_completed, result.workers_failed, result.workers_without_decision,
                result.elapsed_ms);
    }

    return result;
}

ParallelSearchResult parallel_search(const world::State& root_state,
                                     const mcts::Capabilities& capabilities,
                                     int num_workers,
                                     int simulations_per_worker,
                                     ParallelSearchConfig config) {
    config.num_workers = num_workers;
    config.simulations_per_worker = simulations_per_worker;
    ParallelSearchCoordinator coordinator(config);
    return coordinator.parallel_search(root_state, capabilities);
}

} // namespace parallel
