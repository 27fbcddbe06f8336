#pragma once

#include "../mcts/search.hpp"
#include "../world/state.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace parallel {

// How a worker's SearchResult is credited to the table
enum class AggregationPolicy : uint8_t {
    BestActionCredit = 0,   // worker's best action gets simulations_evaluated and stats.value
    PerActionVisits = 1     // every root action gets its own visits and value_sum
};

const char* aggregation_policy_name(AggregationPolicy policy);

struct AggregationRecord {
    world::Action action;
    int64_t visits = 0;
    double value = 0.0;       // summed across contributions, never averaged
    int contributors = 0;     // number of additions folded into this record

    double mean_value() const { return visits > 0 ? value / visits : 0.0; }
};

// Per-action totals keyed by Action::key(), kept in first-encounter order.
//
// best() returns the record with the greatest visit total; ties go to the
// key encountered first.
class AggregationTable {
public:
    void add(const world::Action& action, int64_t visits, double value);

    // Fold one worker's result. Returns false when the worker made no decision
    // (nothing is added in that case).
    bool add_worker_result(const mcts::SearchResult& result, AggregationPolicy policy);

    // Append another table's records (their encounter order follows ours)
    void merge(const AggregationTable& other);

    // nullptr when empty
    const AggregationRecord* best() const;
    const AggregationRecord* find(const std::string& key) const;

    const std::vector<AggregationRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear();

private:
    AggregationRecord& record_for(const world::Action& action);

    std::vector<AggregationRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace parallel
