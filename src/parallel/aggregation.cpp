#include "parallel/aggregation.hpp"

namespace parallel {

const char* aggregation_policy_name(AggregationPolicy policy) {
    switch (policy) {
        case AggregationPolicy::BestActionCredit: return "best_action_credit";
        case AggregationPolicy::PerActionVisits: return "per_action_visits";
    }
    return "unknown";
}

AggregationRecord& AggregationTable::record_for(const world::Action& action) {
    std::string key = action.key();
    auto it = index_.find(key);
    if (it != index_.end()) {
        return records_[it->second];
    }
    index_.emplace(std::move(key), records_.size());
    records_.push_back(AggregationRecord{action, 0, 0.0, 0});
    return records_.back();
}

void AggregationTable::add(const world::Action& action, int64_t visits, double value) {
    AggregationRecord& record = record_for(action);
    record.visits += visits;
    record.value += value;
    record.contributors++;
}

bool AggregationTable::add_worker_result(const mcts::SearchResult& result, AggregationPolicy policy) {
    if (!result.has_decision()) {
        return false;
    }

    if (policy == AggregationPolicy::PerActionVisits) {
        for (const auto& stats : result.stats.root_actions) {
            if (stats.visits > 0) {
                add(stats.action, stats.visits, stats.value_sum);
            }
        }
        return true;
    }

    add(*result.best_action, result.stats.simulations_evaluated, result.stats.value);
    return true;
}

void AggregationTable::merge(const AggregationTable& other) {
    for (const auto& record : other.records_) {
        AggregationRecord& mine = record_for(record.action);
        mine.visits += record.visits;
        mine.value += record.value;
        mine.contributors += record.contributors;
    }
}

const AggregationRecord* AggregationTable::best() const {
    const AggregationRecord* best = nullptr;
    for (const auto& record : records_) {
        if (best == nullptr || record.visits > best->visits) {
            best = &record;
        }
    }
    return best;
}

const AggregationRecord* AggregationTable::find(const std::string& key) const {
    auto it = index_.find(key);
    return it != index_.end() ? &records_[it->second] : nullptr;
}

void AggregationTable::clear() {
    records_.clear();
    index_.clear();
}

} // namespace parallel
