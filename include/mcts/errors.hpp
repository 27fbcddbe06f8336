#pragma once

#include <stdexcept>
#include <string>

namespace mcts {

// Base class for failures raised by the search core
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& message)
        : std::runtime_error(message) {}
};

// A supplied State fails structural expectations (raised before any simulation)
class InvalidState : public SearchError {
public:
    explicit InvalidState(const std::string& message)
        : SearchError("InvalidState: " + message) {}
};

// A caller-supplied capability (legal_actions, apply, is_terminal, reward,
// player_to_move, estimate) failed during search.
// worker_id is -1 until the failure crosses the parallel coordinator.
class CapabilityFailure : public SearchError {
public:
    CapabilityFailure(const std::string& capability, const std::string& detail, int worker_id = -1)
        : SearchError(format(capability, detail, worker_id))
        , capability_(capability)
        , detail_(detail)
        , worker_id_(worker_id)
    {}

    const std::string& capability() const { return capability_; }
    const std::string& detail() const { return detail_; }
    int worker_id() const { return worker_id_; }

    // Same failure, attributed to a worker
    CapabilityFailure with_worker(int worker_id) const {
        return CapabilityFailure(capability_, detail_, worker_id);
    }

private:
    static std::string format(const std::string& capability, const std::string& detail, int worker_id) {
        std::string msg = "CapabilityFailure in " + capability;
        if (worker_id >= 0) {
            msg += " (worker " + std::to_string(worker_id) + ")";
        }
        return msg + ": " + detail;
    }

    std::string capability_;
    std::string detail_;
    int worker_id_;
};

} // namespace mcts
