#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <memory>
#include <stdexcept>
#include <string>
#include "mcts/errors.hpp"
#include "mcts/environment.hpp"
#include "mcts/search.hpp"
#include "mcts/value_estimator.hpp"
#include "encoding/state_encoder.hpp"
#include "parallel/parallel_coordinator.hpp"
#include "world/serialization.hpp"
#include "world/state.hpp"
#include "world/trader_world.hpp"

namespace py = pybind11;

// Trampoline: Python subclasses of Environment.
// Overrides acquire the GIL; Python exceptions surface as error_already_set
// and the search turns them into CapabilityFailure.
class PyEnvironment : public mcts::Environment {
public:
    using mcts::Environment::Environment;

    std::vector<world::Action> legal_actions(const world::State& state) const override {
        PYBIND11_OVERRIDE_PURE(std::vector<world::Action>, mcts::Environment, legal_actions, state);
    }

    world::State apply(const world::State& state, const world::Action& action) const override {
        PYBIND11_OVERRIDE_PURE(world::State, mcts::Environment, apply, state, action);
    }

    bool is_terminal(const world::State& state) const override {
        PYBIND11_OVERRIDE_PURE(bool, mcts::Environment, is_terminal, state);
    }

    float reward(const world::State& state) const override {
        PYBIND11_OVERRIDE_PURE(float, mcts::Environment, reward, state);
    }

    int player_to_move(const world::State& state) const override {
        PYBIND11_OVERRIDE(int, mcts::Environment, player_to_move, state);
    }

    void validate(const world::State& state) const override {
        PYBIND11_OVERRIDE(void, mcts::Environment, validate, state);
    }
};

class PyValueEstimator : public mcts::ValueEstimator {
public:
    using mcts::ValueEstimator::ValueEstimator;

    float estimate(const world::State& state) const override {
        PYBIND11_OVERRIDE_PURE(float, mcts::ValueEstimator, estimate, state);
    }
};

// Estimator backed by a plain Python callable: fn(state) -> float
class PythonCallbackEstimator : public mcts::ValueEstimator {
public:
    explicit PythonCallbackEstimator(py::object callback)
        : callback_(std::move(callback))
    {}

    ~PythonCallbackEstimator() override {
        py::gil_scoped_acquire acquire;
        callback_ = py::object();
    }

    float estimate(const world::State& state) const override {
        // Acquire GIL before calling Python from a worker thread
        py::gil_scoped_acquire acquire;
        return callback_(state).cast<float>();
    }

private:
    py::object callback_;
};

// None, a ValueEstimator instance, or a callable
static std::shared_ptr<const mcts::ValueEstimator> to_estimator(const py::object& estimator) {
    if (estimator.is_none()) {
        return nullptr;
    }
    if (py::isinstance<mcts::ValueEstimator>(estimator)) {
        return estimator.cast<std::shared_ptr<mcts::ValueEstimator>>();
    }
    if (PyCallable_Check(estimator.ptr())) {
        return std::make_shared<PythonCallbackEstimator>(estimator);
    }
    throw std::invalid_argument("estimator must be None, a ValueEstimator or a callable");
}

static py::dict search_result_to_dict(const mcts::SearchResult& result) {
    py::dict out;
    out["action"] = result.best_action ? py::cast(*result.best_action) : py::none();
    out["action_key"] = result.best_action ? py::cast(result.best_action->key()) : py::none();
    out["simulations_evaluated"] = result.stats.simulations_evaluated;
    out["value"] = result.stats.value;
    out["best_visits"] = result.stats.best_visits;
    out["max_depth"] = result.stats.max_depth;
    out["nodes_allocated"] = result.stats.nodes_allocated;
    out["estimator_calls"] = result.stats.estimator_calls;
    out["truncated_rollouts"] = result.stats.truncated_rollouts;

    py::list root_actions;
    for (const auto& stats : result.stats.root_actions) {
        py::dict entry;
        entry["action"] = stats.action;
        entry["key"] = stats.action.key();
        entry["visits"] = stats.visits;
        entry["value_sum"] = stats.value_sum;
        entry["mean_value"] = stats.mean_value();
        root_actions.append(entry);
    }
    out["root_actions"] = root_actions;
    return out;
}

static py::dict parallel_result_to_dict(const parallel::ParallelSearchResult& result) {
    py::dict out;
    out["action"] = result.action ? py::cast(*result.action) : py::none();
    out["action_key"] = result.action ? py::cast(result.action->key()) : py::none();
    out["visits"] = result.visits;
    out["value"] = result.value;
    out["total_simulations"] = result.total_simulations;
    out["workers_completed"] = result.workers_completed;
    out["workers_failed"] = result.workers_failed;
    out["workers_without_decision"] = result.workers_without_decision;
    out["elapsed_ms"] = result.elapsed_ms;

    py::list records;
    for (const auto& record : result.records) {
        py::dict entry;
        entry["action"] = record.action;
        entry["key"] = record.action.key();
        entry["visits"] = record.visits;
        entry["value"] = record.value;
        entry["contributors"] = record.contributors;
        records.append(entry);
    }
    out["records"] = records;

    py::list workers;
    for (const auto& report : result.workers) {
        py::dict entry;
        entry["worker_id"] = report.worker_id;
        entry["completed"] = report.completed;
        entry["action_key"] = report.action ? py::cast(report.action->key()) : py::none();
        entry["simulations_evaluated"] = report.simulations_evaluated;
        entry["value"] = report.value;
        entry["best_visits"] = report.best_visits;
        entry["elapsed_ms"] = report.elapsed_ms;
        entry["error"] = report.error;
        workers.append(entry);
    }
    out["workers"] = workers;
    return out;
}

static py::dict py_search(const world::State& root,
                          std::shared_ptr<mcts::Environment> environment,
                          py::object estimator,
                          int num_simulations,
                          float exploration_weight,
                          int max_rollout_depth,
                          bool use_estimator_for_leaves,
                          float prior_weight,
                          int64_t seed) {
    mcts::SearchConfig config;
    config.exploration_weight = exploration_weight;
    config.max_rollout_depth = max_rollout_depth;
    config.use_estimator_for_leaves = use_estimator_for_leaves;
    config.prior_weight = prior_weight;
    config.seed = seed;

    mcts::Capabilities capabilities(environment, to_estimator(estimator));

    mcts::SearchResult result;
    {
        // Release GIL while searching (Python capabilities reacquire it)
        py::gil_scoped_release release;
        result = mcts::search(root, capabilities, num_simulations, config);
    }
    return search_result_to_dict(result);
}

static py::dict py_parallel_search(const world::State& root,
                                   std::shared_ptr<mcts::Environment> environment,
                                   py::object estimator,
                                   int num_workers,
                                   int simulations_per_worker,
                                   float exploration_weight,
                                   int max_rollout_depth,
                                   bool use_estimator_for_leaves,
                                   float prior_weight,
                                   int64_t seed,
                                   parallel::AggregationPolicy aggregation,
                                   parallel::CollectionOrder collection_order,
                                   parallel::FailurePolicy failure_policy,
                                   bool verbose) {
    parallel::ParallelSearchConfig config;
    config.exploration_weight = exploration_weight;
    config.max_rollout_depth = max_rollout_depth;
    config.use_estimator_for_leaves = use_estimator_for_leaves;
    config.prior_weight = prior_weight;
    config.seed = seed;
    config.aggregation = aggregation;
    config.collection_order = collection_order;
    config.failure_policy = failure_policy;
    config.verbose = verbose;

    mcts::Capabilities capabilities(environment, to_estimator(estimator));

    parallel::ParallelSearchResult result;
    {
        py::gil_scoped_release release;
        result = parallel::parallel_search(root, capabilities, num_workers, simulations_per_worker, config);
    }
    return parallel_result_to_dict(result);
}

static py::array_t<float> encode_state(const world::State& state) {
    py::array_t<float> out(encoding::StateEncoder::FEATURE_SIZE);
    encoding::StateEncoder::encode_to_buffer(state, out.mutable_data());
    return out;
}

static int encode_batch(const std::vector<world::State>& states,
                        py::array_t<float, py::array::c_style> buffer,
                        bool use_parallel) {
    auto buf = buffer.request();
    size_t needed = states.size() * encoding::StateEncoder::FEATURE_SIZE;
    if (static_cast<size_t>(buf.size) < needed) {
        throw std::runtime_error("Buffer too small: need " + std::to_string(needed)
                                 + " floats, got " + std::to_string(buf.size));
    }
    float* data = static_cast<float*>(buf.ptr);
    py::gil_scoped_release release;
    return encoding::StateEncoder::encode_batch(states, data, use_parallel);
}

PYBIND11_MODULE(trader_mcts_cpp, m) {
    m.doc() = "Trader MCTS C++ - Monte-Carlo Tree Search decision core for trader agents";

    // Exceptions (subclasses registered last are matched first)
    static py::exception<mcts::SearchError>& search_error =
        py::register_exception<mcts::SearchError>(m, "SearchError", PyExc_RuntimeError);
    py::register_exception<mcts::InvalidState>(m, "InvalidState", search_error.ptr());
    py::register_exception<mcts::CapabilityFailure>(m, "CapabilityFailure", search_error.ptr());

    // World model
    py::enum_<world::ActionKind>(m, "ActionKind")
        .value("MOVE", world::ActionKind::MOVE)
        .value("BUY", world::ActionKind::BUY)
        .value("SELL", world::ActionKind::SELL)
        .value("WAIT", world::ActionKind::WAIT);

    py::class_<world::Action>(m, "Action")
        .def(py::init<>())
        .def_readwrite("kind", &world::Action::kind)
        .def_readwrite("target", &world::Action::target)
        .def_readwrite("quantity", &world::Action::quantity)
        .def_static("move", &world::Action::move, py::arg("destination"))
        .def_static("buy", &world::Action::buy, py::arg("item_id"), py::arg("units"))
        .def_static("sell", &world::Action::sell, py::arg("item_id"), py::arg("units"))
        .def_static("wait", &world::Action::wait)
        .def("key", &world::Action::key, "Aggregation key, e.g. 'move:3' or 'buy:2x5'")
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__hash__", [](const world::Action& a) { return py::hash(py::str(a.key())); })
        .def("__repr__", [](const world::Action& a) { return "<Action " + a.key() + ">"; });

    py::class_<world::InventorySlot>(m, "InventorySlot")
        .def(py::init<>())
        .def(py::init([](int32_t item_id, int32_t quantity) {
                 return world::InventorySlot{item_id, quantity};
             }),
             py::arg("item_id"), py::arg("quantity"))
        .def_readwrite("item_id", &world::InventorySlot::item_id)
        .def_readwrite("quantity", &world::InventorySlot::quantity);

    py::class_<world::State>(m, "State")
        .def(py::init<>())
        .def_readwrite("location", &world::State::location)
        .def_readwrite("turn", &world::State::turn)
        .def_readwrite("horizon", &world::State::horizon)
        .def_readwrite("player", &world::State::player)
        .def_readwrite("capacity", &world::State::capacity)
        .def_readwrite("gold", &world::State::gold)
        .def_readwrite("initial_wealth", &world::State::initial_wealth)
        .def_readwrite("inventory", &world::State::inventory)
        .def("cargo_units", &world::State::cargo_units)
        .def("quantity_of", &world::State::quantity_of, py::arg("item_id"))
        .def("turns_remaining", &world::State::turns_remaining)
        .def("adjust_inventory", &world::State::adjust_inventory, py::arg("item_id"), py::arg("delta"))
        .def("validate", &world::State::validate, "Raise InvalidState if malformed")
        .def("serialize", [](const world::State& s) {
                 std::vector<uint8_t> record = world::serialize(s);
                 return py::bytes(reinterpret_cast<const char*>(record.data()), record.size());
             },
             "Binary state record")
        .def_static("deserialize", [](py::bytes record) {
                 std::string raw = record;
                 return world::deserialize(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
             },
             py::arg("record"),
             "Rebuild a State from serialize() output (raises InvalidState)")
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", &world::State::to_string);

    // Capabilities
    py::class_<mcts::Environment, PyEnvironment, std::shared_ptr<mcts::Environment>>(m, "Environment")
        .def(py::init<>())
        .def("legal_actions", &mcts::Environment::legal_actions, py::arg("state"))
        .def("apply", &mcts::Environment::apply, py::arg("state"), py::arg("action"))
        .def("is_terminal", &mcts::Environment::is_terminal, py::arg("state"))
        .def("reward", &mcts::Environment::reward, py::arg("state"))
        .def("player_to_move", &mcts::Environment::player_to_move, py::arg("state"))
        .def("validate", &mcts::Environment::validate, py::arg("state"));

    py::class_<mcts::ValueEstimator, PyValueEstimator, std::shared_ptr<mcts::ValueEstimator>>(m, "ValueEstimator")
        .def(py::init<>())
        .def("estimate", &mcts::ValueEstimator::estimate, py::arg("state"));

    py::class_<mcts::LinearValueEstimator, mcts::ValueEstimator,
               std::shared_ptr<mcts::LinearValueEstimator>>(m, "LinearValueEstimator")
        .def(py::init<>(), "Zero weights (estimates 0 until loaded)")
        .def(py::init<std::vector<float>, float>(), py::arg("weights"), py::arg("bias") = 0.0f)
        .def("save", &mcts::LinearValueEstimator::save, py::arg("path"))
        .def("load", &mcts::LinearValueEstimator::load, py::arg("path"))
        .def_property_readonly("weights", &mcts::LinearValueEstimator::weights)
        .def_property_readonly("bias", &mcts::LinearValueEstimator::bias);

    // Trader domain
    py::enum_<world::Season>(m, "Season")
        .value("SPRING", world::Season::SPRING)
        .value("SUMMER", world::Season::SUMMER)
        .value("AUTUMN", world::Season::AUTUMN)
        .value("WINTER", world::Season::WINTER);

    py::class_<world::MarketListing>(m, "MarketListing")
        .def(py::init([](int32_t item_id, double buy_price, double sell_price, int32_t lot_size) {
                 return world::MarketListing{item_id, buy_price, sell_price, lot_size};
             }),
             py::arg("item_id"), py::arg("buy_price") = 0.0, py::arg("sell_price") = 0.0,
             py::arg("lot_size") = 1)
        .def_readwrite("item_id", &world::MarketListing::item_id)
        .def_readwrite("buy_price", &world::MarketListing::buy_price)
        .def_readwrite("sell_price", &world::MarketListing::sell_price)
        .def_readwrite("lot_size", &world::MarketListing::lot_size);

    py::class_<world::TraderWorldConfig>(m, "TraderWorldConfig")
        .def(py::init<>())
        .def_readwrite("reward_scale", &world::TraderWorldConfig::reward_scale)
        .def_readwrite("season_length", &world::TraderWorldConfig::season_length)
        .def_readwrite("start_season", &world::TraderWorldConfig::start_season)
        .def_readwrite("allow_wait", &world::TraderWorldConfig::allow_wait);

    py::class_<world::TraderWorld, mcts::Environment, std::shared_ptr<world::TraderWorld>>(m, "TraderWorld")
        .def(py::init<const world::TraderWorldConfig&>(), py::arg("config") = world::TraderWorldConfig())
        .def("add_settlement", &world::TraderWorld::add_settlement, py::arg("id"), py::arg("name"))
        .def("add_route", &world::TraderWorld::add_route,
             py::arg("from_id"), py::arg("to_id"), py::arg("travel_turns") = 1,
             py::arg("toll") = 0.0, py::arg("bidirectional") = true)
        .def("set_listing", &world::TraderWorld::set_listing, py::arg("settlement_id"), py::arg("listing"))
        .def("set_seasonal_modifier", &world::TraderWorld::set_seasonal_modifier,
             py::arg("season"), py::arg("item_id"), py::arg("multiplier"))
        .def("num_settlements", &world::TraderWorld::num_settlements)
        .def("season_at", &world::TraderWorld::season_at, py::arg("turn"))
        .def("price_modifier", &world::TraderWorld::price_modifier, py::arg("item_id"), py::arg("turn"))
        .def("wealth", &world::TraderWorld::wealth, py::arg("state"))
        .def("make_state", &world::TraderWorld::make_state,
             py::arg("location"), py::arg("gold"), py::arg("capacity"), py::arg("horizon"),
             "Fresh episode state with initial_wealth = gold");

    py::class_<world::WealthEstimator, mcts::ValueEstimator,
               std::shared_ptr<world::WealthEstimator>>(m, "WealthEstimator")
        .def(py::init([](std::shared_ptr<world::TraderWorld> trader_world) {
                 return std::make_shared<world::WealthEstimator>(std::move(trader_world));
             }),
             py::arg("world"));

    // Search
    py::enum_<parallel::AggregationPolicy>(m, "AggregationPolicy")
        .value("BEST_ACTION_CREDIT", parallel::AggregationPolicy::BestActionCredit)
        .value("PER_ACTION_VISITS", parallel::AggregationPolicy::PerActionVisits);

    py::enum_<parallel::CollectionOrder>(m, "CollectionOrder")
        .value("DISPATCH", parallel::CollectionOrder::Dispatch)
        .value("COMPLETION", parallel::CollectionOrder::Completion);

    py::enum_<parallel::FailurePolicy>(m, "FailurePolicy")
        .value("FAIL_FAST", parallel::FailurePolicy::FailFast)
        .value("BEST_EFFORT", parallel::FailurePolicy::BestEffort);

    m.def("search", &py_search,
          py::arg("root"),
          py::arg("environment"),
          py::arg("estimator") = py::none(),
          py::arg("num_simulations") = 800,
          py::arg("exploration_weight") = 1.41421356f,
          py::arg("max_rollout_depth") = 256,
          py::arg("use_estimator_for_leaves") = true,
          py::arg("prior_weight") = 0.0f,
          py::arg("seed") = -1,
          "Single-threaded MCTS. Returns a dict; 'action' is None when there is no decision.\n"
          "estimator: None (random rollouts), a ValueEstimator, or a callable state -> float");

    m.def("parallel_search", &py_parallel_search,
          py::arg("root"),
          py::arg("environment"),
          py::arg("estimator") = py::none(),
          py::arg("num_workers") = 4,
          py::arg("simulations_per_worker") = 200,
          py::arg("exploration_weight") = 1.41421356f,
          py::arg("max_rollout_depth") = 256,
          py::arg("use_estimator_for_leaves") = true,
          py::arg("prior_weight") = 0.0f,
          py::arg("seed") = -1,
          py::arg("aggregation") = parallel::AggregationPolicy::BestActionCredit,
          py::arg("collection_order") = parallel::CollectionOrder::Dispatch,
          py::arg("failure_policy") = parallel::FailurePolicy::FailFast,
          py::arg("verbose") = false,
          "Independent searches on worker threads, aggregated by action key.\n"
          "Worker i uses seed + i when seed >= 0");

    // Encoding
    m.def("encode_state", &encode_state, py::arg("state"),
          "Encode a State into FEATURE_SIZE floats");

    m.def("encode_batch", &encode_batch,
          py::arg("states"),
          py::arg("buffer").noconvert(),
          py::arg("use_parallel") = true,
          "Encode states into a preallocated float32 buffer (OpenMP when use_parallel)");

    m.attr("FEATURE_SIZE") = encoding::StateEncoder::FEATURE_SIZE;
    m.attr("MAX_WORKERS") = parallel::ParallelSearchConfig::MAX_WORKERS;
    m.attr("__version__") = "1.0.0";
}
