#pragma once

#include "../world/state.hpp"
#include "../encoding/state_encoder.hpp"
#include <string>
#include <vector>

namespace mcts {

// Interface for state value estimation
//
// estimate() maps a state to a desirability in [-1, 1] from the deciding
// agent's perspective. Implementations must be safe to call concurrently.
class ValueEstimator {
public:
    virtual ~ValueEstimator() = default;

    virtual float estimate(const world::State& state) const = 0;
};

// Linear model over StateEncoder features: tanh(w . x + b)
//
// Weights come from an external trainer as a .tvew file:
//   magic:        char[4] = "TVEW"
//   version:      uint32_t = 1
//   feature_size: uint32_t (must equal StateEncoder::FEATURE_SIZE)
//   reserved:     uint32_t
//   weights:      feature_size * float
//   bias:         float
class LinearValueEstimator : public ValueEstimator {
public:
    // Zero weights: estimates 0 everywhere until loaded
    LinearValueEstimator();

    // Throws std::invalid_argument if weights.size() != FEATURE_SIZE
    LinearValueEstimator(std::vector<float> weights, float bias);

    float estimate(const world::State& state) const override;

    // Raw pre-activation score for encoded features
    float score(const float* features) const;

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    const std::vector<float>& weights() const { return weights_; }
    float bias() const { return bias_; }

private:
    std::vector<float> weights_;
    float bias_;
};

} // namespace mcts
