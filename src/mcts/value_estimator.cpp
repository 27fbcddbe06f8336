#include "mcts/value_estimator.hpp"
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace mcts {

namespace {

#pragma pack(push, 1)
struct TvewHeader {
    char magic[4];          // "TVEW"
    uint32_t version;
    uint32_t feature_size;
    uint32_t reserved;
};
#pragma pack(pop)
static_assert(sizeof(TvewHeader) == 16, "TvewHeader must be 16 bytes");

constexpr uint32_t TVEW_VERSION = 1;

} // namespace

LinearValueEstimator::LinearValueEstimator()
    : weights_(encoding::StateEncoder::FEATURE_SIZE, 0.0f)
    , bias_(0.0f)
{}

LinearValueEstimator::LinearValueEstimator(std::vector<float> weights, float bias)
    : weights_(std::move(weights))
    , bias_(bias)
{
    if (weights_.size() != static_cast<size_t>(encoding::StateEncoder::FEATURE_SIZE)) {
        throw std::invalid_argument("LinearValueEstimator: expected "
                                    + std::to_string(encoding::StateEncoder::FEATURE_SIZE)
                                    + " weights, got " + std::to_string(weights_.size()));
    }
}

float LinearValueEstimator::score(const float* features) const {
    float sum = bias_;
    for (size_t i = 0; i < weights_.size(); ++i) {
        sum += weights_[i] * features[i];
    }
    return sum;
}

float LinearValueEstimator::estimate(const world::State& state) const {
    float features[encoding::StateEncoder::FEATURE_SIZE];
    encoding::StateEncoder::encode_to_buffer(state, features);
    return std::tanh(score(features));
}

bool LinearValueEstimator::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[LinearValueEstimator] Failed to open file for writing: " << path << std::endl;
        return false;
    }

    TvewHeader header{};
    header.magic[0] = 'T'; header.magic[1] = 'V'; header.magic[2] = 'E'; header.magic[3] = 'W';
    header.version = TVEW_VERSION;
    header.feature_size = static_cast<uint32_t>(weights_.size());
    header.reserved = 0;

    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    out.write(reinterpret_cast<const char*>(weights_.data()), weights_.size() * sizeof(float));
    out.write(reinterpret_cast<const char*>(&bias_), sizeof(bias_));
    out.close();

    if (!out.good()) {
        std::cerr << "[LinearValueEstimator] Write error during save to: " << path << std::endl;
        return false;
    }
    return true;
}

bool LinearValueEstimator::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[LinearValueEstimator] Failed to open file for reading: " << path << std::endl;
        return false;
    }

    TvewHeader header{};
    in.read(reinterpret_cast<char*>(&header), sizeof(header));
    if (!in.good()) {
        std::cerr << "[LinearValueEstimator] Failed to read header from: " << path << std::endl;
        return false;
    }

    if (header.magic[0] != 'T' || header.magic[1] != 'V' ||
        header.magic[2] != 'E' || header.magic[3] != 'W') {
        std::cerr << "[LinearValueEstimator] Invalid magic in: " << path << std::endl;
        return false;
    }
    if (header.version != TVEW_VERSION) {
        std::cerr << "[LinearValueEstimator] Unsupported version " << header.version
                  << " in: " << path << std::endl;
        return false;
    }
    if (header.feature_size != static_cast<uint32_t>(encoding::StateEncoder::FEATURE_SIZE)) {
        std::cerr << "[LinearValueEstimator] Feature size mismatch in " << path
                  << ": file has " << header.feature_size
                  << ", encoder produces " << encoding::StateEncoder::FEATURE_SIZE << std::endl;
        return false;
    }

    // Read into temporaries so a failed load leaves the current model intact
    std::vector<float> weights(header.feature_size);
    float bias = 0.0f;
    in.read(reinterpret_cast<char*>(weights.data()), weights.size() * sizeof(float));
    in.read(reinterpret_cast<char*>(&bias), sizeof(bias));
    if (!in.good()) {
        std::cerr << "[LinearValueEstimator] Read error during load from: " << path << std::endl;
        return false;
    }

    weights_ = std::move(weights);
    bias_ = bias;
    return true;
}

} // namespace mcts
