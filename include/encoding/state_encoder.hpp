#pragma once

#include "../world/state.hpp"
#include <vector>
#include <cstdint>

namespace encoding {

// Fixed-width feature encoding of a trader State for value estimation.
// 128 floats total:
// - 8 numeric features (0-7):
//   - 0: gold / GOLD_SCALE (clamped to [-1, 1])
//   - 1: initial wealth / GOLD_SCALE (clamped to [-1, 1])
//   - 2: capacity / CAPACITY_SCALE (clamped to 1)
//   - 3: cargo fraction (cargo units / capacity)
//   - 4: turn progress (turn / horizon)
//   - 5: turns remaining / HORIZON_SCALE (clamped to 1)
//   - 6: acting player flag (1 when an opponent is to move)
//   - 7: gold gained since start / GOLD_SCALE (clamped to [-1, 1])
// - 64 location features (8-71): one-hot settlement id; ids >= 64 leave the block zero
// - 52 inventory features (72-123): 4 slots x (12-way item one-hot + quantity / capacity)
//   Slots follow inventory order; items outside the vocabulary keep only the quantity
// - 4 zero padding (124-127)
class StateEncoder {
public:
    static constexpr int NUMERIC_FEATURES = 8;
    static constexpr int MAX_LOCATIONS = 64;
    static constexpr int MAX_SLOTS = 4;
    static constexpr int ITEM_VOCAB = 12;
    static constexpr int SLOT_WIDTH = ITEM_VOCAB + 1;

    static constexpr int LOCATION_OFFSET = NUMERIC_FEATURES;
    static constexpr int INVENTORY_OFFSET = LOCATION_OFFSET + MAX_LOCATIONS;
    static constexpr int USED_FEATURES = INVENTORY_OFFSET + MAX_SLOTS * SLOT_WIDTH;
    static constexpr int FEATURE_SIZE = 128;

    static_assert(USED_FEATURES <= FEATURE_SIZE, "Encoder layout exceeds FEATURE_SIZE");

    // Normalization scales
    static constexpr float GOLD_SCALE = 1000.0f;
    static constexpr float CAPACITY_SCALE = 100.0f;
    static constexpr float HORIZON_SCALE = 50.0f;

    // Returns flat array of size FEATURE_SIZE
    static std::vector<float> encode(const world::State& state);

    // Writes FEATURE_SIZE floats to buffer (zero-filled first)
    static void encode_to_buffer(const world::State& state, float* buffer);

    // Batch encoding with optional OpenMP parallelization
    // buffer: output buffer of size states.size() * FEATURE_SIZE
    // Returns number of states encoded
    static int encode_batch(const std::vector<world::State>& states, float* buffer, bool use_parallel = true);

private:
    static void encode_numeric(const world::State& state, float* buffer);
    static void encode_location(const world::State& state, float* buffer);
    static void encode_inventory(const world::State& state, float* buffer);
};

} // namespace encoding
