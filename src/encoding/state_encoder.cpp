#include "encoding/state_encoder.hpp"
#include <algorithm>
#include <cstring>

namespace encoding {

std::vector<float> StateEncoder::encode(const world::State& state) {
    std::vector<float> buffer(FEATURE_SIZE, 0.0f);
    encode_to_buffer(state, buffer.data());
    return buffer;
}

void StateEncoder::encode_to_buffer(const world::State& state, float* buffer) {
    // Clear buffer (padding stays zero)
    std::memset(buffer, 0, FEATURE_SIZE * sizeof(float));

    encode_numeric(state, buffer);
    encode_location(state, buffer);
    encode_inventory(state, buffer);
}

void StateEncoder::encode_numeric(const world::State& state, float* buffer) {
    float gold = static_cast<float>(state.gold);
    float initial = static_cast<float>(state.initial_wealth);

    buffer[0] = std::clamp(gold / GOLD_SCALE, -1.0f, 1.0f);
    buffer[1] = std::clamp(initial / GOLD_SCALE, -1.0f, 1.0f);
    buffer[2] = std::min(1.0f, state.capacity / CAPACITY_SCALE);
    buffer[3] = state.capacity > 0
        ? std::min(1.0f, static_cast<float>(state.cargo_units()) / state.capacity)
        : 0.0f;
    buffer[4] = state.horizon > 0
        ? std::min(1.0f, static_cast<float>(state.turn) / state.horizon)
        : 1.0f;
    buffer[5] = std::min(1.0f, state.turns_remaining() / HORIZON_SCALE);
    buffer[6] = state.player != 0 ? 1.0f : 0.0f;
    buffer[7] = std::clamp((gold - initial) / GOLD_SCALE, -1.0f, 1.0f);
}

void StateEncoder::encode_location(const world::State& state, float* buffer) {
    if (state.location >= 0 && state.location < MAX_LOCATIONS) {
        buffer[LOCATION_OFFSET + state.location] = 1.0f;
    }
}

void StateEncoder::encode_inventory(const world::State& state, float* buffer) {
    float capacity = static_cast<float>(std::max(state.capacity, 1));
    int slots = std::min(static_cast<int>(state.inventory.size()), MAX_SLOTS);

    for (int i = 0; i < slots; ++i) {
        const auto& slot = state.inventory[i];
        float* slot_features = buffer + INVENTORY_OFFSET + i * SLOT_WIDTH;

        if (slot.item_id >= 0 && slot.item_id < ITEM_VOCAB) {
            slot_features[slot.item_id] = 1.0f;
        }
        slot_features[ITEM_VOCAB] = std::min(1.0f, slot.quantity / capacity);
    }
}

int StateEncoder::encode_batch(const std::vector<world::State>& states, float* buffer, bool use_parallel) {
    int batch_size = static_cast<int>(states.size());

    if (use_parallel) {
        // OpenMP parallel encoding
        #pragma omp parallel for schedule(static)
        for (int i = 0; i < batch_size; ++i) {
            encode_to_buffer(states[i], buffer + static_cast<size_t>(i) * FEATURE_SIZE);
        }
    } else {
        for (int i = 0; i < batch_size; ++i) {
            encode_to_buffer(states[i], buffer + static_cast<size_t>(i) * FEATURE_SIZE);
        }
    }

    return batch_size;
}

} // namespace encoding
