#pragma once

#include "state.hpp"
#include <cstdint>
#include <vector>

namespace world {

// Binary State record (.trst)
//
// All multi-byte fields are little-endian regardless of the host.
//
// Header (16 bytes):
//   magic:        char[4] = "TRST"
//   version:      uint32_t = 1
//   payload_size: uint32_t   (bytes following the header)
//   reserved:     uint32_t   (zero)
//
// Payload:
//   location, turn, horizon, player, capacity:  int32_t each
//   gold, initial_wealth:                       double each
//   num_slots:                                  uint32_t
//   slots:                                      num_slots * (int32_t item_id, int32_t quantity)
constexpr uint32_t STATE_RECORD_VERSION = 1;
constexpr size_t STATE_RECORD_HEADER_SIZE = 16;
constexpr uint32_t MAX_INVENTORY_SLOTS = 1u << 16;

std::vector<uint8_t> serialize(const State& state);

// Throws mcts::InvalidState on a malformed record or a structurally invalid State
State deserialize(const std::vector<uint8_t>& record);
State deserialize(const uint8_t* data, size_t size);

// Record checks only: the decoded State is returned as stored, without
// State::validate(). Used where State is a carrier for another domain.
State decode_state(const std::vector<uint8_t>& record);
State decode_state(const uint8_t* data, size_t size);

} // namespace world
