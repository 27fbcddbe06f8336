#include "world/serialization.hpp"
#include "mcts/errors.hpp"
#include <cstring>
#include <string>
#include <type_traits>

namespace world {

namespace {

constexpr char STATE_RECORD_MAGIC[4] = {'T', 'R', 'S', 'T'};

// Fixed part of the payload: 5 x int32 + 2 x double + uint32 slot count
constexpr size_t FIXED_PAYLOAD_SIZE = 5 * sizeof(int32_t) + 2 * sizeof(double) + sizeof(uint32_t);
constexpr size_t SLOT_SIZE = 2 * sizeof(int32_t);

template<size_t N> struct UnsignedOfSize;
template<> struct UnsignedOfSize<4> { using type = uint32_t; };
template<> struct UnsignedOfSize<8> { using type = uint64_t; };

// Appends value's bytes least significant first
template<typename T>
void append(std::vector<uint8_t>& out, T value) {
    static_assert(std::is_trivially_copyable<T>::value, "append needs a trivially copyable type");
    using Bits = typename UnsignedOfSize<sizeof(T)>::type;
    Bits bits;
    std::memcpy(&bits, &value, sizeof(T));
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
    }
}

class RecordReader {
public:
    RecordReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

    template<typename T>
    T read() {
        if (pos_ + sizeof(T) > size_) {
            throw mcts::InvalidState("state record truncated at byte " + std::to_string(pos_));
        }
        using Bits = typename UnsignedOfSize<sizeof(T)>::type;
        Bits bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits |= static_cast<Bits>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += sizeof(T);
        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }

    void skip(size_t bytes) { pos_ += bytes; }

    size_t remaining() const { return size_ - pos_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

} // namespace

std::vector<uint8_t> serialize(const State& state) {
    size_t payload_size = FIXED_PAYLOAD_SIZE + state.inventory.size() * SLOT_SIZE;

    std::vector<uint8_t> out;
    out.reserve(STATE_RECORD_HEADER_SIZE + payload_size);

    out.insert(out.end(), STATE_RECORD_MAGIC, STATE_RECORD_MAGIC + 4);
    append<uint32_t>(out, STATE_RECORD_VERSION);
    append<uint32_t>(out, static_cast<uint32_t>(payload_size));
    append<uint32_t>(out, 0);  // reserved

    append<int32_t>(out, state.location);
    append<int32_t>(out, state.turn);
    append<int32_t>(out, state.horizon);
    append<int32_t>(out, state.player);
    append<int32_t>(out, state.capacity);
    append<double>(out, state.gold);
    append<double>(out, state.initial_wealth);
    append<uint32_t>(out, static_cast<uint32_t>(state.inventory.size()));
    for (const auto& slot : state.inventory) {
        append<int32_t>(out, slot.item_id);
        append<int32_t>(out, slot.quantity);
    }

    return out;
}

State decode_state(const std::vector<uint8_t>& record) {
    return decode_state(record.data(), record.size());
}

State decode_state(const uint8_t* data, size_t size) {
    if (data == nullptr || size < STATE_RECORD_HEADER_SIZE) {
        throw mcts::InvalidState("state record shorter than its header");
    }
    if (std::memcmp(data, STATE_RECORD_MAGIC, 4) != 0) {
        throw mcts::InvalidState("state record has invalid magic");
    }

    RecordReader header(data, STATE_RECORD_HEADER_SIZE);
    header.skip(4);
    uint32_t version = header.read<uint32_t>();
    uint32_t payload_size = header.read<uint32_t>();

    if (version != STATE_RECORD_VERSION) {
        throw mcts::InvalidState("unsupported state record version " + std::to_string(version));
    }
    if (payload_size != size - STATE_RECORD_HEADER_SIZE) {
        throw mcts::InvalidState("state record payload size mismatch: header says "
                                 + std::to_string(payload_size) + ", record has "
                                 + std::to_string(size - STATE_RECORD_HEADER_SIZE));
    }

    RecordReader reader(data + STATE_RECORD_HEADER_SIZE, payload_size);

    State state;
    state.location = reader.read<int32_t>();
    state.turn = reader.read<int32_t>();
    state.horizon = reader.read<int32_t>();
    state.player = reader.read<int32_t>();
    state.capacity = reader.read<int32_t>();
    state.gold = reader.read<double>();
    state.initial_wealth = reader.read<double>();

    uint32_t num_slots = reader.read<uint32_t>();
    if (num_slots > MAX_INVENTORY_SLOTS || num_slots * SLOT_SIZE != reader.remaining()) {
        throw mcts::InvalidState("state record slot count " + std::to_string(num_slots)
                                 + " does not match payload");
    }

    state.inventory.reserve(num_slots);
    for (uint32_t i = 0; i < num_slots; ++i) {
        InventorySlot slot;
        slot.item_id = reader.read<int32_t>();
        slot.quantity = reader.read<int32_t>();
        state.inventory.push_back(slot);
    }

    return state;
}

State deserialize(const std::vector<uint8_t>& record) {
    return deserialize(record.data(), record.size());
}

State deserialize(const uint8_t* data, size_t size) {
    State state = decode_state(data, size);
    state.validate();
    return state;
}

} // namespace world
