#pragma once

#include "node.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace mcts {

// NodePool: Chained arena allocator for MCTS nodes
// Nodes never move once allocated (each block reserves its full capacity up
// front), so raw Node* links stay valid until reset() or destruction.
class NodePool {
public:
    // Configuration
    static constexpr size_t NODES_PER_BLOCK = 4096;
    static constexpr size_t MAX_BLOCKS = 1024;          // 4M nodes per tree

    NodePool() : current_block_(0) {
        allocate_block();
    }

    NodePool(const NodePool&) = delete;
    NodePool& operator=(const NodePool&) = delete;

    // Allocate a new node holding `state` (amortized O(1))
    Node* allocate(world::State state) {
        // Check if current block is full
        if (blocks_[current_block_].size() >= NODES_PER_BLOCK) {
            if (current_block_ + 1 < blocks_.size()) {
                ++current_block_;
            } else {
                allocate_block();
            }
        }

        auto& block = blocks_[current_block_];
        block.emplace_back(std::move(state));
        return &block.back();
    }

    // Reset pool (destroys all nodes, keeps allocated memory)
    void reset() {
        for (auto& block : blocks_) {
            block.clear();
        }
        current_block_ = 0;
    }

    // Get total number of live nodes
    size_t size() const {
        size_t total = 0;
        for (size_t i = 0; i <= current_block_; ++i) {
            total += blocks_[i].size();
        }
        return total;
    }

    // Get reserved node slots
    size_t capacity() const {
        return blocks_.size() * NODES_PER_BLOCK;
    }

private:
    void allocate_block() {
        if (blocks_.size() >= MAX_BLOCKS) {
            throw std::runtime_error("NodePool: Maximum number of blocks reached");
        }

        blocks_.emplace_back();
        blocks_.back().reserve(NODES_PER_BLOCK);
        current_block_ = blocks_.size() - 1;
    }

    std::vector<std::vector<Node>> blocks_;
    size_t current_block_;
};

} // namespace mcts
