#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "rescue.hpp"

namespace semaphore {

struct PathNode {
    Digest sibling;
    // 1: the node being authenticated is the right operand at this level
    bool bit;
};

// leaf level first
using MerklePath = std::vector<PathNode>;

inline size_t path_index(const MerklePath& path) {
    size_t idx = 0;
    for (size_t k = 0; k < path.size(); k++)
        if (path[k].bit) idx |= (size_t)1 << k;
    return idx;
}

inline Digest merkle_step(const Digest& acc, const PathNode& node) {
    return node.bit ? rescue::merge(node.sibling, acc) : rescue::merge(acc, node.sibling);
}

inline Digest root_from_path(const Digest& leaf, const MerklePath& path) {
    Digest acc = leaf;
    for (const auto& node : path) acc = merkle_step(acc, node);
    return acc;
}

// heap layout: nodes_[1] is the root, leaves occupy [width, 2 * width)
class MerkleTree {
    size_t depth_ = 0;
    size_t width_ = 0;
    std::vector<Digest> nodes_;

public:
    MerkleTree() = default;

    MerkleTree(const std::vector<Digest>& leaves, size_t min_depth) {
        size_t w = next_power_of_2(leaves.size() < 2 ? 2 : leaves.size());
        while (log2_size(w) < min_depth) w <<= 1;
        width_ = w;
        depth_ = log2_size(w);

        nodes_.assign(2 * w, zero_digest());
        for (size_t i = 0; i < leaves.size(); i++) nodes_[w + i] = leaves[i];
        for (size_t i = w; i-- > 1;)
            nodes_[i] = rescue::merge(nodes_[2 * i], nodes_[2 * i + 1]);
    }

    size_t depth() const { return depth_; }
    size_t width() const { return width_; }
    const Digest& root() const { return nodes_[1]; }
    const Digest& leaf(size_t i) const { return nodes_[width_ + i]; }

    MerklePath prove(size_t index) const {
        if (index >= width_)
            throw WitnessError(WitnessErrc::INVALID_INDEX, "leaf " + std::to_string(index));
        MerklePath path;
        path.reserve(depth_);
        size_t pos = width_ + index;
        for (size_t k = 0; k < depth_; k++) {
            path.push_back({nodes_[pos ^ 1], (pos & 1) != 0});
            pos >>= 1;
        }
        return path;
    }
};

}
