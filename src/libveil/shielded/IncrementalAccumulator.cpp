#include <libveil/shielded/Hash.h>
#include <libveil/shielded/IncrementalAccumulator.h>

#include <stdexcept>
#include <utility>

namespace veil {

AccumulatorFrontier::AccumulatorFrontier()
    : root(zeroHashes().emptyRoot()) {
    auto const& zeros = zeroHashes();
    for (std::size_t level = 0; level < TREE_HEIGHT; ++level) {
        filledSubtrees[level] = zeros[level];
    }
}

std::uint64_t IncrementalAccumulator::advance(AccumulatorFrontier& frontier, const uint256& leaf) {
    if (frontier.nextIndex >= MAX_LEAVES) {
        throw std::overflow_error("Commitment accumulator is full");
    }

    auto const& zeros = zeroHashes();
    std::uint64_t const index = frontier.nextIndex;

    uint256 current = leaf;
    std::uint64_t idx = index;

    for (std::size_t level = 0; level < TREE_HEIGHT; ++level) {
        if ((idx & 1) == 0) {
            // Left child: remember it for the right sibling that comes later,
            // the right side is still empty
            frontier.filledSubtrees[level] = current;
            current = hashPair(current, zeros[level]);
        } else {
            // Right child: the left sibling is the last completed left node
            current = hashPair(frontier.filledSubtrees[level], current);
        }
        idx >>= 1;
    }

    frontier.root = current;
    frontier.nextIndex = index + 1;
    return index;
}

std::uint64_t IncrementalAccumulator::insert(const uint256& leaf) {
    std::uint64_t const index = advance(frontier_, leaf);
    leaves_.push_back(leaf);
    return index;
}

void IncrementalAccumulator::extend(
    const AccumulatorFrontier& frontier,
    const std::vector<uint256>& newLeaves) {
    if (frontier.nextIndex != leaves_.size() + newLeaves.size()) {
        throw std::logic_error("Frontier does not continue the leaf log");
    }

    leaves_.insert(leaves_.end(), newLeaves.begin(), newLeaves.end());
    frontier_ = frontier;
}

std::vector<uint256> IncrementalAccumulator::authPath(std::uint64_t index) const {
    if (index >= leaves_.size()) {
        throw std::out_of_range("Leaf index not in accumulator");
    }

    auto const& zeros = zeroHashes();

    std::vector<uint256> path;
    path.reserve(TREE_HEIGHT);

    // Replay the tree level by level; nodes past the end of a level are the
    // empty subtree root of that level
    std::vector<uint256> level_nodes = leaves_;
    std::uint64_t idx = index;

    for (std::size_t level = 0; level < TREE_HEIGHT; ++level) {
        std::uint64_t const sibling = idx ^ 1;
        path.push_back(sibling < level_nodes.size() ? level_nodes[sibling] : zeros[level]);

        std::vector<uint256> next_level;
        next_level.reserve((level_nodes.size() + 1) / 2);
        for (std::size_t i = 0; i < level_nodes.size(); i += 2) {
            uint256 const& right = (i + 1 < level_nodes.size()) ? level_nodes[i + 1] : zeros[level];
            next_level.push_back(hashPair(level_nodes[i], right));
        }

        level_nodes = std::move(next_level);
        idx >>= 1;
    }

    return path;
}

bool IncrementalAccumulator::verify(
    const uint256& leaf,
    const std::vector<uint256>& path,
    std::uint64_t index,
    const uint256& expectedRoot) {
    if (path.size() != TREE_HEIGHT) {
        return false;
    }

    uint256 current = leaf;
    std::uint64_t idx = index;

    for (auto const& sibling : path) {
        if (idx & 1) {
            current = hashPair(sibling, current);
        } else {
            current = hashPair(current, sibling);
        }
        idx >>= 1;
    }

    return current == expectedRoot;
}

void IncrementalAccumulator::serialize(ripple::Serializer& s) const {
    s.add64(leaves_.size());
    for (auto const& leaf : leaves_) {
        s.addBitString(leaf);
    }
}

IncrementalAccumulator IncrementalAccumulator::deserialize(ripple::SerialIter& sit) {
    std::uint64_t const count = sit.get64();
    if (count > MAX_LEAVES) {
        throw std::runtime_error("Invalid serialized accumulator: too many leaves");
    }

    IncrementalAccumulator accumulator;
    for (std::uint64_t i = 0; i < count; ++i) {
        accumulator.insert(sit.getBitString<256>());
    }

    return accumulator;
}

}  // namespace veil
