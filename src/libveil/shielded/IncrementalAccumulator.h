#pragma once

#include <libveil/shielded/ZeroHashTable.h>

#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/Serializer.h>

#include <array>
#include <cstdint>
#include <vector>

namespace veil {

using ripple::uint256;

/**
 * The O(height) part of the accumulator: enough to insert the next leaf
 * and know the root, without the leaf log.
 */
struct AccumulatorFrontier {
    // filledSubtrees[i] = most recent left node completed at level i
    std::array<uint256, TREE_HEIGHT> filledSubtrees;
    uint256 root;
    std::uint64_t nextIndex = 0;

    AccumulatorFrontier();
};

/**
 * Append-only incremental Merkle accumulator over note commitments.
 *
 * Key features:
 * - Fixed height (TREE_HEIGHT), unfilled leaves are zero[0]
 * - O(height) insert and root update through the frontier
 * - Leaf log kept for authentication paths handed to off-core provers
 * - Serialization of the leaf log for persistence
 */
class IncrementalAccumulator {
public:
    IncrementalAccumulator() = default;

    // Core operations
    std::uint64_t insert(const uint256& leaf);
    const uint256& root() const { return frontier_.root; }
    std::uint64_t nextIndex() const { return frontier_.nextIndex; }
    bool empty() const { return frontier_.nextIndex == 0; }

    const std::vector<uint256>& leaves() const { return leaves_; }
    const AccumulatorFrontier& frontier() const { return frontier_; }

    /**
     * Advance a frontier by one leaf using the per-level rule and return
     * the leaf index. The frontier must not be full.
     */
    static std::uint64_t advance(AccumulatorFrontier& frontier, const uint256& leaf);

    /**
     * Adopt a frontier computed elsewhere (a sandbox) together with the
     * leaves that produced it. The leaves must continue this log exactly.
     */
    void extend(const AccumulatorFrontier& frontier, const std::vector<uint256>& newLeaves);

    // Membership proofs
    std::vector<uint256> authPath(std::uint64_t index) const;
    static bool verify(
        const uint256& leaf,
        const std::vector<uint256>& path,
        std::uint64_t index,
        const uint256& expectedRoot);

    // Serialization of the leaf log; the frontier is rebuilt on load
    void serialize(ripple::Serializer& s) const;
    static IncrementalAccumulator deserialize(ripple::SerialIter& sit);

private:
    std::vector<uint256> leaves_;
    AccumulatorFrontier frontier_;
};

}  // namespace veil
