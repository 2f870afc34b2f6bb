#pragma once

#include <xrpl/basics/base_uint.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace veil {

using ripple::uint256;

/** Height of the commitment accumulator. Supports 2^32 leaves. */
constexpr std::size_t TREE_HEIGHT = 32;
constexpr std::uint64_t MAX_LEAVES = (1ULL << TREE_HEIGHT);

/**
 * Roots of empty subtrees, one per level.
 *
 * zero[0] is 32 zero bytes (an unfilled leaf), zero[i] is
 * hashPair(zero[i-1], zero[i-1]). The root of an empty accumulator is
 * zero[TREE_HEIGHT - 1].
 */
class ZeroHashTable
{
public:
    ZeroHashTable();

    uint256 const&
    operator[](std::size_t level) const
    {
        return zeros_[level];
    }

    std::size_t
    size() const
    {
        return zeros_.size();
    }

    uint256 const&
    emptyRoot() const
    {
        return zeros_[TREE_HEIGHT - 1];
    }

private:
    std::array<uint256, TREE_HEIGHT> zeros_;
};

/** The table is a pure function of the hash; computed once per process. */
ZeroHashTable const&
zeroHashes();

}  // namespace veil
