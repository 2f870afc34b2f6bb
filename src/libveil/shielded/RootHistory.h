#pragma once

#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/Serializer.h>

#include <cstddef>
#include <set>

namespace veil {

using ripple::uint256;

/**
 * Every root the accumulator has ever held.
 *
 * Membership, not recency, gates admission: a proof computed against any
 * earlier root stays admissible, and double spends are caught by the
 * nullifier set instead. Roots are never removed. The empty-tree root is
 * seeded on construction.
 */
class RootHistory
{
public:
    RootHistory();

    /** Record a root. Returns false if it was already known. */
    bool
    add(uint256 const& root);

    bool
    contains(uint256 const& root) const;

    std::size_t
    size() const
    {
        return roots_.size();
    }

    std::set<uint256> const&
    roots() const
    {
        return roots_;
    }

    void
    serialize(ripple::Serializer& s) const;

    static RootHistory
    deserialize(ripple::SerialIter& sit);

private:
    std::set<uint256> roots_;
};

}  // namespace veil
