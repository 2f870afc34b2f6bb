#pragma once

#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/Serializer.h>

#include <cstddef>
#include <set>

namespace veil {

using ripple::uint256;

/**
 * Spent-note markers. The only double-spend guard of the ledger.
 *
 * Insertion is one way. consume() is an atomic check-and-set: callers apply
 * it once per nullifier as they walk a transaction, so a nullifier listed
 * twice in the same transaction fails on its second occurrence.
 */
class NullifierSet
{
public:
    /** Mark as spent. Returns false, and changes nothing, if already spent. */
    [[nodiscard]] bool
    consume(uint256 const& nullifier);

    bool
    contains(uint256 const& nullifier) const;

    std::size_t
    size() const
    {
        return spent_.size();
    }

    std::set<uint256> const&
    spent() const
    {
        return spent_;
    }

    void
    serialize(ripple::Serializer& s) const;

    static NullifierSet
    deserialize(ripple::SerialIter& sit);

private:
    std::set<uint256> spent_;
};

}  // namespace veil
