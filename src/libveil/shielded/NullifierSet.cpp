#include <libveil/shielded/NullifierSet.h>

#include <stdexcept>

namespace veil {

bool
NullifierSet::consume(uint256 const& nullifier)
{
    return spent_.insert(nullifier).second;
}

bool
NullifierSet::contains(uint256 const& nullifier) const
{
    return spent_.find(nullifier) != spent_.end();
}

void
NullifierSet::serialize(ripple::Serializer& s) const
{
    s.add64(spent_.size());
    for (auto const& nullifier : spent_)
        s.addBitString(nullifier);
}

NullifierSet
NullifierSet::deserialize(ripple::SerialIter& sit)
{
    NullifierSet set;

    std::uint64_t const count = sit.get64();
    for (std::uint64_t i = 0; i < count; ++i)
    {
        if (!set.consume(sit.getBitString<256>()))
            throw std::runtime_error("Invalid serialized nullifier set: duplicate entry");
    }

    return set;
}

}  // namespace veil
