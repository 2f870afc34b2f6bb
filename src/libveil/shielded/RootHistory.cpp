#include <libveil/shielded/RootHistory.h>
#include <libveil/shielded/ZeroHashTable.h>

namespace veil {

RootHistory::RootHistory()
{
    roots_.insert(zeroHashes().emptyRoot());
}

bool
RootHistory::add(uint256 const& root)
{
    return roots_.insert(root).second;
}

bool
RootHistory::contains(uint256 const& root) const
{
    return roots_.find(root) != roots_.end();
}

void
RootHistory::serialize(ripple::Serializer& s) const
{
    s.add64(roots_.size());
    for (auto const& root : roots_)
        s.addBitString(root);
}

RootHistory
RootHistory::deserialize(ripple::SerialIter& sit)
{
    RootHistory history;

    std::uint64_t const count = sit.get64();
    for (std::uint64_t i = 0; i < count; ++i)
        history.roots_.insert(sit.getBitString<256>());

    return history;
}

}  // namespace veil
