#include <libveil/shielded/Hash.h>
#include <libveil/shielded/ZeroHashTable.h>

namespace veil {

ZeroHashTable::ZeroHashTable()
{
    zeros_[0] = uint256{};
    for (std::size_t i = 1; i < TREE_HEIGHT; ++i)
        zeros_[i] = hashPair(zeros_[i - 1], zeros_[i - 1]);
}

ZeroHashTable const&
zeroHashes()
{
    static ZeroHashTable const table;
    return table;
}

}  // namespace veil
