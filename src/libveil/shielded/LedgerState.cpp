#include <libveil/shielded/LedgerState.h>

#include <stdexcept>

namespace veil {

void
LedgerState::serialize(ripple::Serializer& s) const
{
    accumulator.serialize(s);
    roots.serialize(s);
    nullifiers.serialize(s);

    s.add32(static_cast<std::uint32_t>(metadata.size()));
    for (auto const& [commitment, blob] : metadata)
    {
        s.addBitString(commitment);
        s.addVL(blob);
    }

    s.add64(totalDeposited);
}

LedgerState
LedgerState::deserialize(ripple::SerialIter& sit)
{
    LedgerState state;
    state.accumulator = IncrementalAccumulator::deserialize(sit);
    state.roots = RootHistory::deserialize(sit);
    state.nullifiers = NullifierSet::deserialize(sit);

    std::uint32_t const count = sit.get32();
    for (std::uint32_t i = 0; i < count; ++i)
    {
        auto const commitment = sit.getBitString<256>();
        auto blob = sit.getVL();
        if (!state.metadata.emplace(commitment, std::move(blob)).second)
            throw std::runtime_error("Invalid serialized state: duplicate metadata entry");
    }

    state.totalDeposited = sit.get64();

    // The replayed accumulator must land on a root the ledger recorded
    if (!state.roots.contains(state.accumulator.root()))
        throw std::runtime_error("Invalid serialized state: accumulator root not in root history");

    return state;
}

}  // namespace veil
