#ifndef VEIL_SHIELDED_LEDGERSTATE_H_INCLUDED
#define VEIL_SHIELDED_LEDGERSTATE_H_INCLUDED

#include <libveil/shielded/IncrementalAccumulator.h>
#include <libveil/shielded/NullifierSet.h>
#include <libveil/shielded/RootHistory.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/Serializer.h>

#include <cstdint>
#include <map>

namespace veil {

/**
 * Committed state of the shielded pool.
 *
 * Only LedgerSandbox::apply() mutates it during normal operation; readers
 * see the state as of the last committed call.
 */
struct LedgerState
{
    IncrementalAccumulator accumulator;
    RootHistory roots;
    NullifierSet nullifiers;
    std::map<uint256, ripple::Blob> metadata;
    std::uint64_t totalDeposited = 0;

    void
    serialize(ripple::Serializer& s) const;

    /**
     * Throws std::runtime_error if the data is truncated or describes a
     * state no sequence of operations could have produced.
     */
    static LedgerState
    deserialize(ripple::SerialIter& sit);
};

}  // namespace veil

#endif
