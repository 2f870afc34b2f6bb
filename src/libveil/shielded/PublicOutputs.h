#ifndef VEIL_SHIELDED_PUBLICOUTPUTS_H_INCLUDED
#define VEIL_SHIELDED_PUBLICOUTPUTS_H_INCLUDED

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

#include <optional>
#include <vector>

namespace veil {

using ripple::uint256;

/**
 * The state transition a proof authorizes.
 *
 * The prover commits these values as its public values, ABI encoded as the
 * tuple (bytes32 oldRoot, bytes32[] nullifiers, bytes32[] outputCommitments).
 * The ledger decodes them from the same buffer the verifier checked, never
 * from a separate argument, so the applied transition is exactly the proved
 * one.
 */
struct PublicOutputs
{
    uint256 oldRoot;
    std::vector<uint256> nullifiers;
    std::vector<uint256> outputCommitments;

    /** Returns nothing if the buffer is not a well formed encoding. */
    static std::optional<PublicOutputs>
    decode(ripple::Slice const& publicValues);

    ripple::Blob
    encode() const;
};

bool
operator==(PublicOutputs const& lhs, PublicOutputs const& rhs);

}  // namespace veil

#endif
