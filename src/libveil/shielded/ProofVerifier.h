#ifndef VEIL_SHIELDED_PROOFVERIFIER_H_INCLUDED
#define VEIL_SHIELDED_PROOFVERIFIER_H_INCLUDED

#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

#include <string>

namespace veil {

using ripple::uint256;

/**
 * Proof verification capability.
 *
 * A successful verify() means the proof was produced for exactly these
 * public values by the program identified by verificationKey. The ledger
 * relies on that binding: it decodes the transition it applies from the
 * same public values buffer.
 */
class ProofVerifier
{
public:
    virtual ~ProofVerifier() = default;

    /** On failure the error carries a reason for the log. */
    virtual ripple::Expected<void, std::string>
    verify(
        uint256 const& verificationKey,
        ripple::Slice const& publicValues,
        ripple::Slice const& proof) const = 0;
};

}  // namespace veil

#endif
