#ifndef VEIL_SHIELDED_ASSETCUSTODIAN_H_INCLUDED
#define VEIL_SHIELDED_ASSETCUSTODIAN_H_INCLUDED

#include <libveil/shielded/ShieldedResult.h>

#include <xrpl/basics/Buffer.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/AccountID.h>
#include <xrpl/protocol/PublicKey.h>
#include <xrpl/protocol/SecretKey.h>
#include <xrpl/protocol/UintTypes.h>

#include <cstdint>

namespace veil {

using ripple::uint256;

/**
 * A depositor's signed permission for the pool to pull funds on their
 * behalf. The signature covers approvalSigningData().
 */
struct DelegatedApproval
{
    ripple::Currency token;
    std::uint64_t amount = 0;
    uint256 nonce;
    ripple::PublicKey signer;
};

/** Canonical bytes a delegated approval signature is made over. */
ripple::Buffer
approvalSigningData(DelegatedApproval const& approval);

/** Signs an approval with the depositor's key. */
ripple::Buffer
signApproval(DelegatedApproval const& approval, ripple::SecretKey const& secretKey);

/**
 * Holder of the public asset backing the shielded pool.
 *
 * Every method either completes the whole transfer or changes nothing and
 * returns assetTransferFailed.
 */
class AssetCustodian
{
public:
    virtual ~AssetCustodian() = default;

    /** Move amount from an account into the pool. */
    virtual ShieldedResult
    pull(ripple::AccountID const& from, std::uint64_t amount) = 0;

    /**
     * Move amount from the depositor into the pool under a signed
     * approval. The signer must be the depositor and the nonce unused.
     */
    virtual ShieldedResult
    pullWithApproval(
        DelegatedApproval const& approval,
        ripple::Slice const& signature,
        ripple::AccountID const& depositor,
        std::uint64_t amount) = 0;

    /** Move amount from the pool to a public recipient. */
    virtual ShieldedResult
    release(ripple::AccountID const& to, std::uint64_t amount) = 0;

    /** Asset currently held for the pool. */
    virtual std::uint64_t
    poolBalance() const = 0;
};

}  // namespace veil

#endif
