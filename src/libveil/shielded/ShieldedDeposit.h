#ifndef VEIL_SHIELDED_SHIELDEDDEPOSIT_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDDEPOSIT_H_INCLUDED

#include <libveil/shielded/AssetCustodian.h>
#include <libveil/shielded/ShieldedTransactor.h>

#include <xrpl/protocol/AccountID.h>

#include <optional>

namespace veil {

struct DepositArgs
{
    // Account the asset is pulled from; the depositor for delegated deposits
    ripple::AccountID from;
    uint256 commitment;
    OutputCiphertext const& ciphertext;
    std::uint64_t amount = 0;

    // Set for depositWithDelegatedApproval
    DelegatedApproval const* approval = nullptr;
    ripple::Slice signature;
};

/**
 * Public asset in, one commitment out.
 *
 * No proof is involved: the depositor chooses the commitment and the
 * ledger only checks that the ciphertext announces that same commitment.
 */
class ShieldedDeposit : public ShieldedTransactor
{
public:
    ShieldedDeposit(ApplyContext& ctx, DepositArgs const& args)
        : ShieldedTransactor(ctx), args_(args)
    {
    }

    static ShieldedResult
    preflight(PreflightContext const& ctx, DepositArgs const& args);

    /** Leaf the commitment landed at; set once the call succeeded. */
    std::optional<std::uint64_t>
    leafIndex() const
    {
        return leafIndex_;
    }

protected:
    ShieldedResult
    doApply() override;

private:
    DepositArgs const& args_;
    std::optional<std::uint64_t> leafIndex_;
};

}  // namespace veil

#endif
