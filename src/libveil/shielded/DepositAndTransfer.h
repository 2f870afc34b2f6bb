#ifndef VEIL_SHIELDED_DEPOSITANDTRANSFER_H_INCLUDED
#define VEIL_SHIELDED_DEPOSITANDTRANSFER_H_INCLUDED

#include <libveil/shielded/ShieldedTransactor.h>

#include <xrpl/protocol/AccountID.h>

#include <vector>

namespace veil {

struct DepositAndTransferArgs
{
    ripple::AccountID from;
    uint256 depositCommitment;
    std::vector<OutputCiphertext> const& outputs;
    ripple::Slice proof;
    ripple::Slice publicValues;
    std::uint64_t amount = 0;
};

/**
 * Deposit followed by a proved transfer in one call.
 *
 * The deposit commitment is not part of the proved statement; it is
 * inserted before the proof is checked, so the proof may spend it when
 * computed against the root the deposit produces.
 */
class DepositAndTransfer : public ShieldedTransactor
{
public:
    DepositAndTransfer(ApplyContext& ctx, DepositAndTransferArgs const& args)
        : ShieldedTransactor(ctx), args_(args)
    {
    }

    static ShieldedResult
    preflight(PreflightContext const& ctx, DepositAndTransferArgs const& args);

protected:
    ShieldedResult
    doApply() override;

private:
    DepositAndTransferArgs const& args_;
};

}  // namespace veil

#endif
