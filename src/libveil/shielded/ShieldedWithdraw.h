#ifndef VEIL_SHIELDED_SHIELDEDWITHDRAW_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDWITHDRAW_H_INCLUDED

#include <libveil/shielded/ShieldedTransactor.h>

#include <xrpl/protocol/AccountID.h>

#include <vector>

namespace veil {

struct WithdrawArgs
{
    ripple::AccountID recipient;
    std::uint64_t amount = 0;
    ripple::Slice proof;
    ripple::Slice publicValues;

    // One ciphertext per proved output commitment; empty when the proof
    // creates no change
    std::vector<OutputCiphertext> const& changeOutputs;
};

/** Spends notes and releases public asset to a recipient. */
class ShieldedWithdraw : public ShieldedTransactor
{
public:
    ShieldedWithdraw(ApplyContext& ctx, WithdrawArgs const& args)
        : ShieldedTransactor(ctx), args_(args)
    {
    }

    static ShieldedResult
    preflight(PreflightContext const& ctx, WithdrawArgs const& args);

protected:
    ShieldedResult
    doApply() override;

private:
    WithdrawArgs const& args_;
};

}  // namespace veil

#endif
