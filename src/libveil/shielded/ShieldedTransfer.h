#ifndef VEIL_SHIELDED_SHIELDEDTRANSFER_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDTRANSFER_H_INCLUDED

#include <libveil/shielded/ShieldedTransactor.h>

#include <vector>

namespace veil {

struct TransferArgs
{
    std::vector<OutputCiphertext> const& outputs;
    ripple::Slice proof;
    ripple::Slice publicValues;
};

/** Spends notes and creates new ones, entirely inside the pool. */
class ShieldedTransfer : public ShieldedTransactor
{
public:
    ShieldedTransfer(ApplyContext& ctx, TransferArgs const& args)
        : ShieldedTransactor(ctx), args_(args)
    {
    }

    static ShieldedResult
    preflight(PreflightContext const& ctx, TransferArgs const& args);

protected:
    ShieldedResult
    doApply() override;

private:
    TransferArgs const& args_;
};

}  // namespace veil

#endif
