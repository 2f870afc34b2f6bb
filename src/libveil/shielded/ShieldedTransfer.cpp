#include <libveil/shielded/ShieldedTransfer.h>

#include <xrpl/basics/Log.h>

namespace veil {

ShieldedResult
ShieldedTransfer::preflight(PreflightContext const& ctx, TransferArgs const& args)
{
    // Everything else is bound to the proof and checked in order during
    // apply
    JLOG(ctx.j.trace()) << "Transfer with " << args.outputs.size() << " ciphertexts, "
                        << args.proof.size() << " byte proof";
    return ShieldedResult::success;
}

ShieldedResult
ShieldedTransfer::doApply()
{
    auto const outputs = verifyAndDecode(args_.proof, args_.publicValues);
    if (!outputs)
        return outputs.error();

    if (auto const ter = admitRoot(outputs->oldRoot); !isSuccess(ter))
        return ter;

    if (auto const ter = consumeNullifiers(outputs->nullifiers); !isSuccess(ter))
        return ter;

    if (auto const ter = insertOutputs(args_.outputs, outputs->outputCommitments); !isSuccess(ter))
        return ter;

    JLOG(j_.info()) << "Transfer spent " << outputs->nullifiers.size() << " notes, created "
                    << outputs->outputCommitments.size();
    return ShieldedResult::success;
}

}  // namespace veil
