#include <libveil/shielded/ShieldedWithdraw.h>

#include <xrpl/basics/Log.h>

namespace veil {

ShieldedResult
ShieldedWithdraw::preflight(PreflightContext const& ctx, WithdrawArgs const& args)
{
    if (args.amount == 0)
    {
        JLOG(ctx.j.debug()) << "Withdrawal amount must be positive";
        return ShieldedResult::invalidAmount;
    }

    return ShieldedResult::success;
}

ShieldedResult
ShieldedWithdraw::doApply()
{
    auto const outputs = verifyAndDecode(args_.proof, args_.publicValues);
    if (!outputs)
        return outputs.error();

    if (auto const ter = admitRoot(outputs->oldRoot); !isSuccess(ter))
        return ter;

    if (auto const ter = consumeNullifiers(outputs->nullifiers); !isSuccess(ter))
        return ter;

    if (!view().subtractWithdrawal(args_.amount))
    {
        JLOG(j_.warn()) << "Withdrawal of " << args_.amount << " exceeds pool balance "
                        << view().totalDeposited();
        return ShieldedResult::insufficientBalance;
    }

    if (auto const ter = insertOutputs(args_.changeOutputs, outputs->outputCommitments);
        !isSuccess(ter))
        return ter;

    ctx_.deliver(Withdrawn{args_.recipient, args_.amount});

    if (!isSuccess(ctx_.custodian.release(args_.recipient, args_.amount)))
    {
        JLOG(j_.error()) << "Release to " << ripple::toBase58(args_.recipient) << " failed";
        return ShieldedResult::assetTransferFailed;
    }

    JLOG(j_.info()) << "Withdrawal of " << args_.amount << " to "
                    << ripple::toBase58(args_.recipient) << " with "
                    << args_.changeOutputs.size() << " change outputs";
    return ShieldedResult::success;
}

}  // namespace veil
