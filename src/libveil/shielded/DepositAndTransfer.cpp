#include <libveil/shielded/DepositAndTransfer.h>

#include <xrpl/basics/Log.h>

namespace veil {

ShieldedResult
DepositAndTransfer::preflight(PreflightContext const& ctx, DepositAndTransferArgs const& args)
{
    if (args.depositCommitment == beast::zero)
    {
        JLOG(ctx.j.debug()) << "Deposit commitment is zero";
        return ShieldedResult::zeroCommitment;
    }

    if (args.amount == 0)
    {
        JLOG(ctx.j.debug()) << "Deposit amount must be positive";
        return ShieldedResult::invalidAmount;
    }

    return ShieldedResult::success;
}

ShieldedResult
DepositAndTransfer::doApply()
{
    auto const index = view().insertCommitment(args_.depositCommitment);
    if (!index)
        return index.error();

    if (!view().addDeposit(args_.amount))
    {
        JLOG(j_.debug()) << "Deposit of " << args_.amount << " overflows the pool";
        return ShieldedResult::invalidAmount;
    }

    ctx_.deliver(Deposited{args_.from, args_.amount, args_.depositCommitment, *index});

    auto const outputs = verifyAndDecode(args_.proof, args_.publicValues);
    if (!outputs)
        return outputs.error();

    if (outputs->outputCommitments.empty())
    {
        JLOG(j_.warn()) << "Proof creates no outputs";
        return ShieldedResult::emptyOutputs;
    }

    if (auto const ter = admitRoot(outputs->oldRoot); !isSuccess(ter))
        return ter;

    if (auto const ter = consumeNullifiers(outputs->nullifiers); !isSuccess(ter))
        return ter;

    if (auto const ter = insertOutputs(args_.outputs, outputs->outputCommitments); !isSuccess(ter))
        return ter;

    if (!isSuccess(ctx_.custodian.pull(args_.from, args_.amount)))
    {
        JLOG(j_.error()) << "Deposit pull from " << ripple::toBase58(args_.from) << " failed";
        return ShieldedResult::assetTransferFailed;
    }

    JLOG(j_.info()) << "Deposit of " << args_.amount << " at leaf " << *index
                    << " and transfer creating " << outputs->outputCommitments.size()
                    << " outputs";
    return ShieldedResult::success;
}

}  // namespace veil
