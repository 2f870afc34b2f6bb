#include <libveil/shielded/ShieldedDeposit.h>

#include <xrpl/basics/Log.h>

namespace veil {

ShieldedResult
ShieldedDeposit::preflight(PreflightContext const& ctx, DepositArgs const& args)
{
    if (args.amount == 0)
    {
        JLOG(ctx.j.debug()) << "Deposit amount must be positive";
        return ShieldedResult::invalidAmount;
    }

    if (args.ciphertext.commitment != args.commitment)
    {
        JLOG(ctx.j.debug()) << "Ciphertext announces " << args.ciphertext.commitment
                            << " but deposit commits " << args.commitment;
        return ShieldedResult::commitmentMismatch;
    }

    if (!metadataFits(args.ciphertext))
    {
        JLOG(ctx.j.debug()) << "Deposit metadata is " << args.ciphertext.metadata.size()
                            << " bytes";
        return ShieldedResult::metadataTooLarge;
    }

    if (args.approval != nullptr)
    {
        if (args.approval->token != ctx.rules.asset)
        {
            JLOG(ctx.j.debug()) << "Approval is for another asset";
            return ShieldedResult::invalidApproval;
        }

        if (args.approval->amount < args.amount)
        {
            JLOG(ctx.j.debug()) << "Approval of " << args.approval->amount
                                << " does not cover " << args.amount;
            return ShieldedResult::invalidApproval;
        }
    }

    return ShieldedResult::success;
}

ShieldedResult
ShieldedDeposit::doApply()
{
    auto const& ciphertext = args_.ciphertext;

    if (auto const ter = ctx_.keyTypes.check(ciphertext.keyType); !isSuccess(ter))
    {
        JLOG(j_.debug()) << "Deposit key type " << unsigned(ciphertext.keyType) << ": "
                         << transToken(ter);
        return ter;
    }

    if (!view().addDeposit(args_.amount))
    {
        JLOG(j_.debug()) << "Deposit of " << args_.amount << " overflows the pool";
        return ShieldedResult::invalidAmount;
    }

    // Announce the deposit before the output it created
    auto const index = view().nextIndex();
    ctx_.deliver(Deposited{args_.from, args_.amount, args_.commitment, index});

    if (auto const inserted = insertOutput(ciphertext); !inserted)
        return inserted.error();

    // Custody is the last step of the call
    auto const pulled = args_.approval != nullptr
        ? ctx_.custodian.pullWithApproval(*args_.approval, args_.signature, args_.from, args_.amount)
        : ctx_.custodian.pull(args_.from, args_.amount);
    if (!isSuccess(pulled))
    {
        JLOG(j_.error()) << "Deposit pull from " << ripple::toBase58(args_.from) << " failed";
        return ShieldedResult::assetTransferFailed;
    }

    leafIndex_ = index;

    JLOG(j_.info()) << "Deposit of " << args_.amount << " from " << ripple::toBase58(args_.from)
                    << " at leaf " << index;
    return ShieldedResult::success;
}

}  // namespace veil
