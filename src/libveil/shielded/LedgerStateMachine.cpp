#include <libveil/shielded/DepositAndTransfer.h>
#include <libveil/shielded/LedgerStateMachine.h>
#include <libveil/shielded/ShieldedDeposit.h>
#include <libveil/shielded/ShieldedTransfer.h>
#include <libveil/shielded/ShieldedWithdraw.h>

#include <xrpl/basics/Log.h>

#include <type_traits>

namespace veil {

LedgerStateMachine::LedgerStateMachine(
    LedgerRules const& rules,
    std::unique_ptr<ProofVerifier> verifier,
    AssetCustodian& custodian,
    KeyTypeRegistry keyTypes,
    beast::Journal j,
    LedgerState state)
    : rules_(rules)
    , verifier_(std::move(verifier))
    , custodian_(custodian)
    , keyTypes_(std::move(keyTypes))
    , j_(j)
    , state_(std::move(state))
{
    if (!verifier_)
    {
        JLOG(j_.warn()) << "No proof verifier: proof-carrying calls will be rejected";
    }
}

template <class Tx, class Args>
ShieldedResult
LedgerStateMachine::transact(Args const& args, std::optional<std::uint64_t>* leafIndex)
{
    if (auto const ter = Tx::preflight(PreflightContext{rules_, j_}, args); !isSuccess(ter))
        return ter;

    ApplyContext ctx(state_, rules_, verifier_.get(), custodian_, keyTypes_, j_);
    Tx tx(ctx, args);

    if (auto const ter = tx(); !isSuccess(ter))
        return ter;

    ctx.view().apply(state_);

    if constexpr (std::is_same_v<Tx, ShieldedDeposit>)
    {
        if (leafIndex != nullptr)
            *leafIndex = tx.leafIndex();
    }

    JLOG(j_.debug()) << "Committed: root " << state_.accumulator.root() << ", "
                     << state_.accumulator.nextIndex() << " leaves, "
                     << state_.totalDeposited << " deposited";

    publish(ctx.events());
    return ShieldedResult::success;
}

void
LedgerStateMachine::publish(std::vector<ShieldedEvent> const& events) const
{
    for (auto const& event : events)
    {
        JLOG(j_.trace()) << to_string(event);
        if (sink_ != nullptr)
            sink_->publish(event);
    }
}

ripple::Expected<std::uint64_t, ShieldedResult>
LedgerStateMachine::deposit(
    ripple::AccountID const& from,
    uint256 const& commitment,
    OutputCiphertext const& ciphertext,
    std::uint64_t amount)
{
    DepositArgs const args{from, commitment, ciphertext, amount};

    std::optional<std::uint64_t> index;
    if (auto const ter = transact<ShieldedDeposit>(args, &index); !isSuccess(ter))
        return ripple::Unexpected(ter);
    return *index;
}

ripple::Expected<std::uint64_t, ShieldedResult>
LedgerStateMachine::depositWithDelegatedApproval(
    uint256 const& commitment,
    OutputCiphertext const& ciphertext,
    std::uint64_t amount,
    DelegatedApproval const& approval,
    ripple::Slice const& signature,
    ripple::AccountID const& depositor)
{
    DepositArgs const args{depositor, commitment, ciphertext, amount, &approval, signature};

    std::optional<std::uint64_t> index;
    if (auto const ter = transact<ShieldedDeposit>(args, &index); !isSuccess(ter))
        return ripple::Unexpected(ter);
    return *index;
}

ShieldedResult
LedgerStateMachine::submitTransfer(
    std::vector<OutputCiphertext> const& encryptedOutputs,
    ripple::Slice const& proof,
    ripple::Slice const& publicValues)
{
    return transact<ShieldedTransfer>(TransferArgs{encryptedOutputs, proof, publicValues});
}

ShieldedResult
LedgerStateMachine::withdraw(
    ripple::AccountID const& recipient,
    std::uint64_t amount,
    ripple::Slice const& proof,
    ripple::Slice const& publicValues,
    std::vector<OutputCiphertext> const& changeOutputs)
{
    return transact<ShieldedWithdraw>(
        WithdrawArgs{recipient, amount, proof, publicValues, changeOutputs});
}

ShieldedResult
LedgerStateMachine::depositAndTransfer(
    ripple::AccountID const& from,
    uint256 const& depositCommitment,
    std::vector<OutputCiphertext> const& encryptedOutputs,
    ripple::Slice const& proof,
    ripple::Slice const& publicValues,
    std::uint64_t amount)
{
    return transact<DepositAndTransfer>(DepositAndTransferArgs{
        from, depositCommitment, encryptedOutputs, proof, publicValues, amount});
}

ripple::Blob
LedgerStateMachine::getMetadata(uint256 const& commitment) const
{
    auto const it = state_.metadata.find(commitment);
    if (it == state_.metadata.end())
        return {};
    return it->second;
}

}  // namespace veil
