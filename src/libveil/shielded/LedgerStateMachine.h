#ifndef VEIL_SHIELDED_LEDGERSTATEMACHINE_H_INCLUDED
#define VEIL_SHIELDED_LEDGERSTATEMACHINE_H_INCLUDED

#include <libveil/shielded/ApplyContext.h>
#include <libveil/shielded/AssetCustodian.h>
#include <libveil/shielded/KeyTypeRegistry.h>
#include <libveil/shielded/LedgerState.h>
#include <libveil/shielded/OutputCiphertext.h>
#include <libveil/shielded/ProofVerifier.h>
#include <libveil/shielded/ShieldedEvents.h>
#include <libveil/shielded/ShieldedResult.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/protocol/AccountID.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace veil {

/**
 * The shielded pool.
 *
 * Owns the committed LedgerState and runs every state-changing call as a
 * transactor against a fresh sandbox. A call either commits all of its
 * effects and then publishes its notifications, or returns an error code
 * and leaves the state exactly as it was.
 *
 * Not internally synchronized; the host serializes calls.
 */
class LedgerStateMachine
{
public:
    LedgerStateMachine(
        LedgerRules const& rules,
        std::unique_ptr<ProofVerifier> verifier,
        AssetCustodian& custodian,
        KeyTypeRegistry keyTypes,
        beast::Journal j,
        LedgerState state = {});

    LedgerStateMachine(LedgerStateMachine const&) = delete;
    LedgerStateMachine&
    operator=(LedgerStateMachine const&) = delete;

    /** Receiver of committed notifications; may be null. Not owned. */
    void
    setEventSink(EventSink* sink)
    {
        sink_ = sink;
    }

    //--------------------------------------------------------------------------
    // Operations

    ripple::Expected<std::uint64_t, ShieldedResult>
    deposit(
        ripple::AccountID const& from,
        uint256 const& commitment,
        OutputCiphertext const& ciphertext,
        std::uint64_t amount);

    ripple::Expected<std::uint64_t, ShieldedResult>
    depositWithDelegatedApproval(
        uint256 const& commitment,
        OutputCiphertext const& ciphertext,
        std::uint64_t amount,
        DelegatedApproval const& approval,
        ripple::Slice const& signature,
        ripple::AccountID const& depositor);

    ShieldedResult
    submitTransfer(
        std::vector<OutputCiphertext> const& encryptedOutputs,
        ripple::Slice const& proof,
        ripple::Slice const& publicValues);

    ShieldedResult
    withdraw(
        ripple::AccountID const& recipient,
        std::uint64_t amount,
        ripple::Slice const& proof,
        ripple::Slice const& publicValues,
        std::vector<OutputCiphertext> const& changeOutputs);

    ShieldedResult
    depositAndTransfer(
        ripple::AccountID const& from,
        uint256 const& depositCommitment,
        std::vector<OutputCiphertext> const& encryptedOutputs,
        ripple::Slice const& proof,
        ripple::Slice const& publicValues,
        std::uint64_t amount);

    //--------------------------------------------------------------------------
    // Queries

    uint256 const&
    currentRoot() const
    {
        return state_.accumulator.root();
    }

    std::uint64_t
    nextLeafIndex() const
    {
        return state_.accumulator.nextIndex();
    }

    bool
    nullifierUsed(uint256 const& nullifier) const
    {
        return state_.nullifiers.contains(nullifier);
    }

    bool
    isKnownRoot(uint256 const& root) const
    {
        return state_.roots.contains(root);
    }

    std::uint64_t
    totalDeposited() const
    {
        return state_.totalDeposited;
    }

    /** Asset the custodian actually holds for the pool. */
    std::uint64_t
    getBalance() const
    {
        return custodian_.poolBalance();
    }

    /** Empty if the commitment carried no metadata. */
    ripple::Blob
    getMetadata(uint256 const& commitment) const;

    /** Siblings from the leaf up. Throws std::out_of_range for unknown leaves. */
    std::vector<uint256>
    authPath(std::uint64_t leafIndex) const
    {
        return state_.accumulator.authPath(leafIndex);
    }

    LedgerState const&
    state() const
    {
        return state_;
    }

    LedgerRules const&
    rules() const
    {
        return rules_;
    }

private:
    template <class Tx, class Args>
    ShieldedResult
    transact(Args const& args, std::optional<std::uint64_t>* leafIndex = nullptr);

    void
    publish(std::vector<ShieldedEvent> const& events) const;

    LedgerRules const rules_;
    std::unique_ptr<ProofVerifier> verifier_;
    AssetCustodian& custodian_;
    KeyTypeRegistry keyTypes_;
    beast::Journal const j_;

    LedgerState state_;
    EventSink* sink_ = nullptr;
};

}  // namespace veil

#endif
