#ifndef VEIL_TEST_SHIELDEDENV_H_INCLUDED
#define VEIL_TEST_SHIELDEDENV_H_INCLUDED

#include <libveil/shielded/Hash.h>
#include <libveil/shielded/LedgerStateMachine.h>
#include <libveil/shielded/MemoryCustodian.h>
#include <libveil/shielded/PublicOutputs.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/protocol/KeyType.h>
#include <xrpl/protocol/SecretKey.h>
#include <xrpl/protocol/Serializer.h>
#include <xrpl/protocol/UintTypes.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace veil {
namespace test {

inline beast::Journal
nullJournal()
{
    return beast::Journal{beast::Journal::getNullSink()};
}

inline uint256
tag(std::string const& s)
{
    return sha256Digest(ripple::makeSlice(s));
}

/** Proof is SHA-256(vkey || publicValues); binds a proof to its values. */
class BindingVerifier : public ProofVerifier
{
public:
    static ripple::Blob
    prove(uint256 const& vkey, ripple::Slice const& publicValues)
    {
        ripple::Serializer s;
        s.addBitString(vkey);
        s.addRaw(publicValues);
        auto const digest = sha256Digest(s.slice());
        return ripple::Blob(digest.begin(), digest.end());
    }

    ripple::Expected<void, std::string>
    verify(uint256 const& verificationKey, ripple::Slice const& publicValues, ripple::Slice const& proof)
        const override
    {
        auto const expected = prove(verificationKey, publicValues);
        if (proof.size() != expected.size() ||
            !std::equal(expected.begin(), expected.end(), proof.data()))
            return ripple::Unexpected(std::string("proof does not bind these values"));
        return {};
    }
};

class RejectingVerifier : public ProofVerifier
{
public:
    ripple::Expected<void, std::string>
    verify(uint256 const&, ripple::Slice const&, ripple::Slice const&) const override
    {
        return ripple::Unexpected(std::string("rejected"));
    }
};

/** Custodian whose releases can be made to fail. */
class FlakyCustodian : public MemoryCustodian
{
public:
    using MemoryCustodian::MemoryCustodian;

    bool failRelease = false;

    ShieldedResult
    release(ripple::AccountID const& to, std::uint64_t amount) override
    {
        if (failRelease)
            return ShieldedResult::assetTransferFailed;
        return MemoryCustodian::release(to, amount);
    }
};

class EventLog : public EventSink
{
public:
    std::vector<ShieldedEvent> events;

    void
    publish(ShieldedEvent const& event) override
    {
        events.push_back(event);
    }

    template <class T>
    std::size_t
    count() const
    {
        return std::count_if(events.begin(), events.end(), [](ShieldedEvent const& e) {
            return std::holds_alternative<T>(e);
        });
    }

    template <class T>
    std::vector<T>
    all() const
    {
        std::vector<T> out;
        for (auto const& e : events)
            if (auto const* p = std::get_if<T>(&e))
                out.push_back(*p);
        return out;
    }
};

inline LedgerRules
testRules()
{
    LedgerRules rules;
    rules.asset = ripple::to_currency("USD");
    rules.programVKey = tag("transfer-program");
    return rules;
}

/** A pool with a funded depositor and an event log attached. */
struct ShieldedEnv
{
    LedgerRules const rules;
    FlakyCustodian custodian;
    EventLog log;
    LedgerStateMachine machine;

    std::pair<ripple::PublicKey, ripple::SecretKey> const aliceKeys;
    ripple::AccountID const alice;
    ripple::AccountID const bob;

    explicit ShieldedEnv(
        std::unique_ptr<ProofVerifier> verifier = std::make_unique<BindingVerifier>(),
        bool secp256r1 = false,
        LedgerState state = {})
        : rules(testRules())
        , custodian(rules.asset, nullJournal())
        , machine(
              rules,
              std::move(verifier),
              custodian,
              KeyTypeRegistry::standard(secp256r1),
              nullJournal(),
              std::move(state))
        , aliceKeys(ripple::randomKeyPair(ripple::KeyType::secp256k1))
        , alice(ripple::calcAccountID(aliceKeys.first))
        , bob(ripple::calcAccountID(ripple::randomKeyPair(ripple::KeyType::secp256k1).first))
    {
        machine.setEventSink(&log);
        custodian.fund(alice, 1000000);
    }

    /** Ciphertext for a commitment, encrypted to a fresh secp256k1 key. */
    static OutputCiphertext
    note(uint256 const& commitment, ripple::Blob metadata = {})
    {
        OutputCiphertext c;
        c.commitment = commitment;
        c.keyType = static_cast<std::uint8_t>(CipherKeyType::secp256k1);
        auto const key = ripple::randomKeyPair(ripple::KeyType::secp256k1).first;
        c.ephemeralKey.assign(key.slice().begin(), key.slice().end());
        c.nonce.fill(0x11);
        c.ciphertext = ripple::Blob(48, 0xC7);
        c.metadata = std::move(metadata);
        return c;
    }

    static std::vector<OutputCiphertext>
    notes(std::vector<uint256> const& commitments)
    {
        std::vector<OutputCiphertext> out;
        for (auto const& c : commitments)
            out.push_back(note(c));
        return out;
    }

    static ripple::Blob
    values(uint256 const& oldRoot, std::vector<uint256> nullifiers, std::vector<uint256> commitments)
    {
        PublicOutputs po;
        po.oldRoot = oldRoot;
        po.nullifiers = std::move(nullifiers);
        po.outputCommitments = std::move(commitments);
        return po.encode();
    }

    ripple::Blob
    prove(ripple::Blob const& publicValues) const
    {
        return BindingVerifier::prove(rules.programVKey, ripple::makeSlice(publicValues));
    }

    ripple::Expected<std::uint64_t, ShieldedResult>
    deposit(uint256 const& commitment, std::uint64_t amount)
    {
        return machine.deposit(alice, commitment, note(commitment), amount);
    }

    ShieldedResult
    transfer(
        uint256 const& oldRoot,
        std::vector<uint256> const& nullifiers,
        std::vector<uint256> const& commitments)
    {
        auto const pv = values(oldRoot, nullifiers, commitments);
        auto const proof = prove(pv);
        return machine.submitTransfer(
            notes(commitments), ripple::makeSlice(proof), ripple::makeSlice(pv));
    }

    ShieldedResult
    withdraw(
        std::uint64_t amount,
        uint256 const& oldRoot,
        std::vector<uint256> const& nullifiers,
        std::vector<uint256> const& change = {})
    {
        auto const pv = values(oldRoot, nullifiers, change);
        auto const proof = prove(pv);
        return machine.withdraw(
            bob, amount, ripple::makeSlice(proof), ripple::makeSlice(pv), notes(change));
    }
};

/** Everything a failed call must leave untouched. */
struct Snapshot
{
    uint256 root;
    std::uint64_t nextIndex;
    std::uint64_t totalDeposited;
    std::uint64_t poolBalance;
    std::size_t nullifiers;
    std::size_t roots;
    std::size_t metadata;
    std::size_t events;

    explicit Snapshot(ShieldedEnv const& env)
        : root(env.machine.currentRoot())
        , nextIndex(env.machine.nextLeafIndex())
        , totalDeposited(env.machine.totalDeposited())
        , poolBalance(env.machine.getBalance())
        , nullifiers(env.machine.state().nullifiers.size())
        , roots(env.machine.state().roots.size())
        , metadata(env.machine.state().metadata.size())
        , events(env.log.events.size())
    {
    }

    bool
    operator==(Snapshot const& other) const
    {
        return root == other.root && nextIndex == other.nextIndex &&
            totalDeposited == other.totalDeposited && poolBalance == other.poolBalance &&
            nullifiers == other.nullifiers && roots == other.roots &&
            metadata == other.metadata && events == other.events;
    }
};

}  // namespace test
}  // namespace veil

#endif
