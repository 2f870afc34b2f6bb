#ifndef VEIL_SHIELDED_APPLYCONTEXT_H_INCLUDED
#define VEIL_SHIELDED_APPLYCONTEXT_H_INCLUDED

#include <libveil/shielded/AssetCustodian.h>
#include <libveil/shielded/KeyTypeRegistry.h>
#include <libveil/shielded/LedgerSandbox.h>
#include <libveil/shielded/ProofVerifier.h>
#include <libveil/shielded/ShieldedEvents.h>

#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/protocol/UintTypes.h>

#include <utility>
#include <vector>

namespace veil {

/** Fixed parameters of a pool. */
struct LedgerRules
{
    // Asset the custodian holds for the pool
    ripple::Currency asset;

    // Program verification key every proof is checked against
    uint256 programVKey;
};

/** State-free checks get the rules and a journal, nothing else. */
struct PreflightContext
{
    LedgerRules const& rules;
    beast::Journal const j;
};

/**
 * Everything one call may touch. Ledger writes go to the sandbox and
 * notifications are held back until the caller commits.
 */
class ApplyContext
{
public:
    ApplyContext(
        LedgerState const& base,
        LedgerRules const& rules_,
        ProofVerifier const* verifier_,
        AssetCustodian& custodian_,
        KeyTypeRegistry const& keyTypes_,
        beast::Journal journal_)
        : rules(rules_)
        , verifier(verifier_)
        , custodian(custodian_)
        , keyTypes(keyTypes_)
        , journal(journal_)
        , view_(base)
    {
    }

    LedgerRules const& rules;
    ProofVerifier const* const verifier;
    AssetCustodian& custodian;
    KeyTypeRegistry const& keyTypes;
    beast::Journal const journal;

    LedgerSandbox&
    view()
    {
        return view_;
    }

    LedgerSandbox const&
    view() const
    {
        return view_;
    }

    void
    deliver(ShieldedEvent event)
    {
        events_.push_back(std::move(event));
    }

    std::vector<ShieldedEvent> const&
    events() const
    {
        return events_;
    }

private:
    LedgerSandbox view_;
    std::vector<ShieldedEvent> events_;
};

}  // namespace veil

#endif
