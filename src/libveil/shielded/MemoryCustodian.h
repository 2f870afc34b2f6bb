#ifndef VEIL_SHIELDED_MEMORYCUSTODIAN_H_INCLUDED
#define VEIL_SHIELDED_MEMORYCUSTODIAN_H_INCLUDED

#include <libveil/shielded/AssetCustodian.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <map>
#include <set>

namespace veil {

/**
 * Custodian keeping account balances in memory.
 *
 * Used by hosts that settle the public asset elsewhere, and by tests.
 * Approvals are checked against the configured asset, verified with the
 * signer's key, and their nonces are burned on use.
 */
class MemoryCustodian : public AssetCustodian
{
public:
    MemoryCustodian(ripple::Currency const& asset, beast::Journal j);

    /** Credit an account from outside the pool. */
    void
    fund(ripple::AccountID const& account, std::uint64_t amount);

    std::uint64_t
    balanceOf(ripple::AccountID const& account) const;

    bool
    nonceUsed(uint256 const& nonce) const
    {
        return usedNonces_.count(nonce) != 0;
    }

    ShieldedResult
    pull(ripple::AccountID const& from, std::uint64_t amount) override;

    ShieldedResult
    pullWithApproval(
        DelegatedApproval const& approval,
        ripple::Slice const& signature,
        ripple::AccountID const& depositor,
        std::uint64_t amount) override;

    ShieldedResult
    release(ripple::AccountID const& to, std::uint64_t amount) override;

    std::uint64_t
    poolBalance() const override
    {
        return pool_;
    }

private:
    ripple::Currency const asset_;
    beast::Journal const j_;

    std::map<ripple::AccountID, std::uint64_t> balances_;
    std::set<uint256> usedNonces_;
    std::uint64_t pool_ = 0;
};

}  // namespace veil

#endif
