#include <libveil/shielded/MemoryCustodian.h>

#include <xrpl/basics/Log.h>
#include <xrpl/protocol/Serializer.h>

#include <limits>
#include <stdexcept>

namespace veil {

ripple::Buffer
approvalSigningData(DelegatedApproval const& approval)
{
    ripple::Serializer s;
    s.addBitString(approval.token);
    s.add64(approval.amount);
    s.addBitString(approval.nonce);
    s.addVL(approval.signer.slice());
    return ripple::Buffer(s.data(), s.size());
}

ripple::Buffer
signApproval(DelegatedApproval const& approval, ripple::SecretKey const& secretKey)
{
    auto const message = approvalSigningData(approval);
    return ripple::sign(approval.signer, secretKey, ripple::Slice(message.data(), message.size()));
}

MemoryCustodian::MemoryCustodian(ripple::Currency const& asset, beast::Journal j)
    : asset_(asset), j_(j)
{
}

void
MemoryCustodian::fund(ripple::AccountID const& account, std::uint64_t amount)
{
    auto& balance = balances_[account];
    if (amount > std::numeric_limits<std::uint64_t>::max() - balance)
        throw std::overflow_error("Account balance overflow");
    balance += amount;
}

std::uint64_t
MemoryCustodian::balanceOf(ripple::AccountID const& account) const
{
    auto const it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

ShieldedResult
MemoryCustodian::pull(ripple::AccountID const& from, std::uint64_t amount)
{
    auto const it = balances_.find(from);
    if (it == balances_.end() || it->second < amount)
    {
        JLOG(j_.error()) << "Pull of " << amount << " from " << ripple::toBase58(from)
                         << " exceeds its balance";
        return ShieldedResult::assetTransferFailed;
    }

    if (amount > std::numeric_limits<std::uint64_t>::max() - pool_)
    {
        JLOG(j_.error()) << "Pool balance would overflow";
        return ShieldedResult::assetTransferFailed;
    }

    it->second -= amount;
    pool_ += amount;
    return ShieldedResult::success;
}

ShieldedResult
MemoryCustodian::pullWithApproval(
    DelegatedApproval const& approval,
    ripple::Slice const& signature,
    ripple::AccountID const& depositor,
    std::uint64_t amount)
{
    if (approval.token != asset_ || approval.amount < amount)
    {
        JLOG(j_.error()) << "Approval does not cover the pull";
        return ShieldedResult::assetTransferFailed;
    }

    if (ripple::calcAccountID(approval.signer) != depositor)
    {
        JLOG(j_.error()) << "Approval signer is not " << ripple::toBase58(depositor);
        return ShieldedResult::assetTransferFailed;
    }

    if (usedNonces_.count(approval.nonce))
    {
        JLOG(j_.error()) << "Approval nonce " << approval.nonce << " already used";
        return ShieldedResult::assetTransferFailed;
    }

    auto const message = approvalSigningData(approval);
    if (!ripple::verify(
            approval.signer, ripple::Slice(message.data(), message.size()), signature))
    {
        JLOG(j_.error()) << "Approval signature rejected";
        return ShieldedResult::assetTransferFailed;
    }

    if (auto const ter = pull(depositor, amount); !isSuccess(ter))
        return ter;

    usedNonces_.insert(approval.nonce);
    return ShieldedResult::success;
}

ShieldedResult
MemoryCustodian::release(ripple::AccountID const& to, std::uint64_t amount)
{
    if (pool_ < amount)
    {
        JLOG(j_.error()) << "Release of " << amount << " exceeds pool balance " << pool_;
        return ShieldedResult::assetTransferFailed;
    }

    auto& balance = balances_[to];
    if (amount > std::numeric_limits<std::uint64_t>::max() - balance)
    {
        JLOG(j_.error()) << "Recipient balance would overflow";
        return ShieldedResult::assetTransferFailed;
    }

    pool_ -= amount;
    balance += amount;
    return ShieldedResult::success;
}

}  // namespace veil
