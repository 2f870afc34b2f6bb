#include <libveil/shielded/LedgerSandbox.h>

#include <limits>
#include <stdexcept>

namespace veil {

LedgerSandbox::LedgerSandbox(LedgerState const& base)
    : base_(base)
    , frontier_(base.accumulator.frontier())
    , totalDeposited_(base.totalDeposited)
{
}

ripple::Expected<std::uint64_t, ShieldedResult>
LedgerSandbox::insertCommitment(uint256 const& commitment)
{
    if (frontier_.nextIndex >= MAX_LEAVES)
        return ripple::Unexpected(ShieldedResult::treeFull);

    auto const index = IncrementalAccumulator::advance(frontier_, commitment);
    leaves_.push_back(commitment);
    if (!base_.roots.contains(frontier_.root))
        roots_.insert(frontier_.root);
    return index;
}

bool
LedgerSandbox::isKnownRoot(uint256 const& root) const
{
    return roots_.count(root) != 0 || base_.roots.contains(root);
}

bool
LedgerSandbox::nullifierUsed(uint256 const& nullifier) const
{
    return nullifiers_.count(nullifier) != 0 || base_.nullifiers.contains(nullifier);
}

bool
LedgerSandbox::consumeNullifier(uint256 const& nullifier)
{
    if (base_.nullifiers.contains(nullifier))
        return false;
    return nullifiers_.insert(nullifier).second;
}

void
LedgerSandbox::putMetadata(uint256 const& commitment, ripple::Blob metadata)
{
    metadata_[commitment] = std::move(metadata);
}

bool
LedgerSandbox::addDeposit(std::uint64_t amount)
{
    if (amount > std::numeric_limits<std::uint64_t>::max() - totalDeposited_)
        return false;
    totalDeposited_ += amount;
    return true;
}

bool
LedgerSandbox::subtractWithdrawal(std::uint64_t amount)
{
    if (amount > totalDeposited_)
        return false;
    totalDeposited_ -= amount;
    return true;
}

void
LedgerSandbox::apply(LedgerState& state) const
{
    if (&state != &base_)
        throw std::logic_error("Sandbox applied to a state it was not opened on");

    if (!leaves_.empty())
        state.accumulator.extend(frontier_, leaves_);

    for (auto const& root : roots_)
        state.roots.add(root);

    for (auto const& nullifier : nullifiers_)
    {
        if (!state.nullifiers.consume(nullifier))
            throw std::logic_error("Staged nullifier already spent in base state");
    }

    for (auto const& [commitment, blob] : metadata_)
        state.metadata[commitment] = blob;

    state.totalDeposited = totalDeposited_;
}

}  // namespace veil
