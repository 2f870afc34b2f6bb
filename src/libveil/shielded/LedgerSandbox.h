#ifndef VEIL_SHIELDED_LEDGERSANDBOX_H_INCLUDED
#define VEIL_SHIELDED_LEDGERSANDBOX_H_INCLUDED

#include <libveil/shielded/LedgerState.h>
#include <libveil/shielded/ShieldedResult.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Expected.h>

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace veil {

/**
 * Staging buffer for one call.
 *
 * Reads fall through to the committed LedgerState, writes stay here until
 * apply(). Dropping a sandbox discards everything it staged, which is how
 * a failed call leaves no trace. The base state must not change while a
 * sandbox over it is alive.
 */
class LedgerSandbox
{
public:
    explicit LedgerSandbox(LedgerState const& base);

    LedgerSandbox(LedgerSandbox const&) = delete;
    LedgerSandbox&
    operator=(LedgerSandbox const&) = delete;

    /** Appends a leaf and records the resulting root. */
    ripple::Expected<std::uint64_t, ShieldedResult>
    insertCommitment(uint256 const& commitment);

    uint256 const&
    currentRoot() const
    {
        return frontier_.root;
    }

    std::uint64_t
    nextIndex() const
    {
        return frontier_.nextIndex;
    }

    std::size_t
    stagedLeafCount() const
    {
        return leaves_.size();
    }

    bool
    isKnownRoot(uint256 const& root) const;

    bool
    nullifierUsed(uint256 const& nullifier) const;

    /** Marks a nullifier spent. False if it already was, here or in the base. */
    [[nodiscard]] bool
    consumeNullifier(uint256 const& nullifier);

    void
    putMetadata(uint256 const& commitment, ripple::Blob metadata);

    std::uint64_t
    totalDeposited() const
    {
        return totalDeposited_;
    }

    /** False on overflow. */
    [[nodiscard]] bool
    addDeposit(std::uint64_t amount);

    /** False if the pool holds less than amount. */
    [[nodiscard]] bool
    subtractWithdrawal(std::uint64_t amount);

    /** Commits every staged change to state, which must be the base. */
    void
    apply(LedgerState& state) const;

private:
    LedgerState const& base_;

    AccumulatorFrontier frontier_;
    std::vector<uint256> leaves_;
    std::set<uint256> roots_;
    std::set<uint256> nullifiers_;
    std::map<uint256, ripple::Blob> metadata_;
    std::uint64_t totalDeposited_;
};

}  // namespace veil

#endif
