#ifndef VEIL_SHIELDED_SHIELDEDRESULT_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDRESULT_H_INCLUDED

#include <ostream>
#include <string>

namespace veil {

/**
 * Outcome of a shielded ledger operation.
 *
 * Every code other than success is fatal to the call: nothing the call
 * staged is applied, and the caller has to resubmit a corrected
 * transaction.
 */
enum class ShieldedResult : int {
    success = 0,

    // Malformed call, detected without looking at ledger state
    invalidAmount,
    commitmentMismatch,
    ciphertextCountMismatch,
    unsupportedKeyType,
    keyTypeUnavailable,
    metadataTooLarge,
    invalidApproval,
    zeroCommitment,

    // Proof and admission
    verifierUnconfigured,
    proofInvalid,
    malformedPublicValues,
    invalidOldRoot,
    nullifierAlreadyUsed,
    emptyOutputs,

    // Ledger resources
    insufficientBalance,
    assetTransferFailed,
    treeFull,
};

inline bool
isSuccess(ShieldedResult r)
{
    return r == ShieldedResult::success;
}

/** Short symbolic name, e.g. "NullifierAlreadyUsed". */
std::string
transToken(ShieldedResult r);

/** Human readable description. */
std::string
transHuman(ShieldedResult r);

std::ostream&
operator<<(std::ostream& os, ShieldedResult r);

}  // namespace veil

#endif
