#include <libveil/shielded/ShieldedResult.h>

#include <unordered_map>
#include <utility>

namespace veil {

namespace {

using ResultInfo = std::pair<char const*, char const*>;

std::unordered_map<int, ResultInfo> const&
resultInfo()
{
    // clang-format off
    static std::unordered_map<int, ResultInfo> const results
    {
#define MAKE_ERROR(code, token, desc) { static_cast<int>(ShieldedResult::code), { token, desc } }
        MAKE_ERROR(success,                 "Success",                 "The operation was applied."),
        MAKE_ERROR(invalidAmount,           "InvalidAmount",           "Amount must be greater than zero."),
        MAKE_ERROR(commitmentMismatch,      "CommitmentMismatch",      "Ciphertext commitment differs from the committed output."),
        MAKE_ERROR(ciphertextCountMismatch, "CiphertextCountMismatch", "Number of encrypted outputs differs from the proved outputs."),
        MAKE_ERROR(unsupportedKeyType,      "UnsupportedKeyType",      "Unknown ephemeral key type."),
        MAKE_ERROR(metadataTooLarge,        "MetadataTooLarge",        "Metadata payload exceeds the size limit."),
        MAKE_ERROR(invalidApproval,         "InvalidApproval",         "Delegated approval does not cover the asset or amount."),
        MAKE_ERROR(zeroCommitment,          "ZeroCommitment",          "Deposit commitment must not be zero."),
        MAKE_ERROR(verifierUnconfigured,    "VerifierUnconfigured",    "No proof verifier is installed."),
        MAKE_ERROR(proofInvalid,            "ProofInvalid",            "The proof does not verify against the public values."),
        MAKE_ERROR(malformedPublicValues,   "MalformedPublicValues",   "The public values do not decode to public outputs."),
        MAKE_ERROR(invalidOldRoot,          "InvalidOldRoot",          "The proof's root was never an accumulator root."),
        MAKE_ERROR(nullifierAlreadyUsed,    "NullifierAlreadyUsed",    "A nullifier was already spent."),
        MAKE_ERROR(keyTypeUnavailable,      "KeyTypeUnavailable",      "The key type requires a capability that is not configured."),
        MAKE_ERROR(emptyOutputs,            "EmptyOutputs",            "The proof commits to no outputs."),
        MAKE_ERROR(insufficientBalance,     "InsufficientBalance",     "Withdrawal exceeds the custodied balance."),
        MAKE_ERROR(assetTransferFailed,     "AssetTransferFailed",     "The custodian refused the asset transfer."),
        MAKE_ERROR(treeFull,                "TreeFull",                "The commitment accumulator is full."),
#undef MAKE_ERROR
    };
    // clang-format on
    return results;
}

}  // namespace

std::string
transToken(ShieldedResult r)
{
    auto const& results = resultInfo();
    if (auto const it = results.find(static_cast<int>(r)); it != results.end())
        return it->second.first;
    return "-";
}

std::string
transHuman(ShieldedResult r)
{
    auto const& results = resultInfo();
    if (auto const it = results.find(static_cast<int>(r)); it != results.end())
        return it->second.second;
    return "-";
}

std::ostream&
operator<<(std::ostream& os, ShieldedResult r)
{
    return os << transToken(r);
}

}  // namespace veil
