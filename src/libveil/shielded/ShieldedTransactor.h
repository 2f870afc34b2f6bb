#ifndef VEIL_SHIELDED_SHIELDEDTRANSACTOR_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDTRANSACTOR_H_INCLUDED

#include <libveil/shielded/ApplyContext.h>
#include <libveil/shielded/OutputCiphertext.h>
#include <libveil/shielded/PublicOutputs.h>
#include <libveil/shielded/ShieldedResult.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <vector>

namespace veil {

/**
 * Base of the shielded operations.
 *
 * A call runs in two phases:
 *   preflight   static, per operation; checks that need no ledger state
 *   doApply     writes to the sandbox of the ApplyContext
 *
 * operator() runs doApply and, when it succeeded and inserted leaves,
 * adds the single RootUpdated notification of the call. The caller
 * commits the sandbox only on success.
 */
class ShieldedTransactor
{
public:
    virtual ~ShieldedTransactor() = default;

    ShieldedTransactor(ShieldedTransactor const&) = delete;
    ShieldedTransactor&
    operator=(ShieldedTransactor const&) = delete;

    ShieldedResult
    operator()();

protected:
    explicit ShieldedTransactor(ApplyContext& ctx);

    virtual ShieldedResult
    doApply() = 0;

    LedgerSandbox&
    view()
    {
        return ctx_.view();
    }

    /** Checks the proof, then decodes the values it proved. */
    ripple::Expected<PublicOutputs, ShieldedResult>
    verifyAndDecode(ripple::Slice const& proof, ripple::Slice const& publicValues);

    /** The proof must be against some root this ledger has produced. */
    ShieldedResult
    admitRoot(uint256 const& oldRoot);

    /** Spends each nullifier in order; stops at the first reused one. */
    ShieldedResult
    consumeNullifiers(std::vector<uint256> const& nullifiers);

    /** Commitment, key type and metadata checks for one output. */
    ShieldedResult
    checkOutput(OutputCiphertext const& output, uint256 const& committed) const;

    /** Inserts one checked output and stages its notifications. */
    ripple::Expected<std::uint64_t, ShieldedResult>
    insertOutput(OutputCiphertext const& output);

    /**
     * Binds the ciphertexts to the proved commitments one to one, then
     * inserts them in order.
     */
    ShieldedResult
    insertOutputs(
        std::vector<OutputCiphertext> const& outputs,
        std::vector<uint256> const& committed);

    /** Size rule shared by every operation that carries metadata. */
    static bool
    metadataFits(OutputCiphertext const& output)
    {
        return output.metadata.size() < MAX_METADATA_SIZE;
    }

    ApplyContext& ctx_;
    beast::Journal const j_;
};

}  // namespace veil

#endif
