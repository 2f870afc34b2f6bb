#include <libveil/shielded/ShieldedTransactor.h>

#include <xrpl/basics/Log.h>

namespace veil {

ShieldedTransactor::ShieldedTransactor(ApplyContext& ctx) : ctx_(ctx), j_(ctx.journal)
{
}

ShieldedResult
ShieldedTransactor::operator()()
{
    auto const rootBefore = view().currentRoot();
    auto const leavesBefore = view().stagedLeafCount();

    auto const result = doApply();
    if (!isSuccess(result))
    {
        JLOG(j_.debug()) << "Call reverted: " << transToken(result);
        return result;
    }

    if (view().stagedLeafCount() != leavesBefore)
        ctx_.deliver(RootUpdated{rootBefore, view().currentRoot()});

    return result;
}

ripple::Expected<PublicOutputs, ShieldedResult>
ShieldedTransactor::verifyAndDecode(ripple::Slice const& proof, ripple::Slice const& publicValues)
{
    if (ctx_.verifier == nullptr)
    {
        JLOG(j_.error()) << "No proof verifier configured";
        return ripple::Unexpected(ShieldedResult::verifierUnconfigured);
    }

    if (auto const verified = ctx_.verifier->verify(ctx_.rules.programVKey, publicValues, proof);
        !verified)
    {
        JLOG(j_.warn()) << "Proof rejected: " << verified.error();
        return ripple::Unexpected(ShieldedResult::proofInvalid);
    }

    auto outputs = PublicOutputs::decode(publicValues);
    if (!outputs)
    {
        JLOG(j_.warn()) << "Verified public values do not decode (" << publicValues.size()
                        << " bytes)";
        return ripple::Unexpected(ShieldedResult::malformedPublicValues);
    }

    JLOG(j_.trace()) << "Proof against root " << outputs->oldRoot << " spends "
                     << outputs->nullifiers.size() << " notes, creates "
                     << outputs->outputCommitments.size();
    return std::move(*outputs);
}

ShieldedResult
ShieldedTransactor::admitRoot(uint256 const& oldRoot)
{
    if (!view().isKnownRoot(oldRoot))
    {
        JLOG(j_.warn()) << "Unknown root " << oldRoot;
        return ShieldedResult::invalidOldRoot;
    }
    return ShieldedResult::success;
}

ShieldedResult
ShieldedTransactor::consumeNullifiers(std::vector<uint256> const& nullifiers)
{
    for (auto const& nullifier : nullifiers)
    {
        if (!view().consumeNullifier(nullifier))
        {
            JLOG(j_.warn()) << "Double spend of nullifier " << nullifier;
            return ShieldedResult::nullifierAlreadyUsed;
        }
    }
    return ShieldedResult::success;
}

ShieldedResult
ShieldedTransactor::checkOutput(OutputCiphertext const& output, uint256 const& committed) const
{
    if (output.commitment != committed)
    {
        JLOG(j_.warn()) << "Ciphertext for " << output.commitment
                        << " does not match proved commitment " << committed;
        return ShieldedResult::commitmentMismatch;
    }

    if (auto const ter = ctx_.keyTypes.check(output.keyType); !isSuccess(ter))
    {
        JLOG(j_.debug()) << "Output " << committed << " key type " << unsigned(output.keyType)
                         << ": " << transToken(ter);
        return ter;
    }

    if (!metadataFits(output))
    {
        JLOG(j_.debug()) << "Output " << committed << " metadata is " << output.metadata.size()
                         << " bytes";
        return ShieldedResult::metadataTooLarge;
    }

    return ShieldedResult::success;
}

ripple::Expected<std::uint64_t, ShieldedResult>
ShieldedTransactor::insertOutput(OutputCiphertext const& output)
{
    auto const index = view().insertCommitment(output.commitment);
    if (!index)
    {
        JLOG(j_.error()) << "Accumulator full";
        return index;
    }

    ctx_.deliver(OutputCommitted{
        output.commitment,
        output.keyType,
        output.ephemeralKey,
        output.nonce,
        output.ciphertext,
        *index});

    if (!output.metadata.empty())
    {
        view().putMetadata(output.commitment, output.metadata);
        ctx_.deliver(MetadataPosted{output.commitment, output.metadata.size()});
    }

    JLOG(j_.trace()) << "Output " << output.commitment << " at leaf " << *index;
    return index;
}

ShieldedResult
ShieldedTransactor::insertOutputs(
    std::vector<OutputCiphertext> const& outputs,
    std::vector<uint256> const& committed)
{
    if (outputs.size() != committed.size())
    {
        JLOG(j_.warn()) << outputs.size() << " ciphertexts for " << committed.size()
                        << " proved outputs";
        return ShieldedResult::ciphertextCountMismatch;
    }

    for (std::size_t i = 0; i < outputs.size(); ++i)
    {
        if (auto const ter = checkOutput(outputs[i], committed[i]); !isSuccess(ter))
            return ter;

        if (auto const index = insertOutput(outputs[i]); !index)
            return index.error();
    }

    return ShieldedResult::success;
}

}  // namespace veil
