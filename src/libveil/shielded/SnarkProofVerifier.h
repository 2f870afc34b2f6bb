#pragma once

#include <libveil/shielded/ProofVerifier.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/base_uint.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <istream>
#include <memory>
#include <string>

namespace veil {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/**
 * Groth16 verifier over alt_bn128.
 *
 * The wrapped circuit exposes two public inputs:
 *   [0] the program verification key, reduced to 253 bits
 *   [1] SHA-256 of the public values, reduced to 253 bits
 * so a proof is bound to one program and one public values buffer.
 */
class SnarkProofVerifier : public ProofVerifier
{
public:
    using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;
    using Proof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

    explicit SnarkProofVerifier(VerificationKey vk);

    /** Reads a key in libsnark's stream format. Throws on failure. */
    static std::unique_ptr<SnarkProofVerifier>
    fromStream(std::istream& in);

    static std::unique_ptr<SnarkProofVerifier>
    fromFile(std::string const& path);

    ripple::Expected<void, std::string>
    verify(
        uint256 const& verificationKey,
        ripple::Slice const& publicValues,
        ripple::Slice const& proof) const override;

    /** The primary input a proof for these values has to satisfy. */
    static libsnark::r1cs_primary_input<FieldT>
    primaryInput(uint256 const& verificationKey, ripple::Slice const& publicValues);

    // Helper functions
    static FieldT uint256ToFieldElement(uint256 const& value);
    static ripple::Blob serializeProof(Proof const& proof);
    static Proof deserializeProof(ripple::Slice const& data);

    /** Curve parameters are process wide; safe to call repeatedly. */
    static void initializeCurve();

private:
    VerificationKey vk_;
};

}  // namespace veil
