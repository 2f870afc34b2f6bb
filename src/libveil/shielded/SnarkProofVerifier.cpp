#include <libveil/shielded/Hash.h>
#include <libveil/shielded/SnarkProofVerifier.h>

#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace veil {

void SnarkProofVerifier::initializeCurve() {
    static std::once_flag once;
    std::call_once(once, [] { DefaultCurve::init_public_params(); });
}

SnarkProofVerifier::SnarkProofVerifier(VerificationKey vk)
    : vk_(std::move(vk)) {
    initializeCurve();
}

std::unique_ptr<SnarkProofVerifier> SnarkProofVerifier::fromStream(std::istream& in) {
    initializeCurve();

    VerificationKey vk;
    in >> vk;
    if (!in) {
        throw std::runtime_error("Unable to read Groth16 verification key");
    }
    return std::make_unique<SnarkProofVerifier>(std::move(vk));
}

std::unique_ptr<SnarkProofVerifier> SnarkProofVerifier::fromFile(std::string const& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        throw std::runtime_error("Unable to open verification key file: " + path);
    }
    return fromStream(file);
}

FieldT SnarkProofVerifier::uint256ToFieldElement(uint256 const& value) {
    // Big endian bytes, top three bits cleared so the value is below the
    // 254-bit scalar field modulus
    libff::bigint<FieldT::num_limbs> bigint;
    unsigned char const* bytes = value.data();

    const size_t LIMB_SIZE = sizeof(bigint.data[0]);
    for (size_t limb_idx = 0; limb_idx < FieldT::num_limbs && limb_idx * LIMB_SIZE < 32; ++limb_idx) {
        mp_limb_t limb = 0;
        for (size_t byte_idx = 0; byte_idx < LIMB_SIZE; ++byte_idx) {
            size_t const pos = 31 - (limb_idx * LIMB_SIZE + byte_idx);
            unsigned char b = bytes[pos];
            if (pos == 0) {
                b &= 0x1f;
            }
            limb |= static_cast<mp_limb_t>(b) << (byte_idx * 8);
        }
        bigint.data[limb_idx] = limb;
    }

    return FieldT(bigint);
}

libsnark::r1cs_primary_input<FieldT> SnarkProofVerifier::primaryInput(
    uint256 const& verificationKey,
    ripple::Slice const& publicValues) {
    libsnark::r1cs_primary_input<FieldT> input;
    input.push_back(uint256ToFieldElement(verificationKey));
    input.push_back(uint256ToFieldElement(sha256Digest(publicValues)));
    return input;
}

ripple::Blob SnarkProofVerifier::serializeProof(Proof const& proof) {
    std::ostringstream oss;
    oss << proof;

    std::string const str = oss.str();
    return ripple::Blob(str.begin(), str.end());
}

SnarkProofVerifier::Proof SnarkProofVerifier::deserializeProof(ripple::Slice const& data) {
    std::istringstream iss(std::string(reinterpret_cast<char const*>(data.data()), data.size()));

    Proof proof;
    iss >> proof;
    if (iss.fail()) {
        throw std::runtime_error("Truncated Groth16 proof");
    }
    return proof;
}

ripple::Expected<void, std::string> SnarkProofVerifier::verify(
    uint256 const& verificationKey,
    ripple::Slice const& publicValues,
    ripple::Slice const& proof) const {
    if (proof.empty()) {
        return ripple::Unexpected(std::string("empty proof"));
    }

    try {
        auto const decoded = deserializeProof(proof);
        if (!decoded.is_well_formed()) {
            return ripple::Unexpected(std::string("proof points are not well formed"));
        }

        if (!libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
                vk_, primaryInput(verificationKey, publicValues), decoded)) {
            return ripple::Unexpected(std::string("pairing check failed"));
        }
    } catch (std::exception const& e) {
        return ripple::Unexpected(std::string("malformed proof: ") + e.what());
    }

    return {};
}

}  // namespace veil
