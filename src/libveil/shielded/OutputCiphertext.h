#ifndef VEIL_SHIELDED_OUTPUTCIPHERTEXT_H_INCLUDED
#define VEIL_SHIELDED_OUTPUTCIPHERTEXT_H_INCLUDED

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/base_uint.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace veil {

using ripple::uint256;

/** Curve of the ephemeral key a note was encrypted to. Wire values. */
enum class CipherKeyType : std::uint8_t {
    secp256k1 = 0,
    secp256r1 = 1,
};

std::optional<CipherKeyType>
toCipherKeyType(std::uint8_t value);

char const*
to_string(CipherKeyType type);

/** Metadata payloads must be strictly smaller than this. */
constexpr std::size_t MAX_METADATA_SIZE = 100000;

constexpr std::size_t CIPHER_NONCE_SIZE = 12;

/**
 * Encrypted note for one output commitment.
 *
 * The ledger never decrypts it. It checks that the declared commitment is
 * the committed output, that the key type is usable, and the metadata size,
 * then republishes the rest for recipients scanning the ledger.
 */
struct OutputCiphertext
{
    uint256 commitment;
    std::uint8_t keyType = static_cast<std::uint8_t>(CipherKeyType::secp256k1);
    ripple::Blob ephemeralKey;
    std::array<std::uint8_t, CIPHER_NONCE_SIZE> nonce{};
    ripple::Blob ciphertext;

    // Optional application payload stored against the commitment; empty
    // when absent
    ripple::Blob metadata;
};

}  // namespace veil

#endif
