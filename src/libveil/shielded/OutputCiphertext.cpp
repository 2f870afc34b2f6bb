#include <libveil/shielded/OutputCiphertext.h>

namespace veil {

std::optional<CipherKeyType>
toCipherKeyType(std::uint8_t value)
{
    switch (value)
    {
        case static_cast<std::uint8_t>(CipherKeyType::secp256k1):
            return CipherKeyType::secp256k1;
        case static_cast<std::uint8_t>(CipherKeyType::secp256r1):
            return CipherKeyType::secp256r1;
        default:
            return std::nullopt;
    }
}

char const*
to_string(CipherKeyType type)
{
    switch (type)
    {
        case CipherKeyType::secp256k1:
            return "secp256k1";
        case CipherKeyType::secp256r1:
            return "secp256r1";
    }
    return "unknown";
}

}  // namespace veil
