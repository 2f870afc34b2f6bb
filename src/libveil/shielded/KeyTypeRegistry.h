#ifndef VEIL_SHIELDED_KEYTYPEREGISTRY_H_INCLUDED
#define VEIL_SHIELDED_KEYTYPEREGISTRY_H_INCLUDED

#include <libveil/shielded/OutputCiphertext.h>
#include <libveil/shielded/ShieldedResult.h>

#include <cstdint>
#include <map>
#include <memory>

namespace veil {

/**
 * Marks a key type as usable for note encryption. The core treats the
 * ephemeral key bytes as opaque; a capability only has to exist.
 */
class KeyCapability
{
public:
    virtual ~KeyCapability() = default;

    virtual char const*
    name() const = 0;
};

class Secp256k1Capability final : public KeyCapability
{
public:
    char const*
    name() const override
    {
        return "secp256k1";
    }
};

/** NIST P-256. Construction fails if OpenSSL cannot load the curve. */
class Secp256r1Capability final : public KeyCapability
{
public:
    Secp256r1Capability();

    char const*
    name() const override
    {
        return "secp256r1";
    }
};

/**
 * Key type dispatch table.
 *
 * secp256k1 is always installed. Other types are usable only when their
 * capability has been installed; a known type without a capability is
 * keyTypeUnavailable, an unknown wire value is unsupportedKeyType.
 */
class KeyTypeRegistry
{
public:
    KeyTypeRegistry();

    void
    install(CipherKeyType type, std::unique_ptr<KeyCapability> capability);

    bool
    supports(CipherKeyType type) const;

    ShieldedResult
    check(std::uint8_t keyType) const;

    /** secp256k1, plus secp256r1 when enabled. */
    static KeyTypeRegistry
    standard(bool enableSecp256r1);

private:
    std::map<CipherKeyType, std::unique_ptr<KeyCapability>> table_;
};

}  // namespace veil

#endif
