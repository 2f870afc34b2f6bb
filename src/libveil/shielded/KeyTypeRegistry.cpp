#include <libveil/shielded/KeyTypeRegistry.h>

#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <stdexcept>
#include <utility>

namespace veil {

Secp256r1Capability::Secp256r1Capability()
{
    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1);
    if (!group)
        throw std::runtime_error("Unable to load the P-256 curve");
    EC_GROUP_free(group);
}

KeyTypeRegistry::KeyTypeRegistry()
{
    install(CipherKeyType::secp256k1, std::make_unique<Secp256k1Capability>());
}

void
KeyTypeRegistry::install(
    CipherKeyType type,
    std::unique_ptr<KeyCapability> capability)
{
    if (!capability)
        throw std::invalid_argument("Key capability must not be null");
    table_[type] = std::move(capability);
}

bool
KeyTypeRegistry::supports(CipherKeyType type) const
{
    return table_.find(type) != table_.end();
}

ShieldedResult
KeyTypeRegistry::check(std::uint8_t keyType) const
{
    auto const type = toCipherKeyType(keyType);
    if (!type)
        return ShieldedResult::unsupportedKeyType;

    auto const it = table_.find(*type);
    if (it == table_.end())
        return ShieldedResult::keyTypeUnavailable;

    return ShieldedResult::success;
}

KeyTypeRegistry
KeyTypeRegistry::standard(bool enableSecp256r1)
{
    KeyTypeRegistry registry;
    if (enableSecp256r1)
        registry.install(
            CipherKeyType::secp256r1, std::make_unique<Secp256r1Capability>());
    return registry;
}

}  // namespace veil
