#ifndef VEIL_SHIELDED_LEDGERCONFIG_H_INCLUDED
#define VEIL_SHIELDED_LEDGERCONFIG_H_INCLUDED

#include <libveil/shielded/ApplyContext.h>
#include <libveil/shielded/KeyTypeRegistry.h>
#include <libveil/shielded/ProofVerifier.h>

#include <xrpl/basics/BasicConfig.h>

#include <memory>
#include <optional>
#include <string>

namespace veil {

/**
 * Pool configuration, read from the [shielded] section of an ini file:
 *
 *   [shielded]
 *   asset=USD
 *   program_vkey=<64 hex digits>
 *   snark_vk_file=/etc/veil/transfer.vk
 *   secp256r1=1
 *   database_path=/var/lib/veil/ledger.bin
 *
 * Accessors throw std::runtime_error naming the offending key.
 */
class LedgerConfig : public ripple::BasicConfig
{
public:
    static char const* const sectionName;

    /** Parses ini text. Lines outside any section are ignored. */
    void
    loadFromString(std::string const& text);

    void
    loadFromFile(std::string const& path);

    ripple::Section const&
    shielded() const
    {
        return section(sectionName);
    }

    LedgerRules
    rules() const;

    bool
    secp256r1Enabled() const;

    std::optional<std::string>
    snarkVerificationKeyFile() const;

    std::optional<std::string>
    databasePath() const;

    /** Null when no verification key is configured. */
    std::unique_ptr<ProofVerifier>
    makeVerifier() const;

    KeyTypeRegistry
    makeKeyTypes() const;
};

}  // namespace veil

#endif
