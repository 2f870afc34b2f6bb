#include <libveil/shielded/LedgerConfig.h>
#include <libveil/shielded/SnarkProofVerifier.h>

#include <xrpl/protocol/UintTypes.h>

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace veil {

char const* const LedgerConfig::sectionName = "shielded";

void
LedgerConfig::loadFromString(std::string const& text)
{
    ripple::IniFileSections sections;
    std::string current;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        if (auto const hash = line.find('#'); hash != std::string::npos)
            line.erase(hash);
        boost::algorithm::trim(line);

        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            current = line.substr(1, line.size() - 2);
            boost::algorithm::trim(current);
            sections[current];
            continue;
        }

        if (!current.empty())
            sections[current].push_back(line);
    }

    build(sections);
}

void
LedgerConfig::loadFromFile(std::string const& path)
{
    std::ifstream file(path);
    if (!file.good())
        throw std::runtime_error("Unable to open config file: " + path);

    std::ostringstream text;
    text << file.rdbuf();
    loadFromString(text.str());
}

LedgerRules
LedgerConfig::rules() const
{
    LedgerRules rules;

    auto const asset = shielded().get<std::string>("asset");
    if (!asset)
        throw std::runtime_error("[shielded] asset is required");
    if (!ripple::to_currency(rules.asset, *asset) || rules.asset == ripple::badCurrency())
        throw std::runtime_error("[shielded] asset is not a currency code: " + *asset);

    if (auto const vkey = shielded().get<std::string>("program_vkey"))
    {
        std::string hex = *vkey;
        if (boost::algorithm::starts_with(hex, "0x"))
            hex.erase(0, 2);
        if (!rules.programVKey.parseHex(hex))
            throw std::runtime_error("[shielded] program_vkey must be 64 hex digits");
    }

    return rules;
}

bool
LedgerConfig::secp256r1Enabled() const
{
    auto const value = shielded().get<std::string>("secp256r1");
    if (!value || *value == "0")
        return false;
    if (*value == "1")
        return true;
    throw std::runtime_error("[shielded] secp256r1 must be 0 or 1");
}

std::optional<std::string>
LedgerConfig::snarkVerificationKeyFile() const
{
    auto value = shielded().get<std::string>("snark_vk_file");
    if (value && value->empty())
        throw std::runtime_error("[shielded] snark_vk_file is empty");
    return value;
}

std::optional<std::string>
LedgerConfig::databasePath() const
{
    auto value = shielded().get<std::string>("database_path");
    if (value && value->empty())
        throw std::runtime_error("[shielded] database_path is empty");
    return value;
}

std::unique_ptr<ProofVerifier>
LedgerConfig::makeVerifier() const
{
    auto const path = snarkVerificationKeyFile();
    if (!path)
        return nullptr;
    return SnarkProofVerifier::fromFile(*path);
}

KeyTypeRegistry
LedgerConfig::makeKeyTypes() const
{
    return KeyTypeRegistry::standard(secp256r1Enabled());
}

}  // namespace veil
