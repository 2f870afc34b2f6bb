#include <libveil/shielded/LedgerConfig.h>

#include <xrpl/beast/unit_test.h>
#include <xrpl/protocol/UintTypes.h>

#include <stdexcept>
#include <string>

namespace veil {

class LedgerConfig_test : public beast::unit_test::suite
{
    static std::string const vkeyHex;

    template <class F>
    void
    expectRuntimeError(F&& f, std::string const& what)
    {
        try
        {
            f();
            fail(what);
        }
        catch (std::runtime_error const&)
        {
            pass();
        }
    }

public:
    void
    run() override
    {
        testFull();
        testDefaults();
        testInvalid();
    }

    void
    testFull()
    {
        testcase("Full section");

        LedgerConfig config;
        config.loadFromString(
            "# pool settings\n"
            "[server]\n"
            "port=51235\n"
            "\n"
            "[shielded]\n"
            "asset = USD\n"
            "program_vkey=0x" + vkeyHex + "\n"
            "secp256r1=1   # P-256 wallets\n"
            "database_path=/var/lib/veil/ledger.bin\n");

        auto const rules = config.rules();
        BEAST_EXPECT(rules.asset == ripple::to_currency("USD"));

        uint256 expected;
        BEAST_EXPECT(expected.parseHex(vkeyHex));
        BEAST_EXPECT(rules.programVKey == expected);

        BEAST_EXPECT(config.secp256r1Enabled());
        BEAST_EXPECT(config.makeKeyTypes().supports(CipherKeyType::secp256r1));
        BEAST_EXPECT(config.databasePath() == std::string("/var/lib/veil/ledger.bin"));
        BEAST_EXPECT(!config.snarkVerificationKeyFile());
        BEAST_EXPECT(config.makeVerifier() == nullptr);

        // Other sections are loaded but not interpreted
        BEAST_EXPECT(config.exists("server"));
    }

    void
    testDefaults()
    {
        testcase("Optional keys");

        LedgerConfig config;
        config.loadFromString("[shielded]\nasset=EUR\n");

        auto const rules = config.rules();
        BEAST_EXPECT(rules.asset == ripple::to_currency("EUR"));
        BEAST_EXPECT(rules.programVKey == beast::zero);
        BEAST_EXPECT(!config.secp256r1Enabled());
        BEAST_EXPECT(!config.makeKeyTypes().supports(CipherKeyType::secp256r1));
        BEAST_EXPECT(config.makeKeyTypes().supports(CipherKeyType::secp256k1));
        BEAST_EXPECT(!config.databasePath());
    }

    void
    testInvalid()
    {
        testcase("Invalid values");

        {
            LedgerConfig config;
            config.loadFromString("[shielded]\nprogram_vkey=" + vkeyHex + "\n");
            expectRuntimeError([&] { config.rules(); }, "missing asset accepted");
        }
        {
            LedgerConfig config;
            config.loadFromString("[shielded]\nasset=USD\nprogram_vkey=1234\n");
            expectRuntimeError([&] { config.rules(); }, "short program_vkey accepted");
        }
        {
            LedgerConfig config;
            config.loadFromString("[shielded]\nasset=USD\nsecp256r1=yes\n");
            expectRuntimeError([&] { config.secp256r1Enabled(); }, "bad secp256r1 accepted");
        }
        {
            LedgerConfig config;
            config.loadFromString("[shielded]\nasset=USD\nsnark_vk_file=/nonexistent/veil.vk\n");
            expectRuntimeError([&] { config.makeVerifier(); }, "missing key file accepted");
        }
        {
            LedgerConfig config;
            expectRuntimeError(
                [&] { config.loadFromFile("/nonexistent/veil.cfg"); }, "missing config accepted");
        }
    }
};

std::string const LedgerConfig_test::vkeyHex =
    "00A1B2C3D4E5F60718293A4B5C6D7E8F90A1B2C3D4E5F60718293A4B5C6D7E8F";

BEAST_DEFINE_TESTSUITE(LedgerConfig, shielded, veil);

}  // namespace veil
