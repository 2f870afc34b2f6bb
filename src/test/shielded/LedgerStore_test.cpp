#include <test/shielded/ShieldedEnv.h>

#include <libveil/shielded/LedgerStore.h>

#include <xrpl/beast/unit_test.h>
#include <xrpl/beast/utility/temp_dir.h>

#include <fstream>
#include <stdexcept>

namespace veil {
namespace test {

class LedgerStore_test : public beast::unit_test::suite
{
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
        testMissing();
        testSaveLoad();
        testCorrupt();
        testInconsistent();
    }

    void
    testMissing()
    {
        testcase("No saved state");

        beast::temp_dir dir;
        LedgerStore store(dir.file("ledger.bin"), nullJournal());
        BEAST_EXPECT(!store.load());
    }

    void
    testSaveLoad()
    {
        testcase("Save and load");

        beast::temp_dir dir;
        LedgerStore store(dir.file("ledger.bin"), nullJournal());

        uint256 earlyRoot;
        {
            ShieldedEnv env;
            BEAST_EXPECT(env.deposit(tag("a"), 400));
            earlyRoot = env.machine.currentRoot();
            BEAST_EXPECT(env.machine.deposit(
                env.alice, tag("b"), ShieldedEnv::note(tag("b"), ripple::Blob(10, 7)), 100));
            BEAST_EXPECT(
                env.transfer(earlyRoot, {tag("n1")}, {tag("o1")}) == ShieldedResult::success);

            store.save(env.machine.state());

            // Saving again replaces the file
            BEAST_EXPECT(env.withdraw(50, earlyRoot, {tag("n2")}) == ShieldedResult::success);
            store.save(env.machine.state());
        }

        auto loaded = store.load();
        BEAST_EXPECT(loaded);
        if (!loaded)
            return;

        BEAST_EXPECT(loaded->accumulator.nextIndex() == 3);
        BEAST_EXPECT(loaded->totalDeposited == 450);
        BEAST_EXPECT(loaded->nullifiers.contains(tag("n1")));
        BEAST_EXPECT(loaded->nullifiers.contains(tag("n2")));
        BEAST_EXPECT(loaded->roots.contains(earlyRoot));
        BEAST_EXPECT(loaded->metadata.at(tag("b")) == ripple::Blob(10, 7));

        // A pool resumed from disk keeps admitting old roots and rejecting
        // spent nullifiers
        ShieldedEnv resumed(std::make_unique<BindingVerifier>(), false, std::move(*loaded));
        BEAST_EXPECT(resumed.machine.totalDeposited() == 450);
        BEAST_EXPECT(
            resumed.transfer(earlyRoot, {tag("n1")}, {tag("x")}) ==
            ShieldedResult::nullifierAlreadyUsed);
        BEAST_EXPECT(
            resumed.transfer(earlyRoot, {tag("n3")}, {tag("x")}) == ShieldedResult::success);
        BEAST_EXPECT(resumed.machine.nextLeafIndex() == 4);
    }

    void
    testCorrupt()
    {
        testcase("Corrupt file");

        ShieldedEnv env;
        BEAST_EXPECT(env.deposit(tag("a"), 1));
        auto const good = LedgerStore::encode(env.machine.state());

        {
            auto blob = good;
            blob[0] ^= 0xFF;
            expectRuntimeError(
                [&] { LedgerStore::decode(ripple::makeSlice(blob)); }, "bad magic accepted");
        }
        {
            auto blob = good;
            blob[7] = 9;
            expectRuntimeError(
                [&] { LedgerStore::decode(ripple::makeSlice(blob)); }, "unknown version accepted");
        }
        {
            auto blob = good;
            blob.resize(blob.size() - 4);
            expectRuntimeError(
                [&] { LedgerStore::decode(ripple::makeSlice(blob)); }, "truncated state accepted");
        }
        {
            auto blob = good;
            blob.push_back(0);
            expectRuntimeError(
                [&] { LedgerStore::decode(ripple::makeSlice(blob)); }, "trailing bytes accepted");
        }

        beast::temp_dir dir;
        auto const path = dir.file("ledger.bin");
        {
            std::ofstream file(path, std::ios::binary);
            file << "not a ledger";
        }
        LedgerStore store(path, nullJournal());
        expectRuntimeError([&] { store.load(); }, "garbage file loaded");
    }

    void
    testInconsistent()
    {
        testcase("Inconsistent state");

        // Leaves whose root was never recorded
        LedgerState state;
        state.accumulator.insert(tag("orphan"));

        auto const blob = LedgerStore::encode(state);
        expectRuntimeError(
            [&] { LedgerStore::decode(ripple::makeSlice(blob)); }, "orphan root accepted");
    }
};

BEAST_DEFINE_TESTSUITE(LedgerStore, shielded, veil);

}  // namespace test
}  // namespace veil
