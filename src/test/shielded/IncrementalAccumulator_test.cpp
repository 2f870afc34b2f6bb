#include <libveil/shielded/Hash.h>
#include <libveil/shielded/IncrementalAccumulator.h>
#include <libveil/shielded/ZeroHashTable.h>

#include <xrpl/beast/unit_test.h>
#include <xrpl/protocol/Serializer.h>

#include <stdexcept>
#include <vector>

namespace veil {

class IncrementalAccumulator_test : public beast::unit_test::suite
{
    static uint256
    leafAt(std::uint64_t i)
    {
        return uint256(i + 1);
    }

    // Root of the full tree of height TREE_HEIGHT built level by level from
    // the leaf list, with absent nodes taken from the zero table
    static uint256
    referenceRoot(std::vector<uint256> const& leaves)
    {
        auto const& zeros = zeroHashes();
        if (leaves.empty())
            return zeros.emptyRoot();

        std::vector<uint256> nodes = leaves;
        for (std::size_t level = 0; level < TREE_HEIGHT; ++level)
        {
            std::vector<uint256> next;
            for (std::size_t i = 0; i < nodes.size(); i += 2)
                next.push_back(hashPair(nodes[i], i + 1 < nodes.size() ? nodes[i + 1] : zeros[level]));
            nodes = std::move(next);
        }
        return nodes.front();
    }

public:
    void
    run() override
    {
        testZeroTable();
        testEmpty();
        testSingleLeaf();
        testTwoLeaves();
        testAgainstReference();
        testAuthPaths();
        testFrontierExtend();
        testSerialization();
    }

    void
    testZeroTable()
    {
        testcase("Zero hash table");

        auto const& zeros = zeroHashes();
        BEAST_EXPECT(zeros.size() == TREE_HEIGHT);
        BEAST_EXPECT(zeros[0] == beast::zero);

        uint256 emptyDigest;
        BEAST_EXPECT(emptyDigest.parseHex(
            "C5D2460186F7233C927E7DB2DCC703C0E500B653CA82273B7BFAD8045D85A470"));
        BEAST_EXPECT(keccak256Digest(ripple::Slice{}) == emptyDigest);

        // keccak256(abi.encodePacked(bytes32(0), bytes32(0)))
        uint256 expected;
        BEAST_EXPECT(expected.parseHex(
            "AD3228B676F7D3CD4284A5443F17F1962B36E491B30A40B2405849E597BA5FB5"));
        BEAST_EXPECT(zeros[1] == expected);

        for (std::size_t level = 1; level < TREE_HEIGHT; ++level)
            BEAST_EXPECT(zeros[level] == hashPair(zeros[level - 1], zeros[level - 1]));

        BEAST_EXPECT(zeros.emptyRoot() == zeros[TREE_HEIGHT - 1]);
    }

    void
    testEmpty()
    {
        testcase("Empty accumulator");

        IncrementalAccumulator acc;
        BEAST_EXPECT(acc.empty());
        BEAST_EXPECT(acc.nextIndex() == 0);
        BEAST_EXPECT(acc.root() == zeroHashes()[TREE_HEIGHT - 1]);
        BEAST_EXPECT(acc.root() == referenceRoot({}));
    }

    void
    testSingleLeaf()
    {
        testcase("Single leaf");

        auto const& zeros = zeroHashes();
        uint256 const c = leafAt(0);

        IncrementalAccumulator acc;
        BEAST_EXPECT(acc.insert(c) == 0);
        BEAST_EXPECT(acc.nextIndex() == 1);

        uint256 expected = c;
        for (std::size_t level = 0; level < TREE_HEIGHT; ++level)
            expected = hashPair(expected, zeros[level]);

        BEAST_EXPECT(acc.root() == expected);
        BEAST_EXPECT(acc.frontier().filledSubtrees[0] == c);
    }

    void
    testTwoLeaves()
    {
        testcase("Two leaves");

        auto const& zeros = zeroHashes();
        uint256 const a = leafAt(0);
        uint256 const b = leafAt(1);

        IncrementalAccumulator acc;
        BEAST_EXPECT(acc.insert(a) == 0);
        uint256 const firstRoot = acc.root();
        BEAST_EXPECT(acc.insert(b) == 1);

        uint256 expected = hashPair(a, b);
        for (std::size_t level = 1; level < TREE_HEIGHT; ++level)
            expected = hashPair(expected, zeros[level]);

        BEAST_EXPECT(acc.root() == expected);
        BEAST_EXPECT(acc.root() != firstRoot);
    }

    void
    testAgainstReference()
    {
        testcase("Roots match full tree");

        IncrementalAccumulator acc;
        std::vector<uint256> leaves;
        for (std::uint64_t i = 0; i < 20; ++i)
        {
            leaves.push_back(leafAt(i));
            BEAST_EXPECT(acc.insert(leaves.back()) == i);
            BEAST_EXPECT(acc.root() == referenceRoot(leaves));
        }
        BEAST_EXPECT(acc.nextIndex() == 20);
        BEAST_EXPECT(acc.leaves() == leaves);
    }

    void
    testAuthPaths()
    {
        testcase("Authentication paths");

        IncrementalAccumulator acc;
        for (std::uint64_t i = 0; i < 20; ++i)
            acc.insert(leafAt(i));

        for (std::uint64_t i = 0; i < 20; ++i)
        {
            auto const path = acc.authPath(i);
            BEAST_EXPECT(path.size() == TREE_HEIGHT);
            BEAST_EXPECT(IncrementalAccumulator::verify(leafAt(i), path, i, acc.root()));

            // Wrong position or wrong leaf must not verify
            BEAST_EXPECT(!IncrementalAccumulator::verify(leafAt(i), path, i ^ 1, acc.root()));
            BEAST_EXPECT(!IncrementalAccumulator::verify(leafAt(i + 1), path, i, acc.root()));
        }

        // Neighbouring leaves are each other's first sibling
        auto const path = acc.authPath(19);
        BEAST_EXPECT(path[0] == leafAt(18));

        auto const fresh = acc.authPath(18);
        BEAST_EXPECT(fresh[0] == leafAt(19));

        try
        {
            acc.authPath(20);
            fail("authPath accepted an index past the end");
        }
        catch (std::out_of_range const&)
        {
            pass();
        }

        auto truncated = acc.authPath(3);
        truncated.pop_back();
        BEAST_EXPECT(!IncrementalAccumulator::verify(leafAt(3), truncated, 3, acc.root()));
    }

    void
    testFrontierExtend()
    {
        testcase("Frontier advance and extend");

        IncrementalAccumulator acc;
        acc.insert(leafAt(0));
        acc.insert(leafAt(1));
        acc.insert(leafAt(2));

        AccumulatorFrontier frontier = acc.frontier();
        std::vector<uint256> staged;
        for (std::uint64_t i = 3; i < 7; ++i)
        {
            BEAST_EXPECT(IncrementalAccumulator::advance(frontier, leafAt(i)) == i);
            staged.push_back(leafAt(i));
        }

        // Advancing a copy leaves the accumulator alone
        BEAST_EXPECT(acc.nextIndex() == 3);

        acc.extend(frontier, staged);
        BEAST_EXPECT(acc.nextIndex() == 7);
        BEAST_EXPECT(acc.root() == frontier.root);

        IncrementalAccumulator direct;
        for (std::uint64_t i = 0; i < 7; ++i)
            direct.insert(leafAt(i));
        BEAST_EXPECT(direct.root() == acc.root());
        BEAST_EXPECT(direct.authPath(5) == acc.authPath(5));

        try
        {
            acc.extend(frontier, staged);
            fail("extend accepted leaves that do not continue the log");
        }
        catch (std::logic_error const&)
        {
            pass();
        }
    }

    void
    testSerialization()
    {
        testcase("Serialization");

        IncrementalAccumulator acc;
        for (std::uint64_t i = 0; i < 5; ++i)
            acc.insert(leafAt(i));

        ripple::Serializer s;
        acc.serialize(s);

        ripple::SerialIter sit(s.slice());
        auto const loaded = IncrementalAccumulator::deserialize(sit);
        BEAST_EXPECT(sit.empty());
        BEAST_EXPECT(loaded.root() == acc.root());
        BEAST_EXPECT(loaded.nextIndex() == acc.nextIndex());
        BEAST_EXPECT(loaded.frontier().filledSubtrees == acc.frontier().filledSubtrees);
    }
};

BEAST_DEFINE_TESTSUITE(IncrementalAccumulator, shielded, veil);

}  // namespace veil
