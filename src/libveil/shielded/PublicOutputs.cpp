#include <libveil/shielded/PublicOutputs.h>

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace veil {

namespace {

constexpr std::size_t wordSize = 32;

// Three head words: oldRoot and the two array offsets
constexpr std::size_t tupleHeadSize = 3 * wordSize;

// ABI integers are big endian words. Anything that does not fit in 64 bits
// cannot be a valid offset or length for a buffer held in memory.
std::optional<std::uint64_t>
readWordAsInteger(ripple::Slice const& data, std::size_t pos)
{
    if (pos > data.size() || data.size() - pos < wordSize)
        return std::nullopt;

    auto const* word = data.data() + pos;
    if (std::any_of(word, word + 24, [](std::uint8_t b) { return b != 0; }))
        return std::nullopt;

    std::uint64_t value = 0;
    for (std::size_t i = 24; i < wordSize; ++i)
        value = (value << 8) | word[i];
    return value;
}

std::optional<std::vector<uint256>>
readWordArray(ripple::Slice const& data, std::size_t tupleBase, std::uint64_t offset)
{
    if (offset < tupleHeadSize || offset % wordSize != 0)
        return std::nullopt;
    if (offset > data.size() - tupleBase)
        return std::nullopt;

    std::size_t const start = tupleBase + offset;
    auto const length = readWordAsInteger(data, start);
    if (!length)
        return std::nullopt;

    std::size_t const available = (data.size() - start - wordSize) / wordSize;
    if (*length > available)
        return std::nullopt;

    std::vector<uint256> out;
    out.reserve(*length);
    for (std::uint64_t i = 0; i < *length; ++i)
        out.push_back(uint256::fromVoid(data.data() + start + wordSize + i * wordSize));
    return out;
}

void
appendInteger(ripple::Blob& out, std::uint64_t value)
{
    std::uint8_t word[wordSize] = {};
    for (std::size_t i = 0; i < 8; ++i)
        word[wordSize - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    out.insert(out.end(), word, word + wordSize);
}

void
appendHash(ripple::Blob& out, uint256 const& value)
{
    out.insert(out.end(), value.begin(), value.end());
}

}  // namespace

std::optional<PublicOutputs>
PublicOutputs::decode(ripple::Slice const& publicValues)
{
    // A dynamic tuple encoded on its own is preceded by its offset
    auto const tupleOffset = readWordAsInteger(publicValues, 0);
    if (!tupleOffset || *tupleOffset != wordSize)
        return std::nullopt;

    std::size_t const base = wordSize;
    if (publicValues.size() < base + tupleHeadSize)
        return std::nullopt;

    PublicOutputs outputs;
    outputs.oldRoot = uint256::fromVoid(publicValues.data() + base);

    auto const nullifierOffset = readWordAsInteger(publicValues, base + wordSize);
    auto const commitmentOffset = readWordAsInteger(publicValues, base + 2 * wordSize);
    if (!nullifierOffset || !commitmentOffset)
        return std::nullopt;

    auto nullifiers = readWordArray(publicValues, base, *nullifierOffset);
    auto commitments = readWordArray(publicValues, base, *commitmentOffset);
    if (!nullifiers || !commitments)
        return std::nullopt;

    // Bytes past the furthest array are tolerated only as zero padding
    std::size_t const end = std::max(
        base + *nullifierOffset + wordSize * (1 + nullifiers->size()),
        base + *commitmentOffset + wordSize * (1 + commitments->size()));
    if (std::any_of(
            publicValues.data() + end,
            publicValues.data() + publicValues.size(),
            [](std::uint8_t b) { return b != 0; }))
        return std::nullopt;

    outputs.nullifiers = std::move(*nullifiers);
    outputs.outputCommitments = std::move(*commitments);
    return outputs;
}

ripple::Blob
PublicOutputs::encode() const
{
    std::uint64_t const nullifierOffset = tupleHeadSize;
    std::uint64_t const commitmentOffset =
        nullifierOffset + wordSize * (1 + nullifiers.size());

    ripple::Blob out;
    out.reserve(wordSize * (6 + nullifiers.size() + outputCommitments.size()));

    appendInteger(out, wordSize);
    appendHash(out, oldRoot);
    appendInteger(out, nullifierOffset);
    appendInteger(out, commitmentOffset);

    appendInteger(out, nullifiers.size());
    for (auto const& n : nullifiers)
        appendHash(out, n);

    appendInteger(out, outputCommitments.size());
    for (auto const& c : outputCommitments)
        appendHash(out, c);

    return out;
}

bool
operator==(PublicOutputs const& lhs, PublicOutputs const& rhs)
{
    return lhs.oldRoot == rhs.oldRoot && lhs.nullifiers == rhs.nullifiers &&
        lhs.outputCommitments == rhs.outputCommitments;
}

}  // namespace veil
