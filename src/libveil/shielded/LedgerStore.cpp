#include <libveil/shielded/LedgerStore.h>

#include <xrpl/basics/Log.h>
#include <xrpl/protocol/Serializer.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace veil {

LedgerStore::LedgerStore(std::string path, beast::Journal j) : path_(std::move(path)), j_(j)
{
}

ripple::Blob
LedgerStore::encode(LedgerState const& state)
{
    ripple::Serializer s;
    s.add32(magic);
    s.add32(version);
    state.serialize(s);
    return s.getData();
}

LedgerState
LedgerStore::decode(ripple::Slice const& data)
{
    ripple::SerialIter sit(data);

    if (sit.get32() != magic)
        throw std::runtime_error("Not a ledger state file");

    if (auto const v = sit.get32(); v != version)
        throw std::runtime_error("Unsupported ledger state version " + std::to_string(v));

    auto state = LedgerState::deserialize(sit);
    if (!sit.empty())
        throw std::runtime_error("Trailing bytes after ledger state");

    return state;
}

void
LedgerStore::save(LedgerState const& state) const
{
    auto const blob = encode(state);
    std::string const tmp = path_ + ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.good())
        {
            JLOG(j_.error()) << "Unable to open " << tmp << " for writing";
            throw std::runtime_error("Unable to open ledger state file: " + tmp);
        }

        file.write(reinterpret_cast<char const*>(blob.data()), blob.size());
        file.flush();
        if (!file.good())
        {
            JLOG(j_.error()) << "Short write to " << tmp;
            throw std::runtime_error("Unable to write ledger state file: " + tmp);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec)
    {
        JLOG(j_.error()) << "Unable to replace " << path_ << ": " << ec.message();
        throw std::runtime_error("Unable to replace ledger state file: " + ec.message());
    }

    JLOG(j_.info()) << "Saved ledger state: " << state.accumulator.nextIndex() << " leaves, "
                    << state.nullifiers.size() << " nullifiers, " << blob.size() << " bytes";
}

std::optional<LedgerState>
LedgerStore::load() const
{
    std::ifstream file(path_, std::ios::binary);
    if (!file.good())
    {
        JLOG(j_.info()) << "No ledger state at " << path_;
        return std::nullopt;
    }

    ripple::Blob const blob(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    try
    {
        auto state = decode(ripple::makeSlice(blob));
        JLOG(j_.info()) << "Loaded ledger state: root " << state.accumulator.root() << ", "
                        << state.accumulator.nextIndex() << " leaves";
        return state;
    }
    catch (std::exception const& e)
    {
        JLOG(j_.error()) << "Corrupt ledger state at " << path_ << ": " << e.what();
        throw std::runtime_error(std::string("Corrupt ledger state: ") + e.what());
    }
}

}  // namespace veil
