#ifndef VEIL_SHIELDED_LEDGERSTORE_H_INCLUDED
#define VEIL_SHIELDED_LEDGERSTORE_H_INCLUDED

#include <libveil/shielded/LedgerState.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <optional>
#include <string>

namespace veil {

/**
 * File persistence for LedgerState.
 *
 * The state is written as one blob: a magic word and format version,
 * then the serialized state. save() writes a temporary file beside the
 * target and renames it over the target, so a reader sees either the old
 * or the new state.
 */
class LedgerStore
{
public:
    static constexpr std::uint32_t magic = 0x5645494C;  // "VEIL"
    static constexpr std::uint32_t version = 1;

    LedgerStore(std::string path, beast::Journal j);

    std::string const&
    path() const
    {
        return path_;
    }

    /** Throws std::runtime_error if the file cannot be written. */
    void
    save(LedgerState const& state) const;

    /**
     * Nothing if no state has been saved yet. Throws std::runtime_error
     * if the file is unreadable or inconsistent.
     */
    std::optional<LedgerState>
    load() const;

    static ripple::Blob
    encode(LedgerState const& state);

    static LedgerState
    decode(ripple::Slice const& data);

private:
    std::string const path_;
    beast::Journal const j_;
};

}  // namespace veil

#endif
