#ifndef VEIL_SHIELDED_SHIELDEDEVENTS_H_INCLUDED
#define VEIL_SHIELDED_SHIELDEDEVENTS_H_INCLUDED

#include <libveil/shielded/OutputCiphertext.h>

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/AccountID.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace veil {

using ripple::uint256;

struct Deposited
{
    ripple::AccountID from;
    std::uint64_t amount = 0;
    uint256 commitment;
    std::uint64_t leafIndex = 0;
};

/** Everything a recipient needs to find and decrypt its note. */
struct OutputCommitted
{
    uint256 commitment;
    std::uint8_t keyType = 0;
    ripple::Blob ephemeralKey;
    std::array<std::uint8_t, CIPHER_NONCE_SIZE> nonce{};
    ripple::Blob ciphertext;
    std::uint64_t leafIndex = 0;
};

struct RootUpdated
{
    uint256 oldRoot;
    uint256 newRoot;
};

struct Withdrawn
{
    ripple::AccountID to;
    std::uint64_t amount = 0;
};

struct MetadataPosted
{
    uint256 commitment;
    std::size_t size = 0;
};

using ShieldedEvent =
    std::variant<Deposited, OutputCommitted, RootUpdated, Withdrawn, MetadataPosted>;

/** Name of the event kind, e.g. "RootUpdated". */
char const*
eventName(ShieldedEvent const& event);

/** One line rendering for logs. */
std::string
to_string(ShieldedEvent const& event);

/**
 * Receives the notifications of committed operations, in emission order.
 * Never called for an operation that failed.
 */
class EventSink
{
public:
    virtual ~EventSink() = default;

    virtual void
    publish(ShieldedEvent const& event) = 0;
};

}  // namespace veil

#endif
