#include <libveil/shielded/ShieldedEvents.h>

#include <sstream>

namespace veil {

namespace {

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

char const*
eventName(ShieldedEvent const& event)
{
    return std::visit(
        overloaded{
            [](Deposited const&) { return "Deposited"; },
            [](OutputCommitted const&) { return "OutputCommitted"; },
            [](RootUpdated const&) { return "RootUpdated"; },
            [](Withdrawn const&) { return "Withdrawn"; },
            [](MetadataPosted const&) { return "MetadataPosted"; }},
        event);
}

std::string
to_string(ShieldedEvent const& event)
{
    std::ostringstream os;
    os << eventName(event) << ' ';
    std::visit(
        overloaded{
            [&](Deposited const& e) {
                os << "from=" << ripple::toBase58(e.from) << " amount=" << e.amount
                   << " commitment=" << e.commitment << " leaf=" << e.leafIndex;
            },
            [&](OutputCommitted const& e) {
                os << "commitment=" << e.commitment << " keyType=" << unsigned(e.keyType)
                   << " ciphertext=" << e.ciphertext.size() << "B leaf=" << e.leafIndex;
            },
            [&](RootUpdated const& e) { os << "old=" << e.oldRoot << " new=" << e.newRoot; },
            [&](Withdrawn const& e) {
                os << "to=" << ripple::toBase58(e.to) << " amount=" << e.amount;
            },
            [&](MetadataPosted const& e) {
                os << "commitment=" << e.commitment << " size=" << e.size;
            }},
        event);
    return os.str();
}

}  // namespace veil
