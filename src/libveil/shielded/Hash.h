#ifndef VEIL_SHIELDED_HASH_H_INCLUDED
#define VEIL_SHIELDED_HASH_H_INCLUDED

#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

namespace veil {

using ripple::uint256;

/**
 * Keccak-256 of left || right. Node hash of the commitment accumulator,
 * identical to Solidity's keccak256(abi.encodePacked(left, right)).
 *
 * Throws std::runtime_error if the OpenSSL provider has no KECCAK-256.
 */
uint256
hashPair(uint256 const& left, uint256 const& right);

/** Keccak-256 of an arbitrary byte range. */
uint256
keccak256Digest(ripple::Slice const& data);

/** SHA-256 of an arbitrary byte range. */
uint256
sha256Digest(ripple::Slice const& data);

}  // namespace veil

#endif
