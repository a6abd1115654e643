#pragma once

#include "condorder/codec/payload_error.hpp"
#include "condorder/domain/order_spec.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace condorder {
namespace codec {

// -----------------------------------------------------------------------------
// Static word layout of an OrderSpec payload
// -----------------------------------------------------------------------------
//
// @details
// The payload an order is registered with is the exchange's static ABI
// encoding of the OrderSpec tuple: eight 32-byte big-endian words, no
// dynamic parts, no selector.
//
//   word  offset  field
//   ----  ------  --------------------------------------------
//   0     0x00    sell_asset      (address, left-padded)
//   1     0x20    buy_asset       (address, left-padded)
//   2     0x40    receiver        (address, left-padded)
//   3     0x60    sell_amount     (uint256)
//   4     0x80    min_buy_amount  (uint256)
//   5     0xa0    valid_from      (uint256, epoch seconds)
//   6     0xc0    valid_until     (uint256, epoch seconds)
//   7     0xe0    condition_ref   (bytes32)
//
// Decoding is strict about shape (exact length, clean address padding) and
// lenient about value: a time word wider than 64 bits becomes UINT64_MAX,
// which the validity-window rules reject on their own.
// -----------------------------------------------------------------------------
constexpr std::size_t kWordSize = 32;
constexpr std::size_t kOrderSpecWords = 8;
constexpr std::size_t kOrderSpecPayloadSize = kWordSize * kOrderSpecWords;

// -------------------------------------------------------------------------
// decodeOrderSpec(payload)
// -------------------------------------------------------------------------
// @brief  Decodes a 256-byte static payload into an OrderSpec.
//
// @throws PayloadDecodeError on a wrong length or a non-zero address pad.
// -------------------------------------------------------------------------
domain::OrderSpec decodeOrderSpec(const std::vector<std::uint8_t>& payload);

// Inverse of decodeOrderSpec().
std::vector<std::uint8_t> encodeOrderSpec(const domain::OrderSpec& spec);

// -------------------------------------------------------------------------
// Hex helpers for carrying binary payloads in text (config files, logs).
// -------------------------------------------------------------------------
// bytesFromHex accepts "0x" + an even number of hex digits and throws
// PayloadDecodeError otherwise.
std::vector<std::uint8_t> bytesFromHex(const std::string& text);
std::string bytesToHex(const std::vector<std::uint8_t>& bytes);

}  // namespace codec
}  // namespace condorder
