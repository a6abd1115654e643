#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace condorder {
namespace domain {

// -----------------------------------------------------------------------------
// Word256 - 256-bit unsigned value, big-endian byte order
// -----------------------------------------------------------------------------
//
// @brief  Holds amounts and condition references exactly as the settlement
//         layer encodes them: 32 bytes, most significant byte first.
//
// @details
// The engine never does arithmetic on these values. It only needs to test
// for zero, compare for equality, narrow to 64 bits when the value is known
// to be small (timestamps), and move them between the binary payload, JSON
// hex strings and the derived order. A byte array covers all of that without
// pulling in a bignum library.
//
// Text form: "0x" followed by 1..64 hex digits, left-padded with zeros.
// toHex() always emits the full 64 digits.
//
// Thread model:
//   Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Word256 {
  std::array<std::uint8_t, 32> bytes{};

  static Word256 fromUint64(std::uint64_t value);

  // -------------------------------------------------------------------------
  // fromHex(text)
  // -------------------------------------------------------------------------
  // @brief  Parses "0x..." hex text into a word.
  //
  // @param  text  "0x" prefix followed by 1..64 hex digits (either case).
  // @return The parsed word, right-aligned (shorter input is left-padded).
  //
  // @throws std::invalid_argument on a missing prefix, empty digits, more
  //         than 64 digits or a non-hex character.
  // -------------------------------------------------------------------------
  static Word256 fromHex(const std::string& text);

  std::string toHex() const;

  bool isZero() const;

  // True when the value fits in 64 bits (upper 24 bytes are zero).
  bool fitsUint64() const;

  // Low 64 bits. Callers check fitsUint64() first when truncation matters.
  std::uint64_t lowUint64() const;
};

inline bool operator==(const Word256& a, const Word256& b) {
  return a.bytes == b.bytes;
}

inline bool operator!=(const Word256& a, const Word256& b) {
  return !(a == b);
}

// Lexicographic on big-endian bytes, i.e. numeric order.
inline bool operator<(const Word256& a, const Word256& b) {
  return a.bytes < b.bytes;
}

// -----------------------------------------------------------------------------
// Address - 20-byte account / token identifier
// -----------------------------------------------------------------------------
// The all-zero address is the "null" asset and is rejected by validation.
// Text form is exactly "0x" + 40 hex digits.
// -----------------------------------------------------------------------------
struct Address {
  std::array<std::uint8_t, 20> bytes{};

  static Address fromHex(const std::string& text);

  std::string toHex() const;

  bool isZero() const;
};

inline bool operator==(const Address& a, const Address& b) {
  return a.bytes == b.bytes;
}

inline bool operator!=(const Address& a, const Address& b) {
  return !(a == b);
}

// The 256-bit condition reference is opaque; it shares Word256's layout.
using ConditionRef = Word256;

// Value of one hex digit (either case), or -1 if c is not one.
int hexDigitValue(char c);

// "0x" followed by two lowercase digits per byte.
std::string formatHex(const std::uint8_t* data, std::size_t size);

}  // namespace domain
}  // namespace condorder
