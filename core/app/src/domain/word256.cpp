#include "condorder/domain/word256.hpp"

#include <stdexcept>

namespace condorder {
namespace domain {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// -----------------------------------------------------------------------------
// parseHexInto: right-align the digits of text into out[0..size)
// -----------------------------------------------------------------------------
// Shared by Word256 and Address. max_digits is 2 * size; exact_digits forces
// the full width (addresses must always be written out in full).
// -----------------------------------------------------------------------------
void parseHexInto(const std::string& text, std::uint8_t* out, std::size_t size,
                  bool exact_digits) {
  if (text.size() < 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
    throw std::invalid_argument("hex value must start with 0x: '" + text +
                                "'");
  }

  const std::size_t digits = text.size() - 2;
  const std::size_t max_digits = size * 2;
  if (digits == 0 || digits > max_digits ||
      (exact_digits && digits != max_digits)) {
    throw std::invalid_argument("hex value has wrong length: '" + text + "'");
  }

  for (std::size_t i = 0; i < size; ++i) {
    out[i] = 0;
  }

  // Walk digits from least significant; digit k lands in byte
  // size - 1 - k / 2, high nibble when k is odd.
  for (std::size_t k = 0; k < digits; ++k) {
    const char c = text[text.size() - 1 - k];
    const int v = hexDigitValue(c);
    if (v < 0) {
      throw std::invalid_argument("invalid hex digit in '" + text + "'");
    }
    std::uint8_t& byte = out[size - 1 - k / 2];
    byte = static_cast<std::uint8_t>(byte | (k % 2 == 0 ? v : v << 4));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Hex helpers
// -----------------------------------------------------------------------------
int hexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string formatHex(const std::uint8_t* data, std::size_t size) {
  std::string out = "0x";
  out.reserve(2 + size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHexDigits[data[i] >> 4]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

// -----------------------------------------------------------------------------
// Word256
// -----------------------------------------------------------------------------
Word256 Word256::fromUint64(std::uint64_t value) {
  Word256 w;
  for (std::size_t i = 0; i < 8; ++i) {
    w.bytes[31 - i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
  return w;
}

Word256 Word256::fromHex(const std::string& text) {
  Word256 w;
  parseHexInto(text, w.bytes.data(), w.bytes.size(), false);
  return w;
}

std::string Word256::toHex() const {
  return formatHex(bytes.data(), bytes.size());
}

bool Word256::isZero() const {
  for (std::uint8_t b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

bool Word256::fitsUint64() const {
  for (std::size_t i = 0; i < 24; ++i) {
    if (bytes[i] != 0) return false;
  }
  return true;
}

std::uint64_t Word256::lowUint64() const {
  std::uint64_t value = 0;
  for (std::size_t i = 24; i < 32; ++i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

// -----------------------------------------------------------------------------
// Address
// -----------------------------------------------------------------------------
Address Address::fromHex(const std::string& text) {
  Address a;
  parseHexInto(text, a.bytes.data(), a.bytes.size(), true);
  return a;
}

std::string Address::toHex() const {
  return formatHex(bytes.data(), bytes.size());
}

bool Address::isZero() const {
  for (std::uint8_t b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

}  // namespace domain
}  // namespace condorder
