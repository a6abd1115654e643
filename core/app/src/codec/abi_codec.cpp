#include "condorder/codec/abi_codec.hpp"

#include <algorithm>
#include <limits>

namespace condorder {
namespace codec {

namespace {

constexpr std::size_t kAddressPad = kWordSize - 20;

enum Word : std::size_t {
  kSellAsset = 0,
  kBuyAsset,
  kReceiver,
  kSellAmount,
  kMinBuyAmount,
  kValidFrom,
  kValidUntil,
  kConditionRef,
};

const std::uint8_t* wordAt(const std::vector<std::uint8_t>& payload,
                           std::size_t index) {
  return payload.data() + index * kWordSize;
}

domain::Word256 readWord(const std::vector<std::uint8_t>& payload,
                         std::size_t index) {
  domain::Word256 w;
  const std::uint8_t* src = wordAt(payload, index);
  std::copy(src, src + kWordSize, w.bytes.begin());
  return w;
}

domain::Address readAddress(const std::vector<std::uint8_t>& payload,
                            std::size_t index, const char* field) {
  const std::uint8_t* src = wordAt(payload, index);
  for (std::size_t i = 0; i < kAddressPad; ++i) {
    if (src[i] != 0) {
      throw PayloadDecodeError(std::string("dirty address padding in ") +
                               field);
    }
  }
  domain::Address a;
  std::copy(src + kAddressPad, src + kWordSize, a.bytes.begin());
  return a;
}

// Wider-than-64-bit times clamp to UINT64_MAX.
std::uint64_t readTime(const std::vector<std::uint8_t>& payload,
                       std::size_t index) {
  domain::Word256 w = readWord(payload, index);
  if (!w.fitsUint64()) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return w.lowUint64();
}

void writeWord(std::vector<std::uint8_t>& out, std::size_t index,
               const domain::Word256& w) {
  std::copy(w.bytes.begin(), w.bytes.end(), out.begin() + index * kWordSize);
}

void writeAddress(std::vector<std::uint8_t>& out, std::size_t index,
                  const domain::Address& a) {
  std::copy(a.bytes.begin(), a.bytes.end(),
            out.begin() + index * kWordSize + kAddressPad);
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeOrderSpec
// -----------------------------------------------------------------------------
domain::OrderSpec decodeOrderSpec(const std::vector<std::uint8_t>& payload) {
  if (payload.size() != kOrderSpecPayloadSize) {
    throw PayloadDecodeError("order payload must be " +
                             std::to_string(kOrderSpecPayloadSize) +
                             " bytes, got " + std::to_string(payload.size()));
  }

  domain::OrderSpec spec;
  spec.sell_asset = readAddress(payload, kSellAsset, "sell_asset");
  spec.buy_asset = readAddress(payload, kBuyAsset, "buy_asset");
  spec.receiver = readAddress(payload, kReceiver, "receiver");
  spec.sell_amount = readWord(payload, kSellAmount);
  spec.min_buy_amount = readWord(payload, kMinBuyAmount);
  spec.valid_from = readTime(payload, kValidFrom);
  spec.valid_until = readTime(payload, kValidUntil);
  spec.condition_ref = readWord(payload, kConditionRef);
  return spec;
}

// -----------------------------------------------------------------------------
// encodeOrderSpec
// -----------------------------------------------------------------------------
std::vector<std::uint8_t> encodeOrderSpec(const domain::OrderSpec& spec) {
  std::vector<std::uint8_t> out(kOrderSpecPayloadSize, 0);
  writeAddress(out, kSellAsset, spec.sell_asset);
  writeAddress(out, kBuyAsset, spec.buy_asset);
  writeAddress(out, kReceiver, spec.receiver);
  writeWord(out, kSellAmount, spec.sell_amount);
  writeWord(out, kMinBuyAmount, spec.min_buy_amount);
  writeWord(out, kValidFrom, domain::Word256::fromUint64(spec.valid_from));
  writeWord(out, kValidUntil, domain::Word256::fromUint64(spec.valid_until));
  writeWord(out, kConditionRef, spec.condition_ref);
  return out;
}

// -----------------------------------------------------------------------------
// bytesFromHex / bytesToHex
// -----------------------------------------------------------------------------
std::vector<std::uint8_t> bytesFromHex(const std::string& text) {
  if (text.size() < 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
    throw PayloadDecodeError("hex payload must start with 0x");
  }
  if (text.size() % 2 != 0) {
    throw PayloadDecodeError("hex payload has an odd number of digits");
  }

  std::vector<std::uint8_t> out;
  out.reserve((text.size() - 2) / 2);
  for (std::size_t i = 2; i < text.size(); i += 2) {
    const int hi = domain::hexDigitValue(text[i]);
    const int lo = domain::hexDigitValue(text[i + 1]);
    if (hi < 0 || lo < 0) {
      throw PayloadDecodeError("invalid hex digit in payload at offset " +
                               std::to_string(i));
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string bytesToHex(const std::vector<std::uint8_t>& bytes) {
  return domain::formatHex(bytes.data(), bytes.size());
}

}  // namespace codec
}  // namespace condorder
