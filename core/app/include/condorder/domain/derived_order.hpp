#pragma once

#include "condorder/domain/word256.hpp"

#include <cstdint>

namespace condorder {
namespace domain {

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Sell: sell_amount is exact, buy_amount is a floor.
// Buy:  buy_amount is exact, sell_amount is a ceiling.
// Linked-bet orders are always Sell; Buy exists because the exchange record
// has both and the JSON rendering must name whichever it holds.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Sell,
  Buy,
};

// -----------------------------------------------------------------------------
// TokenBalance
// -----------------------------------------------------------------------------
// Where a leg is settled from/to. Erc20 means the plain token balance, with
// no routing through the settlement vault's internal or external balances.
// Linked-bet orders always use Erc20 on both legs. External and Internal are
// kept because the exchange record allows them and the JSON rendering must
// name every value it can hold.
// -----------------------------------------------------------------------------
enum class TokenBalance {
  Erc20,
  External,
  Internal,
};

// -----------------------------------------------------------------------------
// DerivedOrder - canonical exchange order record
// -----------------------------------------------------------------------------
//
// @brief  The exchange-native swap order computed from a validated
//         OrderSpec.
//
// @details
// Recomputed on every evaluation and never stored; it has no identity of its
// own. Field mapping from OrderSpec:
//
//   sell_token          <- sell_asset
//   buy_token           <- buy_asset
//   receiver            <- receiver
//   sell_amount         <- sell_amount
//   buy_amount          <- min_buy_amount
//   valid_to            <- valid_until (already checked to fit 32 bits)
//   app_data            <- condition_ref
//   fee_amount          =  0
//   kind                =  Sell
//   partially_fillable  =  false
//   sell/buy balances   =  Erc20
// -----------------------------------------------------------------------------
struct DerivedOrder {
  Address sell_token;
  Address buy_token;
  Address receiver;
  Word256 sell_amount;
  Word256 buy_amount;
  std::uint32_t valid_to{0};
  Word256 app_data;
  Word256 fee_amount;
  OrderKind kind{OrderKind::Sell};
  bool partially_fillable{false};
  TokenBalance sell_token_balance{TokenBalance::Erc20};
  TokenBalance buy_token_balance{TokenBalance::Erc20};
};

inline bool operator==(const DerivedOrder& a, const DerivedOrder& b) {
  return a.sell_token == b.sell_token && a.buy_token == b.buy_token &&
         a.receiver == b.receiver && a.sell_amount == b.sell_amount &&
         a.buy_amount == b.buy_amount && a.valid_to == b.valid_to &&
         a.app_data == b.app_data && a.fee_amount == b.fee_amount &&
         a.kind == b.kind && a.partially_fillable == b.partially_fillable &&
         a.sell_token_balance == b.sell_token_balance &&
         a.buy_token_balance == b.buy_token_balance;
}

inline bool operator!=(const DerivedOrder& a, const DerivedOrder& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace condorder
