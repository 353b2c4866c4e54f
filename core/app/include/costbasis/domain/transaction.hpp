#pragma once

#include "costbasis/domain/date.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionType
// -----------------------------------------------------------------------------
// Responsibility: The closed set of events the engine understands.
// Switches over it carry no `default:` label; -Wswitch lists every place a new
// kind must be handled.
//
//   Buy, TransferIn      → increase the position, create a tax lot
//   Sell, TransferOut    → decrease the position, consume tax lots
//   Dividend             → cash only; never changes quantity or cost basis
// -----------------------------------------------------------------------------
enum class TransactionType {
  Buy,
  Sell,
  Dividend,
  TransferIn,
  TransferOut,
};

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
//
// @brief  One immutable entry of the investor's append-only event stream.
//
// @details
// Transactions are owned by the caller (typically loaded from the
// persistence layer). The engine copies them into its own working vectors
// and never mutates the caller's data.
//
// Field semantics:
//   amount  Gross cost (acquisitions) or gross proceeds (disposals), before
//           fees. Cost basis of an acquisition is amount + fees; net
//           proceeds of a disposal are amount - fees.
//   price   Per-share price. Lot allocation values proceeds at
//           quantity_sold * price.
//   symbol  Expected to be normalized (see normalizeSymbol). Components
//           normalize again on entry so un-normalized input still groups
//           correctly.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Transaction {
  std::string id;                               // Caller-assigned identifier
  std::string symbol;                           // Canonical ticker (e.g. "AAPL")
  TransactionType type{TransactionType::Buy};
  double quantity{0.0};                         // Shares, >= 0
  double price{0.0};                            // Per-share price
  double amount{0.0};                           // Gross value, before fees
  double fees{0.0};                             // Commissions and fees
  Date date{};                                  // Trade date
};

// True for Buy and TransferIn.
bool isAcquisition(TransactionType type);

// True for Sell and TransferOut.
bool isDisposal(TransactionType type);

// Canonical upper-case name ("BUY", "TRANSFER_IN", ...).
const char* transactionTypeToString(TransactionType type);

// -------------------------------------------------------------------------
// parseTransactionType(text)
// -------------------------------------------------------------------------
// @brief  Maps a type string to a TransactionType.
//
// @details
// Case-insensitive and whitespace-tolerant. Besides the canonical names it
// accepts the aliases seen in brokerage CSV exports:
//   BOUGHT, PURCHASE → Buy
//   SOLD, SALE       → Sell
//   DIV              → Dividend
//
// @return std::nullopt for anything else. Callers decide whether that is an
//         error; the engine never guesses a type.
// -------------------------------------------------------------------------
std::optional<TransactionType> parseTransactionType(std::string_view text);

// Trims surrounding whitespace and upper-cases ASCII letters.
std::string normalizeSymbol(std::string_view symbol);

// -------------------------------------------------------------------------
// sortByDate(transactions)
// -------------------------------------------------------------------------
// @brief  Returns the transactions ordered by ascending date.
//
// @details
// Uses std::stable_sort, so transactions on the same day keep their input
// (insertion) order. Every component that replays history goes through this
// function so same-day BUY-then-SELL sequences behave identically across
// the aggregator, the lot ledger and the reporter.
// -------------------------------------------------------------------------
std::vector<Transaction> sortByDate(std::vector<Transaction> transactions);

}  // namespace domain
}  // namespace costbasis
