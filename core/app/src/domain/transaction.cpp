#include "costbasis/domain/transaction.hpp"

#include <algorithm>
#include <cctype>

namespace costbasis {
namespace domain {

// -----------------------------------------------------------------------------
// isAcquisition / isDisposal
// -----------------------------------------------------------------------------
bool isAcquisition(TransactionType type) {
  using T = TransactionType;
  switch (type) {
    case T::Buy:
    case T::TransferIn:
      return true;
    case T::Sell:
    case T::TransferOut:
    case T::Dividend:
      return false;
  }
  return false;
}

bool isDisposal(TransactionType type) {
  using T = TransactionType;
  switch (type) {
    case T::Sell:
    case T::TransferOut:
      return true;
    case T::Buy:
    case T::TransferIn:
    case T::Dividend:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// transactionTypeToString
// -----------------------------------------------------------------------------
const char* transactionTypeToString(TransactionType type) {
  using T = TransactionType;
  switch (type) {
    case T::Buy:         return "BUY";
    case T::Sell:        return "SELL";
    case T::Dividend:    return "DIVIDEND";
    case T::TransferIn:  return "TRANSFER_IN";
    case T::TransferOut: return "TRANSFER_OUT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// parseTransactionType: canonical names plus brokerage-export aliases
// -----------------------------------------------------------------------------
std::optional<TransactionType> parseTransactionType(std::string_view text) {
  const std::string key = normalizeSymbol(text);
  using T = TransactionType;

  if (key == "BUY" || key == "BOUGHT" || key == "PURCHASE") {
    return T::Buy;
  }
  if (key == "SELL" || key == "SOLD" || key == "SALE") {
    return T::Sell;
  }
  if (key == "DIVIDEND" || key == "DIV") {
    return T::Dividend;
  }
  if (key == "TRANSFER_IN") {
    return T::TransferIn;
  }
  if (key == "TRANSFER_OUT") {
    return T::TransferOut;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// normalizeSymbol
// -----------------------------------------------------------------------------
std::string normalizeSymbol(std::string_view symbol) {
  std::size_t begin = 0;
  std::size_t end = symbol.size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>(symbol[begin]))) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(symbol[end - 1]))) {
    --end;
  }

  std::string out(symbol.substr(begin, end - begin));
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

// -----------------------------------------------------------------------------
// sortByDate: stable so same-day transactions keep insertion order
// -----------------------------------------------------------------------------
std::vector<Transaction> sortByDate(std::vector<Transaction> transactions) {
  std::stable_sort(transactions.begin(), transactions.end(),
                   [](const Transaction& a, const Transaction& b) {
                     return a.date < b.date;
                   });
  return transactions;
}

}  // namespace domain
}  // namespace costbasis
