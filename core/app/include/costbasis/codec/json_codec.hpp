#pragma once

#include "costbasis/domain/date.hpp"
#include "costbasis/domain/holding.hpp"
#include "costbasis/domain/realized_gain.hpp"
#include "costbasis/domain/tax_lot.hpp"
#include "costbasis/domain/transaction.hpp"
#include "costbasis/domain/wash_sale.hpp"
#include "costbasis/lots/lot_ledger.hpp"
#include "costbasis/tax/wash_sale_detector.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace costbasis {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec: presentation boundary of the engine
// -----------------------------------------------------------------------------
//
// @brief  Converts transactions from JSON and engine results to JSON.
//
// @details
// Output conventions:
//   dates       ISO-8601 "YYYY-MM-DD" strings
//   money       fixed-point strings with 2 decimals ("1234.50")
//   quantities  fixed-point strings with 4 decimals ("10.0000")
//   percents    fixed-point strings with 2 decimals
//   counts      JSON integers
//   keys        snake_case
//
// Strings are used for money so that clients never see binary floating
// point artefacts such as 0.30000000000000004.
//
// Input errors:
//   Missing or mistyped fields surface as nlohmann::json::exception (from
//   json::at / get). Values that are well-typed but invalid (unknown type
//   name, impossible date, negative quantity) throw std::invalid_argument.
//   PortfolioEngine turns both into error responses.
// -----------------------------------------------------------------------------

std::string formatMoney(double value);
std::string formatQuantity(double value);

// -------------------------------------------------------------------------
// transactionFromJson(j)
// -------------------------------------------------------------------------
//
// @brief  Parses one transaction object.
//
// @details
// Required: "id" (string), "symbol", "type", "quantity", "price", "date".
// Optional: "amount" (defaults to quantity * price), "fees" (defaults to 0).
// "type" accepts the aliases of parseTransactionType(); the symbol is
// normalized.
//
// @throws std::invalid_argument, nlohmann::json::exception
// -------------------------------------------------------------------------
domain::Transaction transactionFromJson(const nlohmann::json& j);

// Parses a JSON array of transaction objects.
std::vector<domain::Transaction> transactionsFromJson(const nlohmann::json& j);

// Reads j[key] as an ISO date. @throws std::invalid_argument if malformed.
domain::Date dateFromJson(const nlohmann::json& j, const std::string& key);

nlohmann::json toJson(const domain::Transaction& tx);
nlohmann::json toJson(const domain::Holding& holding);
nlohmann::json toJson(const domain::ClosedPosition& cp);
nlohmann::json toJson(const domain::PortfolioAnomaly& anomaly);
nlohmann::json toJson(const domain::PortfolioSummary& summary);

nlohmann::json toJson(const domain::TaxLot& lot);
nlohmann::json toJson(const domain::SellAllocation& alloc);
nlohmann::json toJson(const domain::SellResult& result);
nlohmann::json toJson(const domain::SellPreview& preview);
nlohmann::json toJson(const LotLedger& ledger);

nlohmann::json toJson(const domain::WashSaleResult& result);
nlohmann::json toJson(const domain::WashSaleExposure& exposure);
nlohmann::json toJson(const SellScreening& screening);

nlohmann::json toJson(const domain::RealizedGainDetail& detail);
nlohmann::json toJson(const domain::RealizedGainSummary& summary);
nlohmann::json toJson(const domain::RealizedGainReport& report);
nlohmann::json toJson(const domain::UnrealizedSummary& summary);
nlohmann::json toJson(const domain::YearStatistics& stats);
nlohmann::json toJson(const domain::AnnualReport& report);

// -------------------------------------------------------------------------
// closedPositionExportRow(cp)
// -------------------------------------------------------------------------
// @brief  Flat row for spreadsheet/CSV export of a closed position:
//         status "CLOSED" and tax_treatment "Long-term Capital Gain" or
//         "Short-term Capital Gain".
// -------------------------------------------------------------------------
nlohmann::json closedPositionExportRow(const domain::ClosedPosition& cp);

}  // namespace codec
}  // namespace costbasis
