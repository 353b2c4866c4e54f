#include "costbasis/engine/portfolio_engine.hpp"
#include "costbasis/codec/json_codec.hpp"
#include "costbasis/holdings/holding_aggregator.hpp"
#include "costbasis/lots/lot_ledger.hpp"
#include "costbasis/lots/tax_lot_allocator.hpp"
#include "costbasis/report/annual_report.hpp"
#include "costbasis/report/realized_gain_reporter.hpp"
#include "costbasis/tax/wash_sale_detector.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>

namespace costbasis {

namespace {

std::vector<domain::Transaction> transactionsOf(const nlohmann::json& request) {
  if (!request.contains("transactions")) {
    return {};
  }
  return codec::transactionsFromJson(request.at("transactions"));
}

std::string symbolOf(const nlohmann::json& request) {
  return domain::normalizeSymbol(request.at("symbol").get<std::string>());
}

SpecificLotSelections selectionsFrom(const nlohmann::json& request) {
  SpecificLotSelections selections;
  if (!request.contains("selections")) {
    return selections;
  }
  for (const auto& item : request.at("selections").items()) {
    selections[item.key()] = item.value().get<std::vector<std::string>>();
  }
  return selections;
}

nlohmann::json ok() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json error(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = message;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
PortfolioEngine::PortfolioEngine(const IClock& clock, EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      prices_(config_.prices) {}

PortfolioEngine::~PortfolioEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PortfolioEngine::start() {
  if (running_) {
    return;
  }

  if (!config_.command_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.command_endpoint);
    ipc_server_->start();
  }

  running_ = true;

  std::cout << "[PortfolioEngine] started. method="
            << costBasisMethodToString(config_.default_method)
            << " prices=" << config_.prices.size()
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PortfolioEngine::stop() {
  if (!running_) {
    return;
  }

  // Joins the IPC thread before anything executeCommand() reads goes away.
  ipc_server_.reset();
  running_ = false;

  std::cout << "[PortfolioEngine] stopped.\n";
}

bool PortfolioEngine::isRunning() const { return running_; }

StaticPriceSource& PortfolioEngine::prices() { return prices_; }

const EngineConfig& PortfolioEngine::config() const { return config_; }

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, convert failures into error responses
// -----------------------------------------------------------------------------
std::string PortfolioEngine::executeCommand(const std::string& request) {
  nlohmann::json response;
  std::string command;

  try {
    const auto first = request.find_first_not_of(" \t\r\n");
    nlohmann::json parsed = nlohmann::json::object();

    if (first != std::string::npos && request[first] == '{') {
      parsed = nlohmann::json::parse(request);
      command = parsed.at("command").get<std::string>();
    } else {
      const auto last = request.find_last_not_of(" \t\r\n");
      command = first == std::string::npos
                    ? std::string{}
                    : request.substr(first, last - first + 1);
    }

    response = dispatch(command, parsed);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PortfolioEngine] WARNING: bad request for '" << command
              << "': " << e.what() << "\n";
    response = error(std::string("Malformed request: ") + e.what());
  } catch (const std::invalid_argument& e) {
    std::cerr << "[PortfolioEngine] WARNING: rejected '" << command
              << "': " << e.what() << "\n";
    response = error(e.what());
  } catch (const std::exception& e) {
    std::cerr << "[PortfolioEngine] ERROR: command '" << command
              << "' failed: " << e.what() << "\n";
    response = error(e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch()
// -----------------------------------------------------------------------------
nlohmann::json PortfolioEngine::dispatch(const std::string& command,
                                         const nlohmann::json& request) const {
  if (command == "PING") {
    auto response = ok();
    response["response"] = "PONG";
    return response;
  }
  if (command == "PORTFOLIO") {
    return handlePortfolio(request);
  }
  if (command == "PREVIEW_SELL") {
    return handlePreviewSell(request);
  }
  if (command == "TAX_LOTS") {
    return handleTaxLots(request);
  }
  if (command == "WASH_SALE") {
    return handleWashSale(request);
  }
  if (command == "WOULD_TRIGGER_WASH_SALE") {
    return handleWouldTriggerWashSale(request);
  }
  if (command == "SCREEN_SELL") {
    return handleScreenSell(request);
  }
  if (command == "REALIZED_GAINS") {
    return handleRealizedGains(request);
  }
  if (command == "UNREALIZED_GAINS") {
    return handleUnrealizedGains(request);
  }
  if (command == "ANNUAL_REPORT") {
    return handleAnnualReport(request);
  }
  if (command == "CLOSED_POSITIONS_EXPORT") {
    return handleClosedPositionsExport(request);
  }

  std::cerr << "[PortfolioEngine] WARNING: unknown command '" << command
            << "'\n";
  return error("Unknown command: " + command);
}

// -----------------------------------------------------------------------------
// Command handlers
// -----------------------------------------------------------------------------
nlohmann::json PortfolioEngine::handlePortfolio(
    const nlohmann::json& request) const {
  auto response = ok();
  response["portfolio"] =
      codec::toJson(calculatePortfolio(transactionsOf(request)));
  return response;
}

nlohmann::json PortfolioEngine::handlePreviewSell(
    const nlohmann::json& request) const {
  const auto symbol = symbolOf(request);
  const double quantity = request.at("quantity").get<double>();
  const double price = request.at("price").get<double>();
  const domain::Date date = request.contains("date")
                                ? codec::dateFromJson(request, "date")
                                : clock_.today();
  const auto method = methodFrom(request);
  const auto lot_ids = request.value("lot_ids", std::vector<std::string>{});
  validateAllocationRequest(method, lot_ids);

  // Lots as they stand today, depleted with the configured method.
  const auto ledger =
      replayTaxLots(transactionsOf(request), config_.default_method);
  const auto lots = getAvailableLots(ledger.lots, symbol);

  nlohmann::json available = nlohmann::json::array();
  for (const auto& lot : lots) {
    available.push_back(codec::toJson(lot));
  }

  auto response = ok();
  response["symbol"] = symbol;
  response["method"] = costBasisMethodToString(method);
  response["method_name"] = costBasisMethodName(method);
  response["method_description"] = costBasisMethodDescription(method);
  response["available_lots"] = std::move(available);
  response["weighted_avg_cost"] = codec::formatMoney(getWeightedAvgCost(lots));
  response["preview"] = codec::toJson(
      previewSellAllocation(lots, quantity, price, date, method, lot_ids));
  return response;
}

nlohmann::json PortfolioEngine::handleTaxLots(
    const nlohmann::json& request) const {
  const auto method = methodFrom(request);

  auto response = ok();
  response["method"] = costBasisMethodToString(method);
  response["ledger"] = codec::toJson(
      replayTaxLots(transactionsOf(request), method, selectionsFrom(request)));
  return response;
}

nlohmann::json PortfolioEngine::handleWashSale(
    const nlohmann::json& request) const {
  const auto result = detectWashSale(
      codec::dateFromJson(request, "date"), symbolOf(request),
      request.at("loss").get<double>(), request.at("quantity").get<double>(),
      transactionsOf(request));

  auto response = ok();
  response["wash_sale"] = codec::toJson(result);
  return response;
}

nlohmann::json PortfolioEngine::handleWouldTriggerWashSale(
    const nlohmann::json& request) const {
  const domain::Date buy_date = request.contains("date")
                                    ? codec::dateFromJson(request, "date")
                                    : clock_.today();

  // Gain/loss of each recorded sale, from the lot ledger.
  const auto ledger =
      replayTaxLots(transactionsOf(request), config_.default_method);
  std::vector<domain::Transaction> sells;
  std::map<std::string, double> gains;
  for (const auto& sale : ledger.sales) {
    sells.push_back(sale.transaction);
    gains[sale.transaction.id] = sale.result.total_gain_loss;
  }

  auto response = ok();
  response["exposure"] = codec::toJson(
      wouldTriggerWashSale(buy_date, symbolOf(request), sells, gains));
  return response;
}

nlohmann::json PortfolioEngine::handleScreenSell(
    const nlohmann::json& request) const {
  const auto sell = codec::transactionFromJson(request.at("sell"));

  auto response = ok();
  response["screening"] =
      codec::toJson(screenSellForWashSale(sell, transactionsOf(request)));
  return response;
}

nlohmann::json PortfolioEngine::handleRealizedGains(
    const nlohmann::json& request) const {
  domain::Date start;
  domain::Date end;
  if (request.contains("start") || request.contains("end")) {
    start = codec::dateFromJson(request, "start");
    end = codec::dateFromJson(request, "end");
  } else {
    const int year = yearFrom(request);
    start = domain::make_date(year, 1, 1);
    end = domain::make_date(year, 12, 31);
  }
  if (end < start) {
    throw std::invalid_argument("Report range ends before it starts");
  }

  auto response = ok();
  response["report"] = codec::toJson(
      calculateRealizedGains(transactionsOf(request), start, end));
  return response;
}

nlohmann::json PortfolioEngine::handleUnrealizedGains(
    const nlohmann::json& request) const {
  const auto portfolio = calculatePortfolio(transactionsOf(request));
  const auto override_prices = priceOverrideFrom(request);
  const IPriceSource& prices =
      override_prices ? static_cast<const IPriceSource&>(*override_prices)
                      : prices_;

  auto response = ok();
  response["unrealized"] = codec::toJson(
      calculateUnrealizedGains(portfolio.open_holdings, prices));
  return response;
}

nlohmann::json PortfolioEngine::handleAnnualReport(
    const nlohmann::json& request) const {
  const auto override_prices = priceOverrideFrom(request);
  const IPriceSource& prices =
      override_prices ? static_cast<const IPriceSource&>(*override_prices)
                      : prices_;

  auto response = ok();
  response["report"] = codec::toJson(
      buildAnnualReport(transactionsOf(request), yearFrom(request), prices));
  return response;
}

nlohmann::json PortfolioEngine::handleClosedPositionsExport(
    const nlohmann::json& request) const {
  const auto portfolio = calculatePortfolio(transactionsOf(request));

  nlohmann::json rows = nlohmann::json::array();
  for (const auto& cp : portfolio.closed_positions) {
    rows.push_back(codec::closedPositionExportRow(cp));
  }

  auto response = ok();
  response["rows"] = std::move(rows);
  return response;
}

// -----------------------------------------------------------------------------
// Request helpers
// -----------------------------------------------------------------------------
domain::CostBasisMethod PortfolioEngine::methodFrom(
    const nlohmann::json& request) const {
  if (!request.contains("method")) {
    return config_.default_method;
  }
  const auto name = request.at("method").get<std::string>();
  auto method = parseCostBasisMethod(name);
  if (!method) {
    throw std::invalid_argument("Unknown cost basis method: " + name);
  }
  return *method;
}

std::unique_ptr<StaticPriceSource> PortfolioEngine::priceOverrideFrom(
    const nlohmann::json& request) const {
  if (!request.contains("prices")) {
    return nullptr;
  }
  const auto& prices = request.at("prices");
  if (!prices.is_object()) {
    throw std::invalid_argument("'prices' must be an object");
  }
  auto source = std::make_unique<StaticPriceSource>();
  for (const auto& item : prices.items()) {
    source->setCurrentPrice(item.key(), item.value().get<double>());
  }
  return source;
}

int PortfolioEngine::yearFrom(const nlohmann::json& request) const {
  if (request.contains("year")) {
    const auto year = request.at("year").get<std::int64_t>();
    if (year < domain::kMinYear || year > domain::kMaxYear) {
      throw std::invalid_argument("Year out of range: " +
                                  std::to_string(year));
    }
    return static_cast<int>(year);
  }
  return domain::year_of(clock_.today());
}

}  // namespace costbasis
