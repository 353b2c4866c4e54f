#pragma once

#include "costbasis/config/engine_config.hpp"
#include "costbasis/network/ipc_server.hpp"
#include "costbasis/pricing/static_price_source.hpp"
#include "costbasis/time/i_clock.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace costbasis {

// -----------------------------------------------------------------------------
// PortfolioEngine
// -----------------------------------------------------------------------------
//
// @brief  Process-level root: owns configuration, the quote snapshot and the
//         optional IPC server, and maps JSON command requests onto the
//         cost-basis components.
//
// @details
// The engine keeps no portfolio state. Every request carries the
// transaction history it is about (persistence is the caller's job), and
// every command is answered by running the pure components over it:
//
//   PING                     liveness check
//   PORTFOLIO                calculatePortfolio()
//   PREVIEW_SELL             replayTaxLots() + previewSellAllocation()
//   TAX_LOTS                 replayTaxLots()
//   WASH_SALE                detectWashSale()
//   WOULD_TRIGGER_WASH_SALE  wouldTriggerWashSale() with ledger gains
//   SCREEN_SELL              screenSellForWashSale()
//   REALIZED_GAINS           calculateRealizedGains()
//   UNREALIZED_GAINS         calculatePortfolio() + calculateUnrealizedGains()
//   ANNUAL_REPORT            buildAnnualReport()
//   CLOSED_POSITIONS_EXPORT  closedPositionExportRow() per closed position
//
// Request format:
//   {"command": "REALIZED_GAINS", "transactions": [...], "year": 2024}
// A bare command word ("PING") is accepted as a request without
// parameters.
//
// Response format:
//   {"status": "ok", ...command fields...}
//   {"status": "error", "response": "<message>"}
//
// Thread model:
//   Constructed and destroyed on the main thread. executeCommand() runs on
//   the IPC worker thread (or the test thread). It only reads immutable
//   configuration, the clock (atomic) and prices_ (shared_mutex), so it is
//   safe to call concurrently.
//
// Ownership:
//   PortfolioEngine
//    ├── clock_       (const IClock&, non-owning, must outlive the engine)
//    ├── config_      (EngineConfig, value member)
//    ├── prices_      (StaticPriceSource, value member, seeded from config)
//    └── ipc_server_  (unique_ptr<IpcServer>: created in start())
// -----------------------------------------------------------------------------
class PortfolioEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock   Source of "today" for default report years and sell
  //                 dates. Must outlive this engine.
  // @param  config  Engine settings. An empty command_endpoint means start()
  //                 will not open a socket.
  //
  // @details
  // No thread is spawned and no socket is opened in the constructor.
  // -------------------------------------------------------------------------
  PortfolioEngine(const IClock& clock, EngineConfig config);

  // Destructor calls stop() for RAII safety.
  ~PortfolioEngine();

  PortfolioEngine(const PortfolioEngine&) = delete;
  PortfolioEngine& operator=(const PortfolioEngine&) = delete;
  PortfolioEngine(PortfolioEngine&&) = delete;
  PortfolioEngine& operator=(PortfolioEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Bring the IPC server up or down.
  //
  // @details
  // Both are idempotent. start() propagates zmq::error_t if the endpoint
  // cannot be bound.
  //
  // Thread-safety: Call from one thread only (main).
  // -------------------------------------------------------------------------
  void start();
  void stop();

  bool isRunning() const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one JSON request and returns the JSON response.
  //
  // @details
  // Never throws: malformed JSON, missing fields, unknown commands, invalid
  // dates or method names, and any other std::exception raised while
  // handling all produce a {"status":"error"} response, and the reason is
  // logged to std::cerr.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  // Quote snapshot used for valuation. Callers may refresh it at runtime.
  StaticPriceSource& prices();

  const EngineConfig& config() const;

 private:
  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& request) const;

  nlohmann::json handlePortfolio(const nlohmann::json& request) const;
  nlohmann::json handlePreviewSell(const nlohmann::json& request) const;
  nlohmann::json handleTaxLots(const nlohmann::json& request) const;
  nlohmann::json handleWashSale(const nlohmann::json& request) const;
  nlohmann::json handleWouldTriggerWashSale(
      const nlohmann::json& request) const;
  nlohmann::json handleScreenSell(const nlohmann::json& request) const;
  nlohmann::json handleRealizedGains(const nlohmann::json& request) const;
  nlohmann::json handleUnrealizedGains(const nlohmann::json& request) const;
  nlohmann::json handleAnnualReport(const nlohmann::json& request) const;
  nlohmann::json handleClosedPositionsExport(
      const nlohmann::json& request) const;

  // "method" field of the request, or config_.default_method.
  domain::CostBasisMethod methodFrom(const nlohmann::json& request) const;

  // Request "prices" override, or nullptr to use prices_.
  std::unique_ptr<StaticPriceSource> priceOverrideFrom(
      const nlohmann::json& request) const;

  // "year" field of the request, or the clock's current year.
  int yearFrom(const nlohmann::json& request) const;

  const IClock& clock_;
  EngineConfig config_;
  StaticPriceSource prices_;

  std::unique_ptr<IpcServer> ipc_server_;
  bool running_{false};
};

}  // namespace costbasis
