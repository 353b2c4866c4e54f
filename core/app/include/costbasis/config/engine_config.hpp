#pragma once

#include "costbasis/domain/tax_lot.hpp"

#include <map>
#include <string>

namespace costbasis {

// -----------------------------------------------------------------------------
// EngineConfig: immutable runtime settings of the engine process
// -----------------------------------------------------------------------------
//
// @brief  Value bag read once at startup and passed by value to
//         PortfolioEngine.
//
// @details
//   default_method    Method used by PREVIEW_SELL and TAX_LOTS when a
//                     request names none. Fifo, Lifo or Hifo; SpecId needs
//                     per-request lot ids and cannot be a default.
//   command_endpoint  ZeroMQ REP endpoint. Empty disables the IPC server
//                     (tests drive executeCommand() directly).
//   prices            Current quote snapshot, symbol → price, used for
//                     unrealized gains and annual reports.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::CostBasisMethod default_method{domain::CostBasisMethod::Fifo};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::map<std::string, double> prices;
};

}  // namespace costbasis
