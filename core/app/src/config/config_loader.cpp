#include "costbasis/config/config_loader.hpp"
#include "costbasis/domain/transaction.hpp"
#include "costbasis/lots/tax_lot_allocator.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace costbasis {

// -----------------------------------------------------------------------------
// engineConfigFromJson
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  EngineConfig config;

  if (j.contains("default_method")) {
    const auto name = j.at("default_method").get<std::string>();
    auto method = parseCostBasisMethod(name);
    if (!method) {
      throw std::invalid_argument("Unknown cost basis method: " + name);
    }
    if (*method == domain::CostBasisMethod::SpecId) {
      throw std::invalid_argument(
          "SPECID cannot be the default method; it needs lot ids per sale");
    }
    config.default_method = *method;
  }

  if (j.contains("command_endpoint")) {
    config.command_endpoint = j.at("command_endpoint").get<std::string>();
  }

  if (j.contains("prices")) {
    const auto& prices = j.at("prices");
    if (!prices.is_object()) {
      throw std::invalid_argument("'prices' must be an object");
    }
    for (const auto& item : prices.items()) {
      config.prices[domain::normalizeSymbol(item.key())] =
          item.value().get<double>();
    }
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
std::optional<EngineConfig> loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[Config] WARNING: cannot open " << path << "\n";
    return std::nullopt;
  }

  try {
    const auto j = nlohmann::json::parse(in);
    auto config = engineConfigFromJson(j);
    std::cout << "[Config] loaded " << path << " (method="
              << costBasisMethodToString(config.default_method)
              << ", prices=" << config.prices.size() << ")\n";
    return config;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Config] ERROR: malformed " << path << ": " << e.what()
              << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[Config] ERROR: invalid " << path << ": " << e.what()
              << "\n";
  }
  return std::nullopt;
}

}  // namespace costbasis
