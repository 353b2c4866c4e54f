#pragma once

#include "costbasis/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace costbasis {

// -------------------------------------------------------------------------
// engineConfigFromJson(j)
// -------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a parsed JSON object.
//
// @details
// Every key is optional; absent keys keep the EngineConfig defaults.
//
//   {
//     "default_method":   "FIFO",
//     "command_endpoint": "tcp://127.0.0.1:5556",
//     "prices":           { "AAPL": 189.5 }
//   }
//
// @throws std::invalid_argument for an unknown method name or for SPECID.
// @throws nlohmann::json::exception for mistyped values.
// -------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// -------------------------------------------------------------------------
// loadEngineConfig(path)
// -------------------------------------------------------------------------
//
// @brief  Reads and parses a JSON config file.
//
// @return std::nullopt when the file cannot be opened or its content is
//         invalid. The reason is logged to std::cerr with a [Config] tag;
//         the caller decides whether to continue with defaults.
// -------------------------------------------------------------------------
std::optional<EngineConfig> loadEngineConfig(const std::string& path);

}  // namespace costbasis
