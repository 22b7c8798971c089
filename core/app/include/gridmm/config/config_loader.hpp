#pragma once

#include "gridmm/config/grid_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// ConfigLoader — JSON → validated AppConfig
// -----------------------------------------------------------------------------
//
// @brief  Parses the agent's JSON configuration and validates it once.
//
// @details
// Missing optional keys keep the struct defaults; missing required keys
// (accounts[].userid, accounts[].instrument.symbol) and wrong types raise
// ConfigurationError. nlohmann::json exceptions never escape: they are
// rethrown as ConfigurationError with the offending key path in the message.
//
// Thread model: Called once from main() before any thread is started.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static AppConfig loadFile(const std::string& path);

  static AppConfig parse(const std::string& text);

  static AppConfig fromJson(const nlohmann::json& root);

  static GridConfig gridFromJson(const nlohmann::json& j);

 private:
  static AccountConfig accountFromJson(const nlohmann::json& j);
  static RetryPolicy retryFromJson(const nlohmann::json& j);
};

}  // namespace gridmm
