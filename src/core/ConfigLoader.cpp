/* @file ConfigLoader.cpp
 * @brief JSON file reader
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Stocktake headers
#include "core/ConfigLoader.hpp"

using namespace stocktake::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + " is not valid JSON: " + e.what());
  }
}
