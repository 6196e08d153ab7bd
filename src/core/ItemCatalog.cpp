/* @file ItemCatalog.cpp
 * @brief in-memory and JSON-seeded item catalogs
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Stocktake headers
#include "core/ItemCatalog.hpp"

using namespace stocktake::core;

StaticItemCatalog::StaticItemCatalog(std::map<std::string, std::vector<CatalogItem>> branches)
    : branches_(std::move(branches)) {}

void StaticItemCatalog::setItems(const std::string& branch, std::vector<CatalogItem> items) {
  std::lock_guard<std::mutex> lock(mtx_);
  branches_[branch] = std::move(items);
}

std::vector<CatalogItem> StaticItemCatalog::itemsForBranch(const std::string& branch) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = branches_.find(branch);
  return it == branches_.end() ? std::vector<CatalogItem>{} : it->second;
}

std::shared_ptr<StaticItemCatalog> StaticItemCatalog::fromJson(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("branches") || !j.at("branches").is_object())
    throw std::runtime_error("[ItemCatalog] expected an object with a 'branches' map");

  std::map<std::string, std::vector<CatalogItem>> branches;
  const auto& b = j.at("branches");
  for (auto it = b.begin(); it != b.end(); ++it) {
    if (!it.value().is_array())
      throw std::runtime_error("[ItemCatalog] branch '" + it.key() + "' must list items");
    auto& items = branches[it.key()];
    for (const auto& row : it.value()) {
      try {
        CatalogItem ci;
        ci.itemId = row.at("item").get<std::string>();
        ci.shelf = row.value("shelf", std::string{});
        ci.quantity = row.value("quantity", Quantity{ 0 });
        if (ci.itemId.empty())
          throw std::runtime_error("empty item id");
        items.push_back(std::move(ci));
      } catch (const std::exception& e) {
        throw std::runtime_error("[ItemCatalog] bad item in branch '" + it.key() +
                                 "': " + e.what());
      }
    }
  }
  return std::make_shared<StaticItemCatalog>(std::move(branches));
}
