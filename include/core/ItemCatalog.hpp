#pragma once
/** @file  ItemCatalog.hpp
 *  @brief Source of baseline (system) quantities for a branch.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

// Stocktake headers
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /**
 * @class ItemCatalog
 * @brief External collaborator queried once per session, when it starts
 *        without an explicit item list.
 */
    class ItemCatalog {
    public:
      virtual ~ItemCatalog() = default;
      virtual std::vector<CatalogItem> itemsForBranch(const std::string& branch) const = 0;
    };

    /// Catalog held in memory; tests and embedders fill it directly.
    class StaticItemCatalog : public ItemCatalog {
    public:
      StaticItemCatalog() = default;
      explicit StaticItemCatalog(std::map<std::string, std::vector<CatalogItem>> branches);

      void setItems(const std::string& branch, std::vector<CatalogItem> items);
      std::vector<CatalogItem> itemsForBranch(const std::string& branch) const override;

      /// Parses `{"branches": {"<branch>": [{"item": "", "shelf": "", "quantity": 0}]}}`.
      static std::shared_ptr<StaticItemCatalog> fromJson(const nlohmann::json& j);

    private:
      mutable std::mutex mtx_;
      std::map<std::string, std::vector<CatalogItem>> branches_;
    };

  } // namespace core
} // namespace stocktake
