#pragma once
/** @file  Errors.hpp
 *  @brief Error taxonomy thrown across the engine.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Stocktake headers
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      ValidationError,
      InvalidTransition,
      SessionNotActive,
      LockHeld,
      LockNotHeld,
      CounterNotAllowed,
      ItemNotAssigned,
      NotFound,
      IncompleteItems,
      PermissionDenied,
      Storage,
    };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::ValidationError:
        return "ValidationError";
      case ErrorKind::InvalidTransition:
        return "InvalidTransition";
      case ErrorKind::SessionNotActive:
        return "SessionNotActive";
      case ErrorKind::LockHeld:
        return "LockHeld";
      case ErrorKind::LockNotHeld:
        return "LockNotHeld";
      case ErrorKind::CounterNotAllowed:
        return "CounterNotAllowed";
      case ErrorKind::ItemNotAssigned:
        return "ItemNotAssigned";
      case ErrorKind::NotFound:
        return "NotFound";
      case ErrorKind::IncompleteItems:
        return "IncompleteItems";
      case ErrorKind::PermissionDenied:
        return "PermissionDenied";
      case ErrorKind::Storage:
        return "Storage";
      default:
        return "Unknown";
      }
    }

    /**
 * @class StockTakeError
 * @brief Every request-level failure; the kind tells polling clients whether to retry.
 *
 *  * `LockHeld` / `LockNotHeld` are contention, the rest are caller or lifecycle errors.
 *  * `IncompleteItems` carries the uncounted item ids.
 */
    class StockTakeError : public std::runtime_error {
    public:
      StockTakeError(ErrorKind kind, const std::string& message,
                     std::vector<ItemId> missingItems = {})
          : std::runtime_error(message), kind_{ kind }, missing_{ std::move(missingItems) } {}

      ErrorKind kind() const noexcept { return kind_; }
      const std::vector<ItemId>& missingItems() const noexcept { return missing_; }

    private:
      ErrorKind kind_;
      std::vector<ItemId> missing_;
    };

  } // namespace core
} // namespace stocktake
