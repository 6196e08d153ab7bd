#pragma once
/** @file  AccessPolicy.hpp
 *  @brief Answers "may this actor run lifecycle transitions on this branch".
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <map>
#include <set>
#include <string>
#include <utility>

namespace stocktake {
  namespace core {

    /// External identity/authorization source; authentication happens upstream.
    class AccessPolicy {
    public:
      virtual ~AccessPolicy() = default;
      virtual bool mayManage(const std::string& actor, const std::string& branch) const = 0;
    };

    class AllowAllPolicy : public AccessPolicy {
    public:
      bool mayManage(const std::string&, const std::string&) const override { return true; }
    };

    /// Only actors listed for a branch may manage it; unlisted branches are closed.
    class BranchManagerPolicy : public AccessPolicy {
    public:
      explicit BranchManagerPolicy(std::map<std::string, std::set<std::string>> managers)
          : managers_(std::move(managers)) {}

      bool mayManage(const std::string& actor, const std::string& branch) const override {
        auto it = managers_.find(branch);
        return it != managers_.end() && it->second.count(actor) != 0;
      }

    private:
      std::map<std::string, std::set<std::string>> managers_;
    };

  } // namespace core
} // namespace stocktake
