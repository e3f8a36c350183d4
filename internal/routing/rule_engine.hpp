#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/routing.hpp"

namespace datarouter::routing {

/*
  Routing rule registry and matcher.

  The repository is the source of truth; an in-memory copy sorted in
  evaluation order (priority desc, id asc) serves Match(). Match takes a
  shared lock, CRUD takes the exclusive lock for the duration of the
  repository write so the cache never diverges from committed state.
*/
class RuleEngine {
 public:
  explicit RuleEngine(std::shared_ptr<db::Repository> repository);

  // Rebuild the cache from the repository.
  void Load();

  // Generates an id when empty. Throws util::ValidationError on invalid
  // rules or an id that is already taken.
  model::RoutingRule Add(model::RoutingRule rule);

  // False when no rule has this id. Throws util::ValidationError.
  bool Update(const std::string& id, model::RoutingRule rule);

  bool Delete(const std::string& id);

  std::optional<model::RoutingRule> Get(const std::string& id) const;

  // In evaluation order.
  std::vector<model::RoutingRule> List() const;

  // First active rule that matches, if any.
  std::optional<model::RoutingRule> Match(const model::ContentDescriptor& content) const;

  static void Validate(const model::RoutingRule& rule);
  static bool Matches(const model::RoutingRule& rule, const model::ContentDescriptor& content);

 private:
  void SortLocked();

  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex       mutex_;
  std::vector<model::RoutingRule> rules_;
};

} // namespace datarouter::routing
