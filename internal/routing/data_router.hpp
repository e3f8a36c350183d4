#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/routing.hpp"
#include "internal/storage/backend_registry.hpp"
#include "internal/util/errors.hpp"
#include "rule_engine.hpp"
#include "scoring_engine.hpp"

namespace datarouter::routing {

struct RouterDefaults {
  model::RoutingStrategy strategy = model::RoutingStrategy::kBalanced;
  model::Priority        priority = model::Priority::kNormal;
};

struct RouteOptions {
  std::optional<model::RoutingStrategy> strategy;
  std::optional<model::Priority>        priority;
  std::optional<model::GeoPoint>        client_location;
  // bypasses rule matching and scoring
  std::optional<std::string> backend;
};

struct StoreResult {
  bool            success = false;
  std::string     backend;
  std::string     content_id;
  util::ErrorKind error_kind = util::ErrorKind::kOk;
  std::string     error;
};

struct RouteResult {
  model::RoutingDecision decision;
  StoreResult            store;
};

/*
  Composes analysis, rule matching and scoring into a RoutingDecision.

  A matched rule's strategy and priority win; otherwise the caller's
  values, otherwise RouterDefaults.

  Route() performs exactly one store call on the selected backend. A
  failed store is reported in RouteResult::store and is never retried on
  another backend.
*/
class DataRouter {
 public:
  DataRouter(std::shared_ptr<RuleEngine> rules, std::shared_ptr<ScoringEngine> scoring, std::shared_ptr<storage::BackendRegistry> backends,
             RouterDefaults defaults = {});

  // No side effects. Throws util::NoEligibleBackend.
  model::RoutingDecision Analyze(std::string_view content, const model::Metadata& metadata, const RouteOptions& options) const;

  // Throws util::NoEligibleBackend, or util::NotFound for an unknown override backend.
  RouteResult Route(const std::string& content, const model::Metadata& metadata, const RouteOptions& options);

 private:
  std::shared_ptr<RuleEngine>               rules_;
  std::shared_ptr<ScoringEngine>            scoring_;
  std::shared_ptr<storage::BackendRegistry> backends_;
  RouterDefaults                            defaults_;
};

} // namespace datarouter::routing
