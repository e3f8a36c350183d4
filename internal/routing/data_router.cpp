#include "data_router.hpp"

#include "internal/analysis/content_analyzer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/error_kind.hpp"

namespace datarouter::routing {

DataRouter::DataRouter(std::shared_ptr<RuleEngine> rules, std::shared_ptr<ScoringEngine> scoring,
                       std::shared_ptr<storage::BackendRegistry> backends, RouterDefaults defaults)
    : rules_(std::move(rules)), scoring_(std::move(scoring)), backends_(std::move(backends)), defaults_(defaults) {
}

namespace {

void ValidateOptions(const RouteOptions& options) {
  if (options.client_location && !model::IsValid(*options.client_location)) {
    throw util::ValidationError("client_location coordinates out of range");
  }
}

} // namespace

model::RoutingDecision DataRouter::Analyze(std::string_view content, const model::Metadata& metadata, const RouteOptions& options) const {
  ValidateOptions(options);
  model::RoutingDecision decision;
  decision.content = analysis::ContentAnalyzer::Analyze(content, metadata);

  const auto rule = rules_->Match(decision.content);
  if (rule) {
    decision.matched_rule_id = rule->id;
    decision.strategy        = rule->strategy;
    decision.priority        = rule->priority;
  } else {
    decision.strategy = options.strategy.value_or(defaults_.strategy);
    decision.priority = options.priority.value_or(defaults_.priority);
  }

  static const std::map<std::string, double> kNoCustomFactors;
  decision.weights = ScoringEngine::WeightsFor(decision.strategy, decision.priority, rule ? rule->custom_factors : kNoCustomFactors);

  const auto candidates = scoring_->Candidates(rule);
  if (candidates.empty()) {
    throw util::NoEligibleBackend(rule ? "no eligible backend for rule " + rule->id : "no backends with metrics");
  }

  decision.scores           = scoring_->Score(candidates, decision.weights, options.client_location);
  decision.selected_backend = decision.scores.front().backend;

  observability::Metrics::Instance().RecordRoutingDecision(decision.selected_backend, model::ToString(decision.strategy));
  DATAROUTER_LOG_INFO("Routing decision",
                      {observability::StringField("backend", decision.selected_backend),
                       observability::StringField("strategy", model::ToString(decision.strategy)),
                       observability::StringField("category", model::ToString(decision.content.category)),
                       observability::StringField("rule_id", decision.matched_rule_id.value_or("")),
                       observability::DoubleField("score", decision.scores.front().score)});
  return decision;
}

RouteResult DataRouter::Route(const std::string& content, const model::Metadata& metadata, const RouteOptions& options) {
  ValidateOptions(options);
  RouteResult result;

  if (options.backend) {
    // validates the name before any store call
    backends_->Get(*options.backend);

    result.decision.content          = analysis::ContentAnalyzer::Analyze(content, metadata);
    result.decision.selected_backend = *options.backend;
    result.decision.backend_override = true;
    result.decision.strategy         = options.strategy.value_or(defaults_.strategy);
    result.decision.priority         = options.priority.value_or(defaults_.priority);
  } else {
    result.decision = Analyze(content, metadata, options);
  }

  result.store.backend = result.decision.selected_backend;
  try {
    auto store              = backends_->Get(result.decision.selected_backend);
    result.store.content_id = store->Add(content, metadata);
    result.store.success    = true;
  } catch (const std::exception& e) {
    result.store.error_kind = util::KindOf(e);
    if (result.store.error_kind == util::ErrorKind::kInternal) result.store.error_kind = util::ErrorKind::kBackendUnavailable;
    result.store.error = e.what();
    DATAROUTER_LOG_WARN("Store failed", {observability::StringField("backend", result.store.backend),
                                         observability::StringField("error", e.what())});
  }
  return result;
}

} // namespace datarouter::routing
