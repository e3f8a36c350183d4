#include "routing_service.hpp"

#include "internal/metrics/backend_metrics_store.hpp"
#include "internal/metrics/metrics_collector.hpp"
#include "internal/routing/rule_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe.hpp"

namespace datarouter::service {

using detail::Observe;

RoutingService::RoutingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

OperationResult<model::RoutingDecision> RoutingService::Analyze(const std::string& content, const model::Metadata& metadata,
                                                                const routing::RouteOptions& options) {
  return Observe("RoutingService.Analyze", [&] { return ctx_.router->Analyze(content, metadata, options); });
}

OperationResult<routing::RouteResult> RoutingService::Route(const std::string& content, const model::Metadata& metadata,
                                                            const routing::RouteOptions& options) {
  return Observe("RoutingService.Route", [&] { return ctx_.router->Route(content, metadata, options); });
}

OperationResult<std::vector<model::RoutingRule>> RoutingService::ListRules() {
  return Observe("RoutingService.ListRules", [&] { return ctx_.rules->List(); });
}

OperationResult<model::RoutingRule> RoutingService::GetRule(const std::string& id) {
  return Observe("RoutingService.GetRule", [&] {
    auto rule = ctx_.rules->Get(id);
    if (!rule) throw util::NotFound("rule not found: " + id);
    return *rule;
  });
}

OperationResult<model::RoutingRule> RoutingService::CreateRule(const model::RoutingRule& rule) {
  return Observe("RoutingService.CreateRule", [&] { return ctx_.rules->Add(rule); });
}

OperationResult<bool> RoutingService::UpdateRule(const std::string& id, const model::RoutingRule& rule) {
  return Observe("RoutingService.UpdateRule", [&] { return ctx_.rules->Update(id, rule); });
}

OperationResult<bool> RoutingService::DeleteRule(const std::string& id) {
  return Observe("RoutingService.DeleteRule", [&] { return ctx_.rules->Delete(id); });
}

OperationResult<model::BackendMetrics> RoutingService::GetMetrics(const std::string& backend) {
  return Observe("RoutingService.GetMetrics", [&] { return ctx_.metrics->Get(backend); });
}

OperationResult<std::map<std::string, model::BackendMetrics>> RoutingService::GetAllMetrics() {
  return Observe("RoutingService.GetAllMetrics", [&] { return ctx_.metrics->GetAll(); });
}

OperationResult<model::BackendMetrics> RoutingService::UpdateMetrics(const std::string& backend, const model::BackendMetrics& metrics) {
  return Observe("RoutingService.UpdateMetrics", [&] {
    ctx_.metrics->Update(backend, metrics);
    return ctx_.metrics->Get(backend);
  });
}

OperationResult<std::map<std::string, model::BackendMetrics>> RoutingService::CollectMetrics() {
  return Observe("RoutingService.CollectMetrics", [&] {
    if (!ctx_.collector) throw util::InvalidState("metrics collection is not configured");
    return ctx_.collector->Collect();
  });
}

} // namespace datarouter::service
