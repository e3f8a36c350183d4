#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/model/backend_metrics.hpp"
#include "internal/model/routing.hpp"
#include "internal/routing/data_router.hpp"
#include "operation_result.hpp"
#include "service_context.hpp"

namespace datarouter::service {

/*
  routing.* operations.
  Every call returns a structured result; nothing throws.
*/
class RoutingService {
 public:
  explicit RoutingService(ServiceContext ctx);

  OperationResult<model::RoutingDecision> Analyze(const std::string& content, const model::Metadata& metadata, const routing::RouteOptions& options);
  OperationResult<routing::RouteResult>   Route(const std::string& content, const model::Metadata& metadata, const routing::RouteOptions& options);

  OperationResult<std::vector<model::RoutingRule>> ListRules();
  OperationResult<model::RoutingRule>              GetRule(const std::string& id);
  OperationResult<model::RoutingRule>              CreateRule(const model::RoutingRule& rule);
  OperationResult<bool>                            UpdateRule(const std::string& id, const model::RoutingRule& rule);
  OperationResult<bool>                            DeleteRule(const std::string& id);

  OperationResult<model::BackendMetrics>                        GetMetrics(const std::string& backend);
  OperationResult<std::map<std::string, model::BackendMetrics>> GetAllMetrics();
  OperationResult<model::BackendMetrics>                        UpdateMetrics(const std::string& backend, const model::BackendMetrics& metrics);
  // Pulls a fresh snapshot from the metrics source now.
  OperationResult<std::map<std::string, model::BackendMetrics>> CollectMetrics();

 private:
  ServiceContext ctx_;
};

} // namespace datarouter::service
