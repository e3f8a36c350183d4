#include "rule_engine.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/glob.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace datarouter::routing {

namespace {

db::model::RoutingRuleRecord ToRecord(const model::RoutingRule& rule) {
  db::model::RoutingRuleRecord record;
  record.id   = rule.id;
  record.name = rule.name;

  std::vector<std::string> categories;
  categories.reserve(rule.content_categories.size());
  for (auto category : rule.content_categories)
    categories.emplace_back(model::ToString(category));
  record.categories_json = util::EncodeStringList(categories);
  record.patterns_json   = util::EncodeStringList(rule.content_patterns);

  record.min_size_bytes      = rule.min_size_bytes;
  record.max_size_bytes      = rule.max_size_bytes;
  record.preferred_json      = util::EncodeStringList(rule.preferred_backends);
  record.excluded_json       = util::EncodeStringList(rule.excluded_backends);
  record.priority            = static_cast<int32_t>(rule.priority);
  record.strategy            = static_cast<int32_t>(rule.strategy);
  record.custom_factors_json = util::EncodeNumberMap(rule.custom_factors);
  record.wildcard            = rule.wildcard;
  record.active              = rule.active;
  record.created_at_ms       = util::ToUnixMillis(rule.created_at);
  record.updated_at_ms       = util::ToUnixMillis(rule.updated_at);
  return record;
}

model::RoutingRule FromRecord(const db::model::RoutingRuleRecord& record) {
  model::RoutingRule rule;
  rule.id   = record.id;
  rule.name = record.name;

  for (const auto& name : util::DecodeStringList(record.categories_json))
    rule.content_categories.push_back(model::ParseContentCategoryOrThrow(name));
  rule.content_patterns = util::DecodeStringList(record.patterns_json);

  rule.min_size_bytes     = record.min_size_bytes;
  rule.max_size_bytes     = record.max_size_bytes;
  rule.preferred_backends = util::DecodeStringList(record.preferred_json);
  rule.excluded_backends  = util::DecodeStringList(record.excluded_json);
  rule.priority           = model::PriorityFromInt(record.priority);
  rule.strategy           = model::StrategyFromInt(record.strategy);
  rule.custom_factors     = util::DecodeNumberMap(record.custom_factors_json);
  rule.wildcard           = record.wildcard;
  rule.active             = record.active;
  rule.created_at         = util::FromUnixMillis(record.created_at_ms);
  rule.updated_at         = util::FromUnixMillis(record.updated_at_ms);
  return rule;
}

bool EvaluatesBefore(const model::RoutingRule& a, const model::RoutingRule& b) {
  if (a.priority != b.priority) return a.priority > b.priority;
  return a.id < b.id;
}

bool PatternMatches(const std::string& pattern, const std::string& filename) {
  if (util::HasWildcard(pattern)) return util::GlobMatch(pattern, filename);
  return filename.find(pattern) != std::string::npos;
}

} // namespace

RuleEngine::RuleEngine(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void RuleEngine::Load() {
  std::vector<model::RoutingRule> loaded;
  {
    auto tx = repository_->Begin();
    for (const auto& record : repository_->ListRules(*tx))
      loaded.push_back(FromRecord(record));
    tx->Commit();
  }

  std::unique_lock lock(mutex_);
  rules_ = std::move(loaded);
  SortLocked();
  DATAROUTER_LOG_INFO("Routing rules loaded", {observability::IntField("count", static_cast<int64_t>(rules_.size()))});
}

void RuleEngine::Validate(const model::RoutingRule& rule) {
  if (!model::IsValid(rule.priority)) throw util::ValidationError("rule priority out of range");
  if (!model::IsValid(rule.strategy)) throw util::ValidationError("rule strategy out of range");

  if (rule.min_size_bytes && rule.max_size_bytes && *rule.min_size_bytes > *rule.max_size_bytes) {
    throw util::ValidationError("min_size_bytes must not exceed max_size_bytes");
  }

  if (rule.content_categories.empty() && rule.content_patterns.empty() && !rule.wildcard) {
    throw util::ValidationError("rule needs content_categories, content_patterns or wildcard");
  }

  for (const auto& pattern : rule.content_patterns) {
    if (pattern.empty()) throw util::ValidationError("content pattern must not be empty");
  }

  for (const auto& [factor, weight] : rule.custom_factors) {
    if (!model::IsKnownFactor(factor)) throw util::ValidationError("unknown custom factor: " + factor);
    if (!std::isfinite(weight) || weight < 0.0) throw util::ValidationError("custom factor must be a non-negative number: " + factor);
  }
}

bool RuleEngine::Matches(const model::RoutingRule& rule, const model::ContentDescriptor& content) {
  if (!rule.content_categories.empty() &&
      std::find(rule.content_categories.begin(), rule.content_categories.end(), content.category) == rule.content_categories.end()) {
    return false;
  }

  if (!rule.content_patterns.empty()) {
    if (!content.filename) return false;
    const bool any = std::any_of(rule.content_patterns.begin(), rule.content_patterns.end(),
                                 [&](const std::string& pattern) { return PatternMatches(pattern, *content.filename); });
    if (!any) return false;
  }

  if (rule.min_size_bytes && content.size_bytes < *rule.min_size_bytes) return false;
  if (rule.max_size_bytes && content.size_bytes > *rule.max_size_bytes) return false;
  return true;
}

model::RoutingRule RuleEngine::Add(model::RoutingRule rule) {
  Validate(rule);
  if (rule.id.empty()) rule.id = util::GenerateId();
  rule.created_at = util::Now();
  rule.updated_at = rule.created_at;

  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertRule(*tx, ToRecord(rule)), "add rule " + rule.id);
  tx->Commit();

  rules_.push_back(rule);
  SortLocked();

  DATAROUTER_LOG_INFO("Routing rule added", {observability::StringField("rule_id", rule.id),
                                             observability::StringField("strategy", model::ToString(rule.strategy)),
                                             observability::StringField("priority", model::ToString(rule.priority))});
  return rule;
}

bool RuleEngine::Update(const std::string& id, model::RoutingRule rule) {
  Validate(rule);
  rule.id = id;

  std::unique_lock lock(mutex_);
  auto             it = std::find_if(rules_.begin(), rules_.end(), [&](const auto& r) { return r.id == id; });
  if (it == rules_.end()) return false;

  rule.created_at = it->created_at;
  rule.updated_at = util::Now();

  auto tx     = repository_->Begin();
  auto result = repository_->UpdateRule(*tx, ToRecord(rule));
  if (result.code == db::ErrorCode::NotFound) return false;
  db::ThrowIfDbError(result, "update rule " + id);
  tx->Commit();

  *it = std::move(rule);
  SortLocked();

  DATAROUTER_LOG_INFO("Routing rule updated", {observability::StringField("rule_id", id)});
  return true;
}

bool RuleEngine::Delete(const std::string& id) {
  std::unique_lock lock(mutex_);
  auto             tx     = repository_->Begin();
  auto             result = repository_->DeleteRule(*tx, id);
  if (result.code == db::ErrorCode::NotFound) return false;
  db::ThrowIfDbError(result, "delete rule " + id);
  tx->Commit();

  std::erase_if(rules_, [&](const auto& r) { return r.id == id; });
  DATAROUTER_LOG_INFO("Routing rule deleted", {observability::StringField("rule_id", id)});
  return true;
}

std::optional<model::RoutingRule> RuleEngine::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  for (const auto& rule : rules_) {
    if (rule.id == id) return rule;
  }
  return std::nullopt;
}

std::vector<model::RoutingRule> RuleEngine::List() const {
  std::shared_lock lock(mutex_);
  return rules_;
}

std::optional<model::RoutingRule> RuleEngine::Match(const model::ContentDescriptor& content) const {
  std::shared_lock lock(mutex_);
  for (const auto& rule : rules_) {
    if (rule.active && Matches(rule, content)) return rule;
  }
  return std::nullopt;
}

void RuleEngine::SortLocked() {
  std::sort(rules_.begin(), rules_.end(), EvaluatesBefore);
}

} // namespace datarouter::routing
