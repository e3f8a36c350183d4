#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/priority.hpp"
#include "internal/util/time.hpp"

namespace datarouter::model {

enum class MigrationStatus : std::uint8_t {
  kQueued     = 0,
  kInProgress = 1,
  kCompleted  = 2,
  kFailed     = 3,
  kCancelled  = 4,
};

constexpr bool IsTerminal(MigrationStatus status) {
  return status == MigrationStatus::kCompleted || status == MigrationStatus::kFailed || status == MigrationStatus::kCancelled;
}

/*
  queued -> in_progress -> {completed, failed}
  queued | in_progress -> cancelled
  in_progress -> queued (retry)
*/
constexpr bool CanTransition(MigrationStatus from, MigrationStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case MigrationStatus::kQueued:
      return from == MigrationStatus::kInProgress;
    case MigrationStatus::kInProgress:
      return from == MigrationStatus::kQueued;
    case MigrationStatus::kCompleted:
    case MigrationStatus::kFailed:
      return from == MigrationStatus::kInProgress;
    case MigrationStatus::kCancelled:
      return true;
  }
  return false;
}

constexpr std::string_view ToString(MigrationStatus status) {
  switch (status) {
    case MigrationStatus::kQueued:
      return "queued";
    case MigrationStatus::kInProgress:
      return "in_progress";
    case MigrationStatus::kCompleted:
      return "completed";
    case MigrationStatus::kFailed:
      return "failed";
    case MigrationStatus::kCancelled:
      return "cancelled";
  }
  return "invalid";
}

inline constexpr MigrationStatus kAllStatuses[] = {
    MigrationStatus::kQueued, MigrationStatus::kInProgress, MigrationStatus::kCompleted, MigrationStatus::kFailed, MigrationStatus::kCancelled,
};

// Throws util::ValidationError on unknown names.
MigrationStatus ParseStatus(std::string_view value);
MigrationStatus StatusFromInt(std::int64_t value);

enum class ScheduleMode : std::uint8_t {
  kManual   = 0,
  kPeriodic = 1, // reserved
};

constexpr std::string_view ToString(ScheduleMode mode) {
  return mode == ScheduleMode::kPeriodic ? "periodic" : "manual";
}

ScheduleMode ParseScheduleMode(std::string_view value);

/*
  Selects source items for a policy run. Every set field must match.
*/
struct ContentFilter {
  std::optional<std::string>         type;   // prefix of the item's content_type
  std::optional<std::string>         prefix; // prefix of the content id
  std::map<std::string, std::string> custom; // exact metadata matches
  std::optional<std::uint64_t>       min_size_bytes;
  std::optional<std::uint64_t>       max_size_bytes;
};

struct MigrationPolicy {
  std::string   name;
  std::string   description;
  std::string   source_backend;
  std::string   destination_backend;
  ContentFilter content_filter;
  ScheduleMode  schedule = ScheduleMode::kManual;

  Priority priority         = Priority::kNormal;
  bool     delete_source    = false;
  bool     verify_integrity = false;
  bool     enabled          = true;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> last_run_at;
  std::uint64_t                  run_count           = 0;
  std::uint64_t                  total_tasks_created = 0;
};

struct TaskOptions {
  Priority priority         = Priority::kNormal;
  bool     delete_source    = false;
  bool     verify_integrity = false;
};

struct MigrationTask {
  std::string     id;
  std::string     source_backend;
  std::string     destination_backend;
  std::string     content_id;
  MigrationStatus status = MigrationStatus::kQueued;
  TaskOptions     options;

  std::string batch_id;
  std::string policy_name;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
  // queued tasks are not claimable before this instant (retry backoff)
  util::TimePoint eligible_at{};

  std::string   error;
  std::uint32_t retry_count = 0;

  std::string   destination_content_id;
  std::uint64_t bytes_transferred = 0;
};

struct TaskSpec {
  std::string source_backend;
  std::string destination_backend;
  std::string content_id;
  TaskOptions options;
  std::string batch_id;
  std::string policy_name;
};

struct MigrationBatch {
  std::string              batch_id;
  std::string              policy_name;
  util::TimePoint          created_at{};
  std::vector<std::string> task_ids;
};

struct TaskQuery {
  std::optional<MigrationStatus> status;
  std::optional<std::string>     source_backend;
  std::optional<std::string>     destination_backend;
  std::optional<std::string>     batch_id;
  std::optional<std::string>     policy_name;
  std::size_t                    limit  = 100;
  std::size_t                    offset = 0;
};

struct MigrationSummary {
  std::map<MigrationStatus, std::uint64_t> counts;
  std::uint64_t                            total_tasks          = 0;
  std::uint64_t                            total_bytes_migrated = 0;
  bool                                     executor_running     = false;
};

struct MigrationEstimate {
  std::uint64_t         size_bytes                       = 0;
  std::optional<double> estimated_seconds; // unset when throughput is unknown
  double                transfer_cost                    = 0.0;
  double                destination_monthly_storage_cost = 0.0;
};

} // namespace datarouter::model
