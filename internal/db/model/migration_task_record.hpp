#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace datarouter::db::model {

/*
  Persisted migration task.

  seq is assigned by the repository on insert and gives a strict
  creation order for FIFO-within-priority claiming.
*/
struct MigrationTaskRecord {
  std::string id;
  uint64_t    seq = 0;

  std::string source_backend;
  std::string destination_backend;
  std::string content_id;

  int32_t status   = 0;
  int32_t priority = 1;
  bool    delete_source    = false;
  bool    verify_integrity = false;

  std::string batch_id;
  std::string policy_name;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> started_at_ms;
  std::optional<uint64_t> completed_at_ms;
  uint64_t                eligible_at_ms = 0;

  std::string error;
  uint32_t    retry_count = 0;

  std::string destination_content_id;
  uint64_t    bytes_transferred = 0;
};

} // namespace datarouter::db::model
