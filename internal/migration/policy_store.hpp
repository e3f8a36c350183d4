#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/migration.hpp"

namespace datarouter::migration {

/*
  Migration policy persistence.

  Names are the key. Writes are validated before anything touches the
  repository.
*/
class PolicyStore {
 public:
  explicit PolicyStore(std::shared_ptr<db::Repository> repository);

  // Throws util::ValidationError when invalid or the name is taken.
  model::MigrationPolicy Create(model::MigrationPolicy policy);

  // Run statistics and created_at are kept. Throws util::NotFound.
  model::MigrationPolicy Update(const std::string& name, model::MigrationPolicy policy);

  bool Delete(const std::string& name);

  std::optional<model::MigrationPolicy> Get(const std::string& name);
  std::vector<model::MigrationPolicy>   List();

  void RecordRun(const std::string& name, std::uint64_t tasks_created);

  static void Validate(const model::MigrationPolicy& policy);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace datarouter::migration
