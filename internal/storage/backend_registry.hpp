#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "backend_store.hpp"

namespace datarouter::storage {

/*
  Name -> BackendStore. Built once at startup, read concurrently after.
*/
class BackendRegistry {
 public:
  // Replaces any store registered under the same name.
  void Register(BackendStorePtr store);

  // Throws util::NotFound.
  BackendStorePtr Get(const std::string& name) const;

  bool Contains(const std::string& name) const;

  // Sorted.
  std::vector<std::string> Names() const;

 private:
  mutable std::shared_mutex              mutex_;
  std::map<std::string, BackendStorePtr> stores_;
};

} // namespace datarouter::storage
