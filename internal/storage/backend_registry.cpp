#include "backend_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace datarouter::storage {

void BackendRegistry::Register(BackendStorePtr store) {
  if (!store) throw std::invalid_argument("backend store must not be null");
  std::unique_lock lock(mutex_);
  stores_[store->Name()] = std::move(store);
}

BackendStorePtr BackendRegistry::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = stores_.find(name);
  if (it == stores_.end()) throw util::NotFound("backend not registered: " + name);
  return it->second;
}

bool BackendRegistry::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return stores_.contains(name);
}

std::vector<std::string> BackendRegistry::Names() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> names;
  names.reserve(stores_.size());
  for (const auto& [name, _] : stores_)
    names.push_back(name);
  return names;
}

} // namespace datarouter::storage
