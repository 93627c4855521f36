#include "store/memory_resource_store.hpp"

namespace clusterboot {

monad::MyResult<Resource> InMemoryResourceStore::get(const ResourceKey &key) {
  std::scoped_lock lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end()) {
    return monad::MyResult<Resource>::Err(
        store_error(my_errors::STORE::NOT_FOUND, key, "not found"));
  }
  return monad::MyResult<Resource>::Ok(Resource{
      key, it->second.object, std::to_string(it->second.version)});
}

monad::MyResult<Resource>
InMemoryResourceStore::create(const Resource &resource) {
  std::scoped_lock lock(mutex_);
  auto [it, inserted] =
      objects_.try_emplace(resource.key, Entry{resource.object, 1});
  if (!inserted) {
    return monad::MyResult<Resource>::Err(store_error(
        my_errors::STORE::ALREADY_EXISTS, resource.key, "already exists"));
  }
  return monad::MyResult<Resource>::Ok(
      Resource{resource.key, it->second.object, "1"});
}

monad::MyResult<Resource>
InMemoryResourceStore::update(const Resource &resource) {
  std::scoped_lock lock(mutex_);
  auto it = objects_.find(resource.key);
  if (it == objects_.end()) {
    return monad::MyResult<Resource>::Err(
        store_error(my_errors::STORE::NOT_FOUND, resource.key, "not found"));
  }
  if (!resource.resource_version.empty() &&
      resource.resource_version != std::to_string(it->second.version)) {
    return monad::MyResult<Resource>::Err(store_error(
        my_errors::STORE::CONFLICT, resource.key,
        "resource version " + resource.resource_version + " is stale (now " +
            std::to_string(it->second.version) + ")"));
  }
  it->second.object = resource.object;
  ++it->second.version;
  return monad::MyResult<Resource>::Ok(Resource{
      resource.key, it->second.object, std::to_string(it->second.version)});
}

monad::MyResult<std::vector<Resource>>
InMemoryResourceStore::list(const std::string &kind, const std::string &ns) {
  std::scoped_lock lock(mutex_);
  std::vector<Resource> out;
  for (const auto &[key, entry] : objects_) {
    if (key.kind == kind && (ns.empty() || key.ns == ns)) {
      out.push_back(Resource{key, entry.object, std::to_string(entry.version)});
    }
  }
  return monad::MyResult<std::vector<Resource>>::Ok(std::move(out));
}

std::size_t InMemoryResourceStore::size() const {
  std::scoped_lock lock(mutex_);
  return objects_.size();
}

} // namespace clusterboot
