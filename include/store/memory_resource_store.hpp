#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "store/resource_store.hpp"

namespace clusterboot {

// Thread-safe map-backed store used by --dry-run and the tests.
class InMemoryResourceStore : public IResourceStore {
public:
  monad::MyResult<Resource> get(const ResourceKey &key) override;
  monad::MyResult<Resource> create(const Resource &resource) override;
  monad::MyResult<Resource> update(const Resource &resource) override;
  monad::MyResult<std::vector<Resource>>
  list(const std::string &kind, const std::string &ns) override;

  std::size_t size() const;

private:
  struct Entry {
    json::object object;
    std::uint64_t version{0};
  };

  mutable std::mutex mutex_;
  std::map<ResourceKey, Entry> objects_;
};

} // namespace clusterboot
