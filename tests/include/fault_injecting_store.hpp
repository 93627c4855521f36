#pragma once

#include <functional>
#include <optional>

#include "my_error_codes.hpp"
#include "store/resource_store.hpp"

namespace testutil {

// Forwards to an inner store and injects failures or interleaved writes.
class FaultInjectingStore : public clusterboot::IResourceStore {
public:
  explicit FaultInjectingStore(clusterboot::IResourceStore &inner)
      : inner_(inner) {}

  monad::MyResult<clusterboot::Resource>
  get(const clusterboot::ResourceKey &key) override {
    ++gets;
    if (fail_gets_with) {
      return monad::MyResult<clusterboot::Resource>::Err(
          clusterboot::store_error(*fail_gets_with, key, "injected get"));
    }
    return inner_.get(key);
  }

  monad::MyResult<clusterboot::Resource>
  create(const clusterboot::Resource &resource) override {
    ++creates;
    if (before_create) {
      before_create(resource);
    }
    if (fail_creates_with) {
      return monad::MyResult<clusterboot::Resource>::Err(
          clusterboot::store_error(*fail_creates_with, resource.key,
                                   "injected create"));
    }
    return inner_.create(resource);
  }

  monad::MyResult<clusterboot::Resource>
  update(const clusterboot::Resource &resource) override {
    ++updates;
    if (before_update) {
      before_update(resource);
    }
    if (conflicts_remaining > 0) {
      --conflicts_remaining;
      return monad::MyResult<clusterboot::Resource>::Err(
          clusterboot::store_error(my_errors::STORE::CONFLICT, resource.key,
                                   "injected conflict"));
    }
    return inner_.update(resource);
  }

  monad::MyResult<std::vector<clusterboot::Resource>>
  list(const std::string &kind, const std::string &ns) override {
    return inner_.list(kind, ns);
  }

  int gets = 0;
  int creates = 0;
  int updates = 0;
  int conflicts_remaining = 0;
  std::optional<int> fail_gets_with;
  std::optional<int> fail_creates_with;
  // Runs before the write is forwarded; lets a test play a concurrent writer.
  std::function<void(const clusterboot::Resource &)> before_create;
  std::function<void(const clusterboot::Resource &)> before_update;

private:
  clusterboot::IResourceStore &inner_;
};

} // namespace testutil
