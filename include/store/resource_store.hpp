#pragma once

#include <string>
#include <vector>

#include "my_error_codes.hpp"
#include "result_monad.hpp"
#include "store/resource.hpp"

namespace clusterboot {

// Declarative object store. Errors use my_errors::STORE codes.
class IResourceStore {
public:
  virtual ~IResourceStore() = default;

  // Err(STORE::NOT_FOUND) when absent.
  virtual monad::MyResult<Resource> get(const ResourceKey &key) = 0;

  // Err(STORE::ALREADY_EXISTS) when the key is taken. Returns the stored copy
  // with its resource version.
  virtual monad::MyResult<Resource> create(const Resource &resource) = 0;

  // Non-empty resource_version makes the write conditional:
  // Err(STORE::CONFLICT) if it no longer matches. Err(STORE::NOT_FOUND) when
  // absent.
  virtual monad::MyResult<Resource> update(const Resource &resource) = 0;

  // Empty ns lists across namespaces.
  virtual monad::MyResult<std::vector<Resource>>
  list(const std::string &kind, const std::string &ns) = 0;
};

inline bool is_not_found(const monad::Error &err) {
  return err.code == my_errors::STORE::NOT_FOUND;
}

inline bool is_already_exists(const monad::Error &err) {
  return err.code == my_errors::STORE::ALREADY_EXISTS;
}

inline bool is_conflict(const monad::Error &err) {
  return err.code == my_errors::STORE::CONFLICT;
}

inline monad::Error store_error(int code, const ResourceKey &key,
                                const std::string &detail) {
  return monad::Error{.code = code, .what = key.to_string() + ": " + detail};
}

} // namespace clusterboot
