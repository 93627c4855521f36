#pragma once

#include <ostream>

#include "result_monad.hpp"
#include "store/resource_store.hpp"

namespace clusterboot {

enum class EnsureOutcome { Created, AlreadyExists };

inline std::ostream &operator<<(std::ostream &os, EnsureOutcome o) {
  return os << (o == EnsureOutcome::Created ? "created" : "already exists");
}

// Get-or-create. An existing object is never modified; losing a create race
// counts as AlreadyExists.
monad::MyResult<EnsureOutcome> ensure_resource(IResourceStore &store,
                                               const Resource &desired);

} // namespace clusterboot
