#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "provision/kinds.hpp"
#include "result_monad.hpp"
#include "store/resource_store.hpp"

namespace clusterboot {

inline constexpr const char kRestartedAtAnnotation[] =
    "kubectl.kubernetes.io/restartedAt";
inline constexpr const char kInputsDigestAnnotation[] =
    "clusterboot.io/inputs-digest";

struct WorkloadRef {
  std::string ns;
  std::string name;
  std::string kind{kinds::kDeployment};

  ResourceKey key() const { return ResourceKey{kind, ns, name}; }
};

enum class RolloutOutcome { Updated, Unchanged, NotFound };

inline std::ostream &operator<<(std::ostream &os, RolloutOutcome o) {
  switch (o) {
  case RolloutOutcome::Updated:
    return os << "updated";
  case RolloutOutcome::Unchanged:
    return os << "unchanged";
  case RolloutOutcome::NotFound:
    return os << "not found";
  }
  return os;
}

using WallClock = std::function<std::chrono::system_clock::time_point()>;

inline std::chrono::system_clock::time_point system_now() {
  return std::chrono::system_clock::now();
}

// RFC3339 marker strictly later than previous: now, or previous + 1s when the
// clock has not moved past it.
std::string next_restart_marker(const std::optional<std::string> &previous,
                                std::chrono::system_clock::time_point now);

// Stamps the restart marker on the pod template. A missing workload is a
// no-op. Conflicting writes are re-read and retried up to max_attempts.
monad::MyResult<RolloutOutcome> trigger_restart(IResourceStore &store,
                                                const WorkloadRef &workload,
                                                const WallClock &clock = system_now,
                                                int max_attempts = 5);

// Restarts only when the recorded inputs digest differs from digest; the
// digest and the marker are written together.
monad::MyResult<RolloutOutcome>
trigger_restart_if_changed(IResourceStore &store, const WorkloadRef &workload,
                           const std::string &digest,
                           const WallClock &clock = system_now,
                           int max_attempts = 5);

} // namespace clusterboot
