#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "result_monad.hpp"
#include "util/cancellation.hpp"

namespace clusterboot {

struct ProvisioningStage {
  std::string name;
  // Empty means always satisfied. Ok(false) defers this and later stages.
  std::function<monad::MyResult<bool>()> precondition;
  std::function<monad::MyVoidResult()> body;
};

struct SequenceReport {
  std::vector<std::string> completed;
  // Stage whose precondition was unmet, if any.
  std::optional<std::string> deferred_at;

  bool finished() const { return !deferred_at.has_value(); }
};

// Runs stages in order. An unmet precondition ends the run successfully;
// errors carry the sequence and stage name.
monad::MyResult<SequenceReport>
run_stages(const std::string &sequence,
           const std::vector<ProvisioningStage> &stages,
           const CancellationSignal *cancel = nullptr);

} // namespace clusterboot
