#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "conf/bootstrap_config.hpp"
#include "result_monad.hpp"
#include "util/cancellation.hpp"

namespace clusterboot {

enum class ConditionState { NotFound, Pending, Satisfied };

struct ReadinessCondition {
  std::string name;
  // NotFound and Pending are states, not errors. Err aborts the wait.
  std::function<monad::MyResult<ConditionState>()> probe;
};

struct PollOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
  std::chrono::milliseconds deadline{std::chrono::minutes(5)};
  // 1.0 keeps a fixed interval; larger values grow it up to max_interval.
  double backoff_multiplier{1.0};
  std::chrono::milliseconds max_interval{std::chrono::seconds(30)};

  static PollOptions from_config(const PollingConfig &polling) {
    return PollOptions{
        .interval = polling.interval,
        .deadline = polling.deadline,
        .backoff_multiplier = polling.backoff_multiplier,
        .max_interval = polling.max_interval,
    };
  }
};

enum class WaitStatus { Ready, TimedOut, Cancelled };

struct WaitResult {
  WaitStatus status{WaitStatus::Ready};
  // Names of the conditions not yet satisfied, in input order.
  std::vector<std::string> unmet;

  bool ready() const { return status == WaitStatus::Ready; }
};

// Polls every unmet condition once per interval. Satisfied conditions are
// latched. TimedOut is only reported once the deadline has passed.
monad::MyResult<WaitResult>
wait_until_ready(const std::vector<ReadinessCondition> &conditions,
                 const PollOptions &options,
                 const CancellationSignal *cancel = nullptr);

// TimedOut -> PROVISION::DEADLINE_EXCEEDED, Cancelled -> PROVISION::CANCELLED.
monad::MyVoidResult require_ready(const std::string &what,
                                  const monad::MyResult<WaitResult> &result);

} // namespace clusterboot
