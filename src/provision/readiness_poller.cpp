#include "provision/readiness_poller.hpp"

#include <algorithm>
#include <cstdint>
#include <thread>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace clusterboot {

namespace {
std::vector<std::string>
unmet_names(const std::vector<ReadinessCondition> &conditions,
            const std::vector<bool> &satisfied) {
  std::vector<std::string> names;
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    if (!satisfied[i]) {
      names.push_back(conditions[i].name);
    }
  }
  return names;
}

std::chrono::milliseconds next_interval(std::chrono::milliseconds current,
                                        const PollOptions &options) {
  if (options.backoff_multiplier <= 1.0) {
    return current;
  }
  auto grown = std::chrono::milliseconds(static_cast<std::int64_t>(
      static_cast<double>(current.count()) * options.backoff_multiplier));
  return std::min(grown, std::max(options.max_interval, options.interval));
}
} // namespace

monad::MyResult<WaitResult>
wait_until_ready(const std::vector<ReadinessCondition> &conditions,
                 const PollOptions &options,
                 const CancellationSignal *cancel) {
  using Result = monad::MyResult<WaitResult>;
  using Clock = std::chrono::steady_clock;

  const auto deadline = Clock::now() + options.deadline;
  std::vector<bool> satisfied(conditions.size(), false);
  auto interval = std::max(options.interval, std::chrono::milliseconds(1));
  int round = 0;

  while (true) {
    if (cancel && cancel->cancelled()) {
      return Result::Ok(WaitResult{WaitStatus::Cancelled,
                                   unmet_names(conditions, satisfied)});
    }

    ++round;
    for (std::size_t i = 0; i < conditions.size(); ++i) {
      if (satisfied[i]) {
        continue;
      }
      auto state = conditions[i].probe();
      if (state.is_err()) {
        return Result::Err(monad::Error{
            .code = state.error().code,
            .what = "probe '" + conditions[i].name +
                    "' failed: " + state.error().what});
      }
      if (state.value() == ConditionState::Satisfied) {
        satisfied[i] = true;
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Condition '" << conditions[i].name << "' satisfied";
      }
    }

    auto unmet = unmet_names(conditions, satisfied);
    if (unmet.empty()) {
      return Result::Ok(WaitResult{WaitStatus::Ready, {}});
    }

    auto now = Clock::now();
    if (now >= deadline) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Readiness deadline passed after " << round
          << " rounds, unmet: " << stringutil::join(unmet, ", ");
      return Result::Ok(WaitResult{WaitStatus::TimedOut, std::move(unmet)});
    }

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    // Truncation can leave less than a millisecond.
    if (remaining < std::chrono::milliseconds(1)) {
      remaining = std::chrono::milliseconds(1);
    }
    auto sleep = std::min(interval, remaining);
    BOOST_LOG_SEV(app_logger(), trivial::trace)
        << "Waiting " << sleep.count() << "ms for "
        << stringutil::join(unmet, ", ");
    if (cancel) {
      if (cancel->wait_for(sleep)) {
        return Result::Ok(WaitResult{WaitStatus::Cancelled, std::move(unmet)});
      }
    } else {
      std::this_thread::sleep_for(sleep);
    }
    interval = next_interval(interval, options);
  }
}

monad::MyVoidResult require_ready(const std::string &what,
                                  const monad::MyResult<WaitResult> &result) {
  if (result.is_err()) {
    return monad::MyVoidResult::Err(monad::Error{
        .code = result.error().code,
        .what = what + ": " + result.error().what});
  }
  const auto &wr = result.value();
  switch (wr.status) {
  case WaitStatus::Ready:
    return monad::MyVoidResult::Ok();
  case WaitStatus::Cancelled:
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::PROVISION::CANCELLED,
                     .what = what + ": wait cancelled"});
  case WaitStatus::TimedOut:
    break;
  }
  return monad::MyVoidResult::Err(monad::Error{
      .code = my_errors::PROVISION::DEADLINE_EXCEEDED,
      .what = what + ": deadline exceeded waiting for " +
              stringutil::join(wr.unmet, ", ")});
}

} // namespace clusterboot
