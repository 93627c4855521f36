#include "provision/rollout_trigger.hpp"

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace clusterboot {

namespace {

// mutate returns false when nothing needs writing.
monad::MyResult<RolloutOutcome>
update_workload(IResourceStore &store, const WorkloadRef &workload,
                int max_attempts,
                const std::function<bool(json::object &)> &mutate) {
  using Result = monad::MyResult<RolloutOutcome>;
  const auto key = workload.key();
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto current = store.get(key);
    if (current.is_err()) {
      if (is_not_found(current.error())) {
        BOOST_LOG_SEV(app_logger(), trivial::info)
            << key.to_string() << " not found, skipping restart";
        return Result::Ok(RolloutOutcome::NotFound);
      }
      return Result::Err(current.error());
    }
    Resource updated = current.value();
    if (!mutate(updated.object)) {
      return Result::Ok(RolloutOutcome::Unchanged);
    }
    auto written = store.update(updated);
    if (written.is_ok()) {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Triggered rollout restart of " << key.to_string();
      return Result::Ok(RolloutOutcome::Updated);
    }
    if (is_not_found(written.error())) {
      return Result::Ok(RolloutOutcome::NotFound);
    }
    if (!is_conflict(written.error())) {
      return Result::Err(written.error());
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Conflict restarting " << key.to_string() << " (attempt "
        << attempt << "/" << max_attempts << ")";
  }
  return Result::Err(monad::Error{
      .code = my_errors::PROVISION::RETRIES_EXHAUSTED,
      .what = "restart of " + key.to_string() + " kept conflicting after " +
              std::to_string(max_attempts) + " attempts"});
}

} // namespace

std::string next_restart_marker(const std::optional<std::string> &previous,
                                std::chrono::system_clock::time_point now) {
  auto now_s = std::chrono::floor<std::chrono::seconds>(now);
  if (previous) {
    if (auto prev = stringutil::parse_rfc3339(*previous)) {
      auto prev_s = std::chrono::floor<std::chrono::seconds>(*prev);
      if (now_s <= prev_s) {
        return stringutil::format_rfc3339(prev_s + std::chrono::seconds(1));
      }
    }
  }
  return stringutil::format_rfc3339(now_s);
}

monad::MyResult<RolloutOutcome> trigger_restart(IResourceStore &store,
                                                const WorkloadRef &workload,
                                                const WallClock &clock,
                                                int max_attempts) {
  return update_workload(store, workload, max_attempts,
                         [&clock](json::object &obj) {
                           auto previous =
                               template_annotation(obj, kRestartedAtAnnotation);
                           set_template_annotation(
                               obj, kRestartedAtAnnotation,
                               next_restart_marker(previous, clock()));
                           return true;
                         });
}

monad::MyResult<RolloutOutcome>
trigger_restart_if_changed(IResourceStore &store, const WorkloadRef &workload,
                           const std::string &digest, const WallClock &clock,
                           int max_attempts) {
  return update_workload(
      store, workload, max_attempts, [&clock, &digest](json::object &obj) {
        if (template_annotation(obj, kInputsDigestAnnotation) == digest) {
          return false;
        }
        auto previous = template_annotation(obj, kRestartedAtAnnotation);
        set_template_annotation(obj, kRestartedAtAnnotation,
                                next_restart_marker(previous, clock()));
        set_template_annotation(obj, kInputsDigestAnnotation, digest);
        return true;
      });
}

} // namespace clusterboot
