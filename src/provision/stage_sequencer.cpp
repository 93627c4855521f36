#include "provision/stage_sequencer.hpp"

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

monad::MyResult<SequenceReport>
run_stages(const std::string &sequence,
           const std::vector<ProvisioningStage> &stages,
           const CancellationSignal *cancel) {
  using Result = monad::MyResult<SequenceReport>;
  SequenceReport report;
  for (const auto &stage : stages) {
    if (cancel && cancel->cancelled()) {
      return Result::Err(monad::Error{
          .code = my_errors::PROVISION::CANCELLED,
          .what = sequence + ": cancelled before stage '" + stage.name + "'"});
    }

    if (stage.precondition) {
      auto ready = stage.precondition();
      if (ready.is_err()) {
        return Result::Err(monad::Error{
            .code = ready.error().code,
            .what = sequence + "/" + stage.name +
                    ": precondition failed: " + ready.error().what});
      }
      if (!ready.value()) {
        BOOST_LOG_SEV(app_logger(), trivial::info)
            << sequence << ": stage '" << stage.name
            << "' deferred, prerequisite not ready yet";
        report.deferred_at = stage.name;
        return Result::Ok(std::move(report));
      }
    }

    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << sequence << ": running stage '" << stage.name << "'";
    auto r = stage.body();
    if (r.is_err()) {
      return Result::Err(monad::Error{
          .code = r.error().code,
          .what = sequence + "/" + stage.name + ": " + r.error().what});
    }
    report.completed.push_back(stage.name);
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << sequence << ": all " << report.completed.size()
      << " stages completed";
  return Result::Ok(std::move(report));
}

} // namespace clusterboot
