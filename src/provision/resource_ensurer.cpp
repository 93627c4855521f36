#include "provision/resource_ensurer.hpp"

#include "util/my_logging.hpp"

namespace clusterboot {

namespace {
monad::Error with_identity(const monad::Error &err, const ResourceKey &key,
                           const char *op) {
  return monad::Error{.code = err.code,
                      .what = std::string(op) + " " + key.to_string() +
                              " failed: " + err.what};
}
} // namespace

monad::MyResult<EnsureOutcome> ensure_resource(IResourceStore &store,
                                               const Resource &desired) {
  using Result = monad::MyResult<EnsureOutcome>;
  auto existing = store.get(desired.key);
  if (existing.is_ok()) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << desired.key.to_string() << " already exists";
    return Result::Ok(EnsureOutcome::AlreadyExists);
  }
  if (!is_not_found(existing.error())) {
    return Result::Err(with_identity(existing.error(), desired.key, "get"));
  }

  auto created = store.create(desired);
  if (created.is_ok()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Created " << desired.key.to_string();
    return Result::Ok(EnsureOutcome::Created);
  }
  if (is_already_exists(created.error())) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << desired.key.to_string() << " was created concurrently";
    return Result::Ok(EnsureOutcome::AlreadyExists);
  }
  return Result::Err(with_identity(created.error(), desired.key, "create"));
}

} // namespace clusterboot
