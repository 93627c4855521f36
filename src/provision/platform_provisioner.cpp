#include "provision/platform_provisioner.hpp"

#include <boost/url.hpp>

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "provision/kinds.hpp"
#include "provision/manifests.hpp"
#include "provision/resource_ensurer.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

namespace {
constexpr int kSecretWriteAttempts = 5;
}

monad::MyVoidResult PlatformProvisioner::ensure_storage_classes() {
  const auto &names = ctx_.names();
  const std::pair<std::string, int> classes[] = {
      {names.storage_class_replica1, 1},
      {names.storage_class_replica2, 2},
  };
  for (const auto &[name, replicas] : classes) {
    auto r = ensure_resource(ctx_.store, manifests::storage_class(name, replicas));
    if (r.is_err()) {
      return monad::MyVoidResult::Err(r.error());
    }
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "StorageClass " << name << ": " << r.value();
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<std::string> PlatformProvisioner::ensure_webhook_signing_secret() {
  using Result = monad::MyResult<std::string>;
  const auto &names = ctx_.names();
  const ResourceKey key{kinds::kSecret, names.operator_namespace,
                        names.webhook_secret};

  for (int attempt = 1; attempt <= kSecretWriteAttempts; ++attempt) {
    auto current = ctx_.store.get(key);
    if (current.is_err() && !is_not_found(current.error())) {
      return Result::Err(current.error());
    }

    Resource secret;
    if (current.is_ok()) {
      auto existing = secret_value(current.value(), names.webhook_secret_key);
      if (existing.is_err()) {
        return Result::Err(existing.error());
      }
      if (existing.value()) {
        return Result::Ok(*existing.value());
      }
      secret = current.value();
    } else {
      secret = manifests::opaque_secret(names.operator_namespace,
                                        names.webhook_secret);
    }

    auto generated = cryptutil::random_bytes(kWebhookKeySize);
    if (generated.is_err()) {
      return generated;
    }
    set_secret_value(secret, names.webhook_secret_key, generated.value());

    auto written = current.is_ok() ? ctx_.store.update(secret)
                                   : ctx_.store.create(secret);
    if (written.is_ok()) {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Generated webhook signing key in " << key.to_string();
      return Result::Ok(generated.value());
    }
    if (!is_conflict(written.error()) && !is_already_exists(written.error())) {
      return Result::Err(written.error());
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Concurrent write to " << key.to_string() << ", re-reading";
  }
  return Result::Err(monad::Error{
      .code = my_errors::PROVISION::RETRIES_EXHAUSTED,
      .what = key.to_string() + " kept conflicting after " +
              std::to_string(kSecretWriteAttempts) + " attempts"});
}

monad::MyResult<std::string> PlatformProvisioner::webhook_target() const {
  using Result = monad::MyResult<std::string>;
  const std::string &url = ctx_.config.webhook_url;
  if (url.empty()) {
    return Result::Ok(url);
  }
  auto parsed = boost::urls::parse_uri(url);
  if (parsed.has_error() ||
      (parsed.value().scheme() != "http" &&
       parsed.value().scheme() != "https") ||
      parsed.value().host().empty()) {
    return Result::Err(monad::Error{
        .code = my_errors::GENERAL::INVALID_ARGUMENT,
        .what = "webhook_url must be an absolute http(s) URL: " + url});
  }
  return Result::Ok(url);
}

} // namespace clusterboot
