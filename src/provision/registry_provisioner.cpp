#include "provision/registry_provisioner.hpp"

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "openssl/jwks.hpp"
#include "provision/kinds.hpp"
#include "provision/manifests.hpp"
#include "provision/readiness_conditions.hpp"
#include "provision/resource_ensurer.hpp"
#include "provision/rollout_trigger.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

namespace {

// Ok(true) when the secret exists.
monad::MyResult<bool> secret_exists(IResourceStore &store, const std::string &ns,
                                    const std::string &name) {
  auto r = store.get(ResourceKey{kinds::kSecret, ns, name});
  if (r.is_ok()) {
    return monad::MyResult<bool>::Ok(true);
  }
  if (is_not_found(r.error())) {
    return monad::MyResult<bool>::Ok(false);
  }
  return monad::MyResult<bool>::Err(r.error());
}

// Reads a key that a preceding wait has seen populated.
monad::MyResult<std::string> read_secret_key(IResourceStore &store,
                                             const std::string &ns,
                                             const std::string &name,
                                             const std::string &key) {
  using Result = monad::MyResult<std::string>;
  auto secret = store.get(ResourceKey{kinds::kSecret, ns, name});
  if (secret.is_err()) {
    return Result::Err(secret.error());
  }
  auto value = secret_value(secret.value(), key);
  if (value.is_err()) {
    return Result::Err(value.error());
  }
  if (!value.value()) {
    return Result::Err(monad::Error{
        .code = my_errors::GENERAL::MISSING_FIELD,
        .what = "secret " + ns + "/" + name + " has no " + key});
  }
  return Result::Ok(*value.value());
}

} // namespace

monad::MyVoidResult RegistryProvisioner::ensure_registry_credentials() {
  const auto &names = ctx_.names();
  auto waited = require_ready(
      "registry namespace",
      wait_until_ready({namespace_exists(ctx_.store, names.registry_namespace)},
                       ctx_.poll_options(), ctx_.cancel));
  if (waited.is_err()) {
    return waited;
  }

  auto exists =
      secret_exists(ctx_.store, names.registry_namespace, names.registry_auth_secret);
  if (exists.is_err()) {
    return monad::MyVoidResult::Err(exists.error());
  }
  if (exists.value()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Registry credentials secret already present";
    return monad::MyVoidResult::Ok();
  }

  auto raw = cryptutil::random_bytes(kRegistryHttpSecretSize);
  if (raw.is_err()) {
    return monad::MyVoidResult::Err(raw.error());
  }
  auto secret = manifests::opaque_secret(names.registry_namespace,
                                         names.registry_auth_secret);
  // The registry reads http-secret as text; store its base64 form.
  set_secret_value(secret, kRegistryHttpSecretKey,
                   cryptutil::base64_encode(raw.value()));
  auto r = ensure_resource(ctx_.store, secret);
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << secret.key.to_string() << ": " << r.value();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult RegistryProvisioner::ensure_registry_jwks() {
  const auto &names = ctx_.names();
  const auto &ns = names.registry_namespace;
  auto waited = require_ready(
      "registry namespace",
      wait_until_ready({namespace_exists(ctx_.store, ns)}, ctx_.poll_options(),
                       ctx_.cancel));
  if (waited.is_err()) {
    return waited;
  }

  auto exists = secret_exists(ctx_.store, ns, names.registry_jwks_secret);
  if (exists.is_err()) {
    return monad::MyVoidResult::Err(exists.error());
  }
  if (exists.value()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Registry JWKS secret already present";
    return monad::MyVoidResult::Ok();
  }

  auto cert_wait = require_ready(
      "registry signing certificate",
      wait_until_ready({secret_has_key(ctx_.store, ns, names.registry_keys_secret,
                                       "tls.crt")},
                       ctx_.poll_options(), ctx_.cancel));
  if (cert_wait.is_err()) {
    return cert_wait;
  }

  auto pem = read_secret_key(ctx_.store, ns, names.registry_keys_secret, "tls.crt");
  if (pem.is_err()) {
    return monad::MyVoidResult::Err(pem.error());
  }
  auto jwks = jwks::derive_key_set(pem.value(), names.registry_jwks_key_id);
  if (jwks.is_err()) {
    return monad::MyVoidResult::Err(monad::Error{
        .code = jwks.error().code,
        .what = "deriving JWKS from " + ns + "/" + names.registry_keys_secret +
                ": " + jwks.error().what});
  }

  auto secret = manifests::opaque_secret(ns, names.registry_jwks_secret);
  set_secret_value(secret, kJwksKey, jwks.value());
  auto r = ensure_resource(ctx_.store, secret);
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << secret.key.to_string() << ": " << r.value();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult RegistryProvisioner::ensure_registry_ca_in_buildkit() {
  const auto &names = ctx_.names();
  auto waited = require_ready(
      "registry and buildkit namespaces",
      wait_until_ready({namespace_exists(ctx_.store, names.registry_namespace),
                        namespace_exists(ctx_.store, names.buildkit_namespace)},
                       ctx_.poll_options(), ctx_.cancel));
  if (waited.is_err()) {
    return waited;
  }

  auto exists = secret_exists(ctx_.store, names.buildkit_namespace,
                              names.buildkit_ca_secret);
  if (exists.is_err()) {
    return monad::MyVoidResult::Err(exists.error());
  }
  if (exists.value()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Registry CA already present in " << names.buildkit_namespace;
    return monad::MyVoidResult::Ok();
  }

  auto ca_wait = require_ready(
      "registry TLS certificate",
      wait_until_ready({secret_has_key(ctx_.store, names.registry_namespace,
                                       names.registry_tls_secret, "ca.crt")},
                       ctx_.poll_options(), ctx_.cancel));
  if (ca_wait.is_err()) {
    return ca_wait;
  }

  auto ca = read_secret_key(ctx_.store, names.registry_namespace,
                            names.registry_tls_secret, "ca.crt");
  if (ca.is_err()) {
    return monad::MyVoidResult::Err(ca.error());
  }
  auto secret =
      manifests::opaque_secret(names.buildkit_namespace, names.buildkit_ca_secret);
  set_secret_value(secret, "ca.crt", ca.value());
  auto created = ensure_resource(ctx_.store, secret);
  if (created.is_err()) {
    return monad::MyVoidResult::Err(created.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << secret.key.to_string() << ": " << created.value();

  WorkloadRef buildkitd{.ns = names.buildkit_namespace,
                        .name = names.buildkit_deployment};
  auto restarted = trigger_restart_if_changed(ctx_.store, buildkitd,
                                              cryptutil::sha256_hex(ca.value()));
  if (restarted.is_err()) {
    return monad::MyVoidResult::Err(restarted.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << "buildkitd rollout: " << restarted.value();
  return monad::MyVoidResult::Ok();
}

} // namespace clusterboot
