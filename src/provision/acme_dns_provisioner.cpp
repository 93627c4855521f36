#include "provision/acme_dns_provisioner.hpp"

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "provision/account_store.hpp"
#include "provision/kinds.hpp"
#include "provision/manifests.hpp"
#include "provision/readiness_conditions.hpp"
#include "provision/resource_ensurer.hpp"
#include "provision/rollout_trigger.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

monad::MyResult<std::string> AcmeDnsProvisioner::mounted_config_digest() {
  using Result = monad::MyResult<std::string>;
  const ResourceKey key{kinds::kConfigMap, ctx_.names().operator_namespace,
                        ctx_.names().acme_dns_name + "-config"};
  auto config_map = ctx_.store.get(key);
  if (config_map.is_err()) {
    return Result::Err(config_map.error());
  }
  auto text = find_string(config_map.value().object, {"data", "config.cfg"});
  if (!text) {
    return Result::Err(monad::Error{
        .code = my_errors::GENERAL::MISSING_FIELD,
        .what = key.to_string() + " has no config.cfg"});
  }
  return Result::Ok(cryptutil::sha256_hex(*text));
}

monad::MyVoidResult AcmeDnsProvisioner::ensure(const Resource &desired) {
  auto r = ensure_resource(ctx_.store, desired);
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << desired.key.to_string() << ": " << r.value();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult AcmeDnsProvisioner::ensure_deployment() {
  auto mounted = mounted_config_digest();
  if (mounted.is_err()) {
    return monad::MyVoidResult::Err(mounted.error());
  }
  const auto &digest = mounted.value();
  auto created = ensure_resource(
      ctx_.store, manifests::acme_dns_deployment(ctx_.config, digest));
  if (created.is_err()) {
    return monad::MyVoidResult::Err(created.error());
  }
  if (created.value() == EnsureOutcome::Created) {
    BOOST_LOG_SEV(app_logger(), trivial::info) << "Created acme-dns deployment";
    return monad::MyVoidResult::Ok();
  }
  // Existing pods only pick up a replaced config.cfg on restart.
  WorkloadRef ref{.ns = ctx_.names().operator_namespace,
                  .name = ctx_.names().acme_dns_name};
  auto restarted = trigger_restart_if_changed(ctx_.store, ref, digest);
  if (restarted.is_err()) {
    return monad::MyVoidResult::Err(restarted.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << "acme-dns deployment rollout: " << restarted.value();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult AcmeDnsProvisioner::wait_for_server() {
  const auto &names = ctx_.names();
  std::vector<ReadinessCondition> conditions{
      deployment_ready(ctx_.store, names.operator_namespace,
                       names.acme_dns_name),
      service_has_external_address(ctx_.store, names.operator_namespace,
                                   names.acme_dns_name + "-dns"),
  };
  return require_ready(
      "acme-dns readiness",
      wait_until_ready(conditions, ctx_.poll_options(), ctx_.cancel));
}

monad::MyVoidResult AcmeDnsProvisioner::ensure_account() {
  const auto &names = ctx_.names();
  const auto &domain = ctx_.config.domain;
  AccountSecretRef ref{.ns = names.operator_namespace,
                       .name = names.acme_dns_account_secret};

  auto existing = find_account(ctx_.store, ref, domain);
  if (existing.is_err()) {
    return monad::MyVoidResult::Err(existing.error());
  }
  if (existing.value()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "acme-dns account for " << domain << " already stored ("
        << existing.value()->fulldomain << ")";
    return monad::MyVoidResult::Ok();
  }

  auto account =
      registrar_.register_account(ctx_.config.acme_dns.allow_from, ctx_.cancel);
  if (account.is_err()) {
    return monad::MyVoidResult::Err(account.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << "Point _acme-challenge records for " << domain << " at "
      << account.value().fulldomain;
  return sync_account(ctx_.store, ref, domain, account.value());
}

std::vector<ProvisioningStage> AcmeDnsProvisioner::stages() {
  const auto &config = ctx_.config;
  std::vector<ProvisioningStage> out;
  out.push_back({.name = "namespace",
                 .precondition = {},
                 .body = [this] {
                   return ensure(manifests::namespace_resource(
                       ctx_.names().operator_namespace));
                 }});
  out.push_back({.name = "config",
                 .precondition = {},
                 .body = [this, &config] {
                   return ensure(manifests::acme_dns_config_map(config));
                 }});
  out.push_back({.name = "storage",
                 .precondition = {},
                 .body = [this, &config] {
                   return ensure(manifests::acme_dns_pvc(config));
                 }});
  out.push_back({.name = "services",
                 .precondition = {},
                 .body = [this, &config]() -> monad::MyVoidResult {
                   auto r = ensure(manifests::acme_dns_dns_service(config));
                   if (r.is_err()) {
                     return r;
                   }
                   return ensure(manifests::acme_dns_http_service(config));
                 }});
  out.push_back({.name = "deployment",
                 .precondition = {},
                 .body = [this] { return ensure_deployment(); }});
  out.push_back({.name = "readiness",
                 .precondition = {},
                 .body = [this] { return wait_for_server(); }});
  out.push_back({.name = "account",
                 .precondition = {},
                 .body = [this] { return ensure_account(); }});
  // The route attaches to the ingress gateway, which waits for the wildcard
  // certificate.
  out.push_back(
      {.name = "api-route",
       .precondition = satisfied_now(resource_exists(
           ctx_.store, ResourceKey{kinds::kGateway,
                                   ctx_.names().operator_namespace,
                                   ctx_.names().gateway_name})),
       .body = [this, &config] {
         return ensure(manifests::acme_dns_api_route(config));
       }});
  return out;
}

monad::MyResult<SequenceReport> AcmeDnsProvisioner::provision() {
  if (ctx_.config.domain.empty()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "No domain configured, skipping acme-dns provisioning";
    return monad::MyResult<SequenceReport>::Ok(SequenceReport{});
  }
  return run_stages("acme-dns", stages(), ctx_.cancel);
}

} // namespace clusterboot
