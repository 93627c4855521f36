#include "provision/ingress_provisioner.hpp"

#include "provision/manifests.hpp"
#include "provision/readiness_conditions.hpp"
#include "provision/resource_ensurer.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

monad::MyVoidResult IngressProvisioner::ensure(const Resource &desired) {
  auto r = ensure_resource(ctx_.store, desired);
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << desired.key.to_string() << ": " << r.value();
  return monad::MyVoidResult::Ok();
}

std::vector<ProvisioningStage> IngressProvisioner::stages() {
  const auto &config = ctx_.config;
  const auto &names = ctx_.names();
  std::vector<ProvisioningStage> out;

  out.push_back({.name = "namespaces",
                 .precondition = {},
                 .body = [this, &names] {
                   return ensure(
                       manifests::namespace_resource(names.operator_namespace));
                 }});

  out.push_back({.name = "cluster-issuer",
                 .precondition =
                     [&config]() -> monad::MyResult<bool> {
                   if (config.acme_email.empty()) {
                     BOOST_LOG_SEV(app_logger(), trivial::warning)
                         << "acme_email is not configured, skipping issuer";
                     return monad::MyResult<bool>::Ok(false);
                   }
                   return monad::MyResult<bool>::Ok(true);
                 },
                 .body = [this, &config] {
                   return ensure(manifests::cluster_issuer(config));
                 }});

  out.push_back({.name = "wildcard-certificate",
                 .precondition = {},
                 .body = [this, &config] {
                   return ensure(manifests::wildcard_certificate(config));
                 }});

  out.push_back({.name = "gateway",
                 .precondition = satisfied_now(secret_has_key(
                     ctx_.store, names.operator_namespace,
                     names.certificate_name, "tls.crt")),
                 .body = [this, &config] {
                   return ensure(manifests::gateway(config));
                 }});

  out.push_back({.name = "routes",
                 .precondition = {},
                 .body = [this, &config]() -> monad::MyVoidResult {
                   auto r = ensure(manifests::http_redirect_route(config));
                   if (r.is_err()) {
                     return r;
                   }
                   return ensure(manifests::https_route(config));
                 }});

  out.push_back({.name = "fallback",
                 .precondition = {},
                 .body = [this, &config]() -> monad::MyVoidResult {
                   for (const auto &desired :
                        {manifests::not_found_route(config),
                         manifests::not_found_deployment(config),
                         manifests::not_found_service(config)}) {
                     auto r = ensure(desired);
                     if (r.is_err()) {
                       return r;
                     }
                   }
                   return monad::MyVoidResult::Ok();
                 }});
  return out;
}

monad::MyResult<SequenceReport> IngressProvisioner::provision() {
  if (ctx_.config.domain.empty()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "No domain configured, skipping ingress provisioning";
    return monad::MyResult<SequenceReport>::Ok(SequenceReport{});
  }
  return run_stages("ingress", stages(), ctx_.cancel);
}

} // namespace clusterboot
