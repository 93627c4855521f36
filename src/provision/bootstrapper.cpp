#include "provision/bootstrapper.hpp"

#include "my_error_codes.hpp"
#include "provision/acme_dns_provisioner.hpp"
#include "provision/ingress_provisioner.hpp"
#include "provision/platform_provisioner.hpp"
#include "provision/registry_provisioner.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace clusterboot {

namespace {
monad::MyVoidResult drop_report(const monad::MyResult<SequenceReport> &r) {
  if (r.is_err()) {
    return monad::MyVoidResult::Err(r.error());
  }
  if (!r.value().finished()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Deferred at stage '" << *r.value().deferred_at
        << "', will continue on a later run";
  }
  return monad::MyVoidResult::Ok();
}
} // namespace

std::vector<BootstrapStep> Bootstrapper::steps() {
  std::vector<BootstrapStep> out;
  out.push_back({"storage classes", [this] {
                   return PlatformProvisioner(ctx_).ensure_storage_classes();
                 }});
  out.push_back({"ingress", [this] {
                   return drop_report(IngressProvisioner(ctx_).provision());
                 }});
  if (ctx_.config.acme_dns.enabled) {
    out.push_back({"acme-dns", [this] {
                     return drop_report(
                         AcmeDnsProvisioner(ctx_, registrar_).provision());
                   }});
  }
  out.push_back({"registry credentials", [this] {
                   return RegistryProvisioner(ctx_).ensure_registry_credentials();
                 }});
  out.push_back({"registry jwks", [this] {
                   return RegistryProvisioner(ctx_).ensure_registry_jwks();
                 }});
  out.push_back({"buildkit registry ca", [this] {
                   return RegistryProvisioner(ctx_)
                       .ensure_registry_ca_in_buildkit();
                 }});
  out.push_back({"webhook signing secret", [this]() -> monad::MyVoidResult {
                   PlatformProvisioner platform(ctx_);
                   auto target = platform.webhook_target();
                   if (target.is_err()) {
                     return monad::MyVoidResult::Err(target.error());
                   }
                   auto key = platform.ensure_webhook_signing_secret();
                   if (key.is_err()) {
                     return monad::MyVoidResult::Err(key.error());
                   }
                   if (target.value().empty()) {
                     BOOST_LOG_SEV(app_logger(), trivial::warning)
                         << "webhook_url not set, notifications disabled";
                   } else {
                     BOOST_LOG_SEV(app_logger(), trivial::info)
                         << "Webhook notifications go to " << target.value();
                   }
                   return monad::MyVoidResult::Ok();
                 }});
  return out;
}

monad::MyVoidResult Bootstrapper::run() {
  auto all = steps();
  std::vector<std::string> failed;
  for (std::size_t i = 0; i < all.size(); ++i) {
    const auto &step = all[i];
    if (ctx_.cancel && ctx_.cancel->cancelled()) {
      return monad::MyVoidResult::Err(monad::Error{
          .code = my_errors::PROVISION::CANCELLED,
          .what = "bootstrap cancelled before step '" + step.name + "'"});
    }
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Bootstrap step " << (i + 1) << "/" << all.size() << ": "
        << step.name;
    auto r = step.run();
    if (r.is_ok()) {
      continue;
    }
    if (r.error().code == my_errors::PROVISION::CANCELLED) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Bootstrap step " << (i + 1) << " cancelled";
      return r;
    }
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Bootstrap step " << (i + 1) << " (" << step.name
        << ") failed: " << r.error().what;
    failed.push_back(step.name);
  }
  if (!failed.empty()) {
    return monad::MyVoidResult::Err(monad::Error{
        .code = my_errors::PROVISION::BOOTSTRAP_FAILED,
        .what = std::to_string(failed.size()) + " bootstrap step(s) failed: " +
                stringutil::join(failed, ", ")});
  }
  BOOST_LOG_SEV(app_logger(), trivial::info) << "Bootstrap completed";
  return monad::MyVoidResult::Ok();
}

} // namespace clusterboot
