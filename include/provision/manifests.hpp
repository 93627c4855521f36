#pragma once

#include <string>
#include <vector>

#include "conf/bootstrap_config.hpp"
#include "store/resource.hpp"

// Desired-state builders. Output depends only on the arguments.
namespace clusterboot {
namespace manifests {

inline constexpr const char kLetsEncryptProduction[] =
    "https://acme-v02.api.letsencrypt.org/directory";
inline constexpr const char kLetsEncryptStaging[] =
    "https://acme-staging-v02.api.letsencrypt.org/directory";

Resource namespace_resource(const std::string &name);

Resource storage_class(const std::string &name, int replicas);

Resource opaque_secret(const std::string &ns, const std::string &name,
                       const Labels &labels = {});

std::string acme_server_url(const BootstrapConfig &config);

// In-cluster URL cert-manager uses to reach acme-dns.
std::string acme_dns_service_url(const BootstrapConfig &config);

Resource cluster_issuer(const BootstrapConfig &config);

// *.apps, *.valkey, *.mysql and *.postgres under the base domain.
std::vector<std::string> wildcard_dns_names(const std::string &domain);

Resource wildcard_certificate(const BootstrapConfig &config);

// http 80, https 443 (terminate), mysql/valkey/postgres TLS passthrough.
Resource gateway(const BootstrapConfig &config);

Resource http_redirect_route(const BootstrapConfig &config);
Resource https_route(const BootstrapConfig &config);

inline constexpr const char kNotFoundImage[] =
    "ghcr.io/kibamail/kibaship-404-deployment-not-found:latest";

// Catch-all route for *.<domain> and the 404 workload behind it.
Resource not_found_route(const BootstrapConfig &config);
Resource not_found_deployment(const BootstrapConfig &config);
Resource not_found_service(const BootstrapConfig &config);

std::string acme_dns_config_text(const std::string &domain);
Resource acme_dns_config_map(const BootstrapConfig &config);
Resource acme_dns_pvc(const BootstrapConfig &config);
Resource acme_dns_dns_service(const BootstrapConfig &config);
Resource acme_dns_http_service(const BootstrapConfig &config);

// config_digest is recorded on the pod template for restart gating.
Resource acme_dns_deployment(const BootstrapConfig &config,
                             const std::string &config_digest);

Resource acme_dns_api_route(const BootstrapConfig &config);

} // namespace manifests
} // namespace clusterboot
