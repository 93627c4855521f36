#include "provision/manifests.hpp"

#include <fmt/format.h>

#include "provision/account_store.hpp"
#include "provision/kinds.hpp"
#include "provision/rollout_trigger.hpp"

namespace clusterboot {
namespace manifests {

namespace {

Labels managed_labels() { return {{kManagedByLabel, kManagedByValue}}; }

Labels acme_dns_labels(const BootstrapConfig &config) {
  const auto &name = config.names.acme_dns_name;
  return {{"app", name},
          {"app.kubernetes.io/name", name},
          {"app.kubernetes.io/component", "dns"},
          {kManagedByLabel, kManagedByValue}};
}

json::object parent_ref(const BootstrapConfig &config,
                        const std::string &section) {
  return json::object{{"name", config.names.gateway_name},
                      {"namespace", config.names.operator_namespace},
                      {"sectionName", section}};
}

json::object listener(const std::string &name, int port,
                      const std::string &protocol) {
  return json::object{
      {"name", name},
      {"port", port},
      {"protocol", protocol},
      {"allowedRoutes", json::object{{"namespaces",
                                      json::object{{"from", "All"}}}}}};
}

json::object passthrough_listener(const std::string &name, int port) {
  auto l = listener(name, port, "TLS");
  l["tls"] = json::object{{"mode", "Passthrough"}};
  return l;
}

json::object service_port(const std::string &name, int port,
                          const std::string &protocol,
                          const std::string &target) {
  return json::object{{"name", name},
                      {"port", port},
                      {"protocol", protocol},
                      {"targetPort", target}};
}

json::object http_probe(int initial_delay) {
  return json::object{
      {"httpGet", json::object{{"path", "/health"}, {"port", "http"}}},
      {"initialDelaySeconds", initial_delay},
      {"periodSeconds", 10}};
}

} // namespace

Resource namespace_resource(const std::string &name) {
  return make_resource(kinds::kCoreV1, kinds::kNamespace, "", name,
                       managed_labels());
}

Resource storage_class(const std::string &name, int replicas) {
  auto r = make_resource(kinds::kStorageV1, kinds::kStorageClass, "", name,
                         managed_labels());
  r.object["provisioner"] = "driver.longhorn.io";
  r.object["allowVolumeExpansion"] = true;
  r.object["reclaimPolicy"] = "Delete";
  r.object["volumeBindingMode"] = "WaitForFirstConsumer";
  r.object["parameters"] =
      json::object{{"numberOfReplicas", std::to_string(replicas)},
                   {"staleReplicaTimeout", "30"},
                   {"fsType", "ext4"}};
  return r;
}

Resource opaque_secret(const std::string &ns, const std::string &name,
                       const Labels &labels) {
  Labels all = labels;
  all.emplace(kManagedByLabel, kManagedByValue);
  auto r = make_resource(kinds::kCoreV1, kinds::kSecret, ns, name, all);
  r.object["type"] = "Opaque";
  r.object["data"] = json::object{};
  return r;
}

std::string acme_server_url(const BootstrapConfig &config) {
  return config.staging() ? kLetsEncryptStaging : kLetsEncryptProduction;
}

std::string acme_dns_service_url(const BootstrapConfig &config) {
  return fmt::format("http://{}.{}.svc.cluster.local",
                     config.names.acme_dns_name,
                     config.names.operator_namespace);
}

Resource cluster_issuer(const BootstrapConfig &config) {
  auto r = make_resource(kinds::kCertManagerV1, kinds::kClusterIssuer, "",
                         config.names.issuer_name, managed_labels());
  json::object solver{
      {"dns01",
       json::object{
           {"acmeDNS",
            json::object{
                {"host", acme_dns_service_url(config)},
                {"accountSecretRef",
                 json::object{{"name", config.names.acme_dns_account_secret},
                              {"key", kAccountStoreKey}}}}}}}};
  r.object["spec"] = json::object{
      {"acme",
       json::object{
           {"email", config.acme_email},
           {"server", acme_server_url(config)},
           {"privateKeySecretRef",
            json::object{{"name", config.names.issuer_key_secret}}},
           {"solvers", json::array{std::move(solver)}}}}};
  return r;
}

std::vector<std::string> wildcard_dns_names(const std::string &domain) {
  return {"*.apps." + domain, "*.valkey." + domain, "*.mysql." + domain,
          "*.postgres." + domain};
}

Resource wildcard_certificate(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kCertManagerV1, kinds::kCertificate,
                         names.operator_namespace, names.certificate_name,
                         managed_labels());
  r.object["spec"] = json::object{
      {"secretName", names.certificate_name},
      {"issuerRef",
       json::object{{"name", names.issuer_name}, {"kind", "ClusterIssuer"}}},
      {"dnsNames", json::value_from(wildcard_dns_names(config.domain))}};
  return r;
}

Resource gateway(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kGatewayV1, kinds::kGateway,
                         names.operator_namespace, names.gateway_name,
                         managed_labels());
  r.object["metadata"].as_object()["annotations"] = json::object{
      {"service.beta.kubernetes.io/do-loadbalancer-tls-passthrough", "true"},
      {"service.beta.kubernetes.io/aws-load-balancer-backend-protocol", "tcp"},
      {"service.beta.kubernetes.io/azure-load-balancer-tcp-idle-timeout",
       "4"}};

  auto https = listener("https", 443, "HTTPS");
  https["tls"] = json::object{
      {"mode", "Terminate"},
      {"certificateRefs",
       json::array{json::object{{"name", names.certificate_name}}}}};

  json::array listeners;
  listeners.push_back(listener("http", 80, "HTTP"));
  listeners.push_back(std::move(https));
  listeners.push_back(passthrough_listener("mysql-tls", 3306));
  listeners.push_back(passthrough_listener("valkey-tls", 6379));
  listeners.push_back(passthrough_listener("postgres-tls", 5432));

  r.object["spec"] = json::object{{"gatewayClassName", config.gateway_class_name},
                                  {"listeners", std::move(listeners)}};
  return r;
}

Resource http_redirect_route(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kGatewayV1, kinds::kHTTPRoute,
                         names.operator_namespace, names.http_redirect_route,
                         managed_labels());
  json::object filter{
      {"type", "RequestRedirect"},
      {"requestRedirect",
       json::object{{"scheme", "https"}, {"statusCode", 301}}}};
  r.object["spec"] = json::object{
      {"parentRefs", json::array{parent_ref(config, "http")}},
      {"hostnames", json::array{json::string("*.apps." + config.domain)}},
      {"rules",
       json::array{json::object{{"filters", json::array{std::move(filter)}}}}}};
  return r;
}

Resource https_route(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kGatewayV1, kinds::kHTTPRoute,
                         names.operator_namespace, names.https_route,
                         managed_labels());
  json::object match{
      {"path", json::object{{"type", "PathPrefix"}, {"value", "/"}}}};
  r.object["spec"] = json::object{
      {"parentRefs", json::array{parent_ref(config, "https")}},
      {"hostnames", json::array{json::string("*.apps." + config.domain)}},
      {"rules",
       json::array{json::object{{"matches", json::array{std::move(match)}}}}}};
  return r;
}

Resource not_found_route(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kGatewayV1, kinds::kHTTPRoute,
                         names.operator_namespace, names.not_found_backend,
                         managed_labels());
  json::object match{
      {"path", json::object{{"type", "PathPrefix"}, {"value", "/"}}}};
  json::object backend{{"name", names.not_found_backend},
                       {"namespace", names.operator_namespace},
                       {"port", 80}};
  r.object["spec"] = json::object{
      {"parentRefs",
       json::array{json::object{{"name", names.gateway_name},
                                {"namespace", names.operator_namespace}}}},
      {"hostnames", json::array{json::string("*." + config.domain)}},
      {"rules",
       json::array{json::object{{"matches", json::array{std::move(match)}},
                                {"backendRefs",
                                 json::array{std::move(backend)}}}}}};
  return r;
}

Resource not_found_deployment(const BootstrapConfig &config) {
  const auto &name = config.names.not_found_backend;
  auto r = make_resource(kinds::kAppsV1, kinds::kDeployment,
                         config.names.operator_namespace, name,
                         managed_labels());
  json::object container{
      {"name", name},
      {"image", kNotFoundImage},
      {"ports", json::array{json::object{{"containerPort", 3000}}}}};
  r.object["spec"] = json::object{
      {"replicas", 3},
      {"selector", json::object{{"matchLabels", json::object{{"app", name}}}}},
      {"template",
       json::object{
           {"metadata", json::object{{"labels", json::object{{"app", name}}}}},
           {"spec", json::object{{"containers",
                                  json::array{std::move(container)}}}}}}};
  return r;
}

Resource not_found_service(const BootstrapConfig &config) {
  const auto &name = config.names.not_found_backend;
  auto r = make_resource(kinds::kCoreV1, kinds::kService,
                         config.names.operator_namespace, name,
                         managed_labels());
  r.object["spec"] = json::object{
      {"selector", json::object{{"app", name}}},
      {"ports", json::array{json::object{{"port", 80}, {"targetPort", 3000}}}}};
  return r;
}

std::string acme_dns_config_text(const std::string &domain) {
  return fmt::format(R"([general]
listen = ":53"
protocol = "both"
domain = "acme.{0}"
nsname = "ns1.acme.{0}"
nsadmin = "admin.{0}"
records = [
    "acme.{0}. A 127.0.0.1",
    "acme.{0}. NS ns1.acme.{0}.",
]
debug = false

[database]
engine = "sqlite3"
connection = "/var/lib/acme-dns/acme-dns.db"

[api]
ip = "0.0.0.0"
port = "80"
tls = "none"
disable_registration = false
corsorigins = ["*"]
use_header = false
header_name = "X-Forwarded-For"

[logconfig]
loglevel = "debug"
logtype = "stdout"
logformat = "text"
)",
                     domain);
}

Resource acme_dns_config_map(const BootstrapConfig &config) {
  auto r = make_resource(kinds::kCoreV1, kinds::kConfigMap,
                         config.names.operator_namespace,
                         config.names.acme_dns_name + "-config",
                         acme_dns_labels(config));
  r.object["data"] =
      json::object{{"config.cfg", acme_dns_config_text(config.domain)}};
  return r;
}

Resource acme_dns_pvc(const BootstrapConfig &config) {
  auto r = make_resource(kinds::kCoreV1, kinds::kPersistentVolumeClaim,
                         config.names.operator_namespace,
                         config.names.acme_dns_name + "-data",
                         acme_dns_labels(config));
  r.object["spec"] = json::object{
      {"accessModes", json::array{"ReadWriteOnce"}},
      {"storageClassName", config.names.storage_class_replica1},
      {"resources",
       json::object{{"requests", json::object{{"storage", "1Gi"}}}}}};
  return r;
}

Resource acme_dns_dns_service(const BootstrapConfig &config) {
  auto r = make_resource(kinds::kCoreV1, kinds::kService,
                         config.names.operator_namespace,
                         config.names.acme_dns_name + "-dns",
                         acme_dns_labels(config));
  r.object["spec"] = json::object{
      {"type", "LoadBalancer"},
      {"selector", json::object{{"app", config.names.acme_dns_name}}},
      {"ports", json::array{service_port("dns-udp", 53, "UDP", "dns-udp"),
                            service_port("dns-tcp", 53, "TCP", "dns-tcp")}},
      {"sessionAffinity", "ClientIP"}};
  return r;
}

Resource acme_dns_http_service(const BootstrapConfig &config) {
  auto r = make_resource(kinds::kCoreV1, kinds::kService,
                         config.names.operator_namespace,
                         config.names.acme_dns_name, acme_dns_labels(config));
  r.object["spec"] = json::object{
      {"type", "ClusterIP"},
      {"selector", json::object{{"app", config.names.acme_dns_name}}},
      {"ports", json::array{service_port("http", 80, "TCP", "http")}}};
  return r;
}

Resource acme_dns_deployment(const BootstrapConfig &config,
                             const std::string &config_digest) {
  const auto &name = config.names.acme_dns_name;
  auto labels = acme_dns_labels(config);
  auto r = make_resource(kinds::kAppsV1, kinds::kDeployment,
                         config.names.operator_namespace, name, labels);

  json::object container_ports_udp{
      {"name", "dns-udp"}, {"containerPort", 53}, {"protocol", "UDP"}};
  json::object container_ports_tcp{
      {"name", "dns-tcp"}, {"containerPort", 53}, {"protocol", "TCP"}};
  json::object container_ports_http{
      {"name", "http"}, {"containerPort", 80}, {"protocol", "TCP"}};

  json::object container{
      {"name", name},
      {"image", config.acme_dns.image},
      {"ports", json::array{std::move(container_ports_udp),
                            std::move(container_ports_tcp),
                            std::move(container_ports_http)}},
      {"env", json::array{json::object{{"name", "ACMEDNS_CONFIG"},
                                       {"value", "/etc/acme-dns/config.cfg"}}}},
      {"volumeMounts",
       json::array{json::object{{"name", "config"},
                                {"mountPath", "/etc/acme-dns"},
                                {"readOnly", true}},
                   json::object{{"name", "data"},
                                {"mountPath", "/var/lib/acme-dns"}}}},
      {"resources",
       json::object{
           {"requests", json::object{{"cpu", "100m"}, {"memory", "128Mi"}}},
           {"limits", json::object{{"cpu", "500m"}, {"memory", "256Mi"}}}}},
      {"livenessProbe", http_probe(30)},
      {"readinessProbe", http_probe(5)}};

  json::object pod_labels;
  for (const auto &[k, v] : labels) {
    pod_labels[k] = v;
  }

  json::object template_spec{
      {"containers", json::array{std::move(container)}},
      {"volumes",
       json::array{
           json::object{{"name", "config"},
                        {"configMap", json::object{{"name", name + "-config"}}}},
           json::object{
               {"name", "data"},
               {"persistentVolumeClaim",
                json::object{{"claimName", name + "-data"}}}}}}};

  r.object["spec"] = json::object{
      {"replicas", config.acme_dns.replicas},
      {"selector", json::object{{"matchLabels", json::object{{"app", name}}}}},
      {"template",
       json::object{{"metadata", json::object{{"labels", std::move(pod_labels)}}},
                    {"spec", std::move(template_spec)}}}};
  set_template_annotation(r.object, kInputsDigestAnnotation, config_digest);
  return r;
}

Resource acme_dns_api_route(const BootstrapConfig &config) {
  const auto &names = config.names;
  auto r = make_resource(kinds::kGatewayV1, kinds::kHTTPRoute,
                         names.operator_namespace, names.acme_dns_route,
                         acme_dns_labels(config));
  json::object match{
      {"path", json::object{{"type", "PathPrefix"}, {"value", "/"}}}};
  json::object backend{{"name", names.acme_dns_name},
                       {"namespace", names.operator_namespace},
                       {"port", 80}};
  r.object["spec"] = json::object{
      {"parentRefs", json::array{parent_ref(config, "http")}},
      {"hostnames", json::array{json::string("acme." + config.domain)}},
      {"rules",
       json::array{json::object{{"matches", json::array{std::move(match)}},
                                {"backendRefs",
                                 json::array{std::move(backend)}}}}}};
  return r;
}

} // namespace manifests
} // namespace clusterboot
