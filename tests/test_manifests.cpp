#include <gtest/gtest.h>

#include "openssl/crypt_util.hpp"
#include "provision/account_store.hpp"
#include "provision/manifests.hpp"
#include "provision/rollout_trigger.hpp"
#include "test_cluster_helper.hpp"

namespace clusterboot {
namespace {

std::vector<std::string> strings(const json::value &v) {
  return json::value_to<std::vector<std::string>>(v);
}

TEST(ManifestsTest, SameInputsSamePayload) {
  auto config = testutil::example_config();
  EXPECT_EQ(json::serialize(manifests::gateway(config).object),
            json::serialize(manifests::gateway(config).object));
  EXPECT_EQ(json::serialize(manifests::cluster_issuer(config).object),
            json::serialize(manifests::cluster_issuer(config).object));
  auto digest = cryptutil::sha256_hex("x");
  EXPECT_EQ(
      json::serialize(manifests::acme_dns_deployment(config, digest).object),
      json::serialize(manifests::acme_dns_deployment(config, digest).object));
}

TEST(ManifestsTest, ClusterIssuerFollowsEnvironment) {
  auto config = testutil::example_config();
  auto prod = manifests::cluster_issuer(config);
  EXPECT_EQ(prod.key.to_string(), "ClusterIssuer certmanager-acme-issuer");
  EXPECT_EQ(find_string(prod.object, {"spec", "acme", "server"}),
            "https://acme-v02.api.letsencrypt.org/directory");
  EXPECT_EQ(find_string(prod.object, {"spec", "acme", "email"}),
            "admin@example.com");
  EXPECT_EQ(find_string(prod.object,
                        {"spec", "acme", "privateKeySecretRef", "name"}),
            "acme-certificates-private-key");

  const auto &solver = prod.object.at("spec")
                           .as_object()
                           .at("acme")
                           .as_object()
                           .at("solvers")
                           .as_array()
                           .at(0)
                           .as_object();
  EXPECT_EQ(find_string(solver, {"dns01", "acmeDNS", "host"}),
            "http://acme-dns.kibaship.svc.cluster.local");
  EXPECT_EQ(find_string(solver, {"dns01", "acmeDNS", "accountSecretRef", "name"}),
            "acme-dns-account");
  EXPECT_EQ(find_string(solver, {"dns01", "acmeDNS", "accountSecretRef", "key"}),
            kAccountStoreKey);

  config.acme_environment = "staging";
  EXPECT_EQ(find_string(manifests::cluster_issuer(config).object,
                        {"spec", "acme", "server"}),
            "https://acme-staging-v02.api.letsencrypt.org/directory");
}

TEST(ManifestsTest, WildcardCertificate) {
  auto cert = manifests::wildcard_certificate(testutil::example_config());
  EXPECT_EQ(cert.key.to_string(),
            "Certificate kibaship/ingress-kibaship-certificate");
  EXPECT_EQ(find_string(cert.object, {"spec", "secretName"}),
            "ingress-kibaship-certificate");
  EXPECT_EQ(find_string(cert.object, {"spec", "issuerRef", "kind"}),
            "ClusterIssuer");
  EXPECT_EQ(strings(cert.object.at("spec").as_object().at("dnsNames")),
            (std::vector<std::string>{"*.apps.example.com",
                                      "*.valkey.example.com",
                                      "*.mysql.example.com",
                                      "*.postgres.example.com"}));
}

TEST(ManifestsTest, GatewayHasFiveListeners) {
  auto gw = manifests::gateway(testutil::example_config());
  EXPECT_EQ(find_string(gw.object, {"spec", "gatewayClassName"}), "cilium");
  const auto &listeners =
      gw.object.at("spec").as_object().at("listeners").as_array();
  ASSERT_EQ(listeners.size(), 5u);

  struct Expected {
    const char *name;
    int port;
    const char *protocol;
    const char *tls_mode;
  };
  const Expected expected[] = {{"http", 80, "HTTP", nullptr},
                               {"https", 443, "HTTPS", "Terminate"},
                               {"mysql-tls", 3306, "TLS", "Passthrough"},
                               {"valkey-tls", 6379, "TLS", "Passthrough"},
                               {"postgres-tls", 5432, "TLS", "Passthrough"}};
  for (size_t i = 0; i < listeners.size(); ++i) {
    const auto &l = listeners[i].as_object();
    EXPECT_EQ(l.at("name").as_string(), expected[i].name);
    EXPECT_EQ(l.at("port").to_number<int>(), expected[i].port);
    EXPECT_EQ(l.at("protocol").as_string(), expected[i].protocol);
    EXPECT_EQ(find_string(l, {"allowedRoutes", "namespaces", "from"}), "All");
    if (expected[i].tls_mode) {
      EXPECT_EQ(find_string(l, {"tls", "mode"}), expected[i].tls_mode);
    } else {
      EXPECT_FALSE(l.contains("tls"));
    }
  }
  const auto &refs = listeners[1]
                         .as_object()
                         .at("tls")
                         .as_object()
                         .at("certificateRefs")
                         .as_array();
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].as_object().at("name").as_string(), "ingress-kibaship-certificate");

  auto *annotations = find_object(gw.object, {"metadata", "annotations"});
  ASSERT_NE(annotations, nullptr);
  EXPECT_EQ(annotations->at(
                "service.beta.kubernetes.io/do-loadbalancer-tls-passthrough").as_string(),
            "true");
}

TEST(ManifestsTest, RoutesTargetGatewayListeners) {
  auto config = testutil::example_config();
  auto redirect = manifests::http_redirect_route(config);
  const auto &spec = redirect.object.at("spec").as_object();
  EXPECT_EQ(strings(spec.at("hostnames")),
            std::vector<std::string>{"*.apps.example.com"});
  const auto &parent = spec.at("parentRefs").as_array().at(0).as_object();
  EXPECT_EQ(parent.at("name").as_string(), "ingress-kibaship-gateway");
  EXPECT_EQ(parent.at("sectionName").as_string(), "http");
  const auto &filter = spec.at("rules")
                           .as_array()
                           .at(0)
                           .as_object()
                           .at("filters")
                           .as_array()
                           .at(0)
                           .as_object();
  EXPECT_EQ(filter.at("type").as_string(), "RequestRedirect");
  EXPECT_EQ(find_string(filter, {"requestRedirect", "scheme"}), "https");
  EXPECT_EQ(find_int(filter, {"requestRedirect", "statusCode"}), 301);

  auto https = manifests::https_route(config);
  EXPECT_EQ(https.key.name, "ingress-kibaship-https");
  EXPECT_EQ(https.object.at("spec")
                .as_object()
                .at("parentRefs")
                .as_array()
                .at(0)
                .as_object()
                .at("sectionName").as_string(),
            "https");

  auto api = manifests::acme_dns_api_route(config);
  EXPECT_EQ(strings(api.object.at("spec").as_object().at("hostnames")),
            std::vector<std::string>{"acme.example.com"});
  const auto &backend = api.object.at("spec")
                            .as_object()
                            .at("rules")
                            .as_array()
                            .at(0)
                            .as_object()
                            .at("backendRefs")
                            .as_array()
                            .at(0)
                            .as_object();
  EXPECT_EQ(backend.at("name").as_string(), "acme-dns");
  EXPECT_EQ(backend.at("port").to_number<int>(), 80);
}

TEST(ManifestsTest, NotFoundBackendShape) {
  auto config = testutil::example_config();
  auto route = manifests::not_found_route(config);
  EXPECT_EQ(route.key.to_string(), "HTTPRoute kibaship/deployment-not-found");
  EXPECT_EQ(strings(route.object.at("spec").as_object().at("hostnames")),
            std::vector<std::string>{"*.example.com"});
  const auto &rule =
      route.object.at("spec").as_object().at("rules").as_array().at(0).as_object();
  const auto &match = rule.at("matches").as_array().at(0).as_object();
  EXPECT_EQ(find_string(match, {"path", "type"}), "PathPrefix");
  EXPECT_EQ(find_string(match, {"path", "value"}), "/");

  auto deploy = manifests::not_found_deployment(config);
  EXPECT_EQ(find_int(deploy.object, {"spec", "replicas"}), 3);
  const auto &container = deploy.object.at("spec")
                              .as_object()
                              .at("template")
                              .as_object()
                              .at("spec")
                              .as_object()
                              .at("containers")
                              .as_array()
                              .at(0)
                              .as_object();
  EXPECT_EQ(container.at("image").as_string(), manifests::kNotFoundImage);
  EXPECT_EQ(container.at("ports")
                .as_array()
                .at(0)
                .as_object()
                .at("containerPort")
                .as_int64(),
            3000);

  auto service = manifests::not_found_service(config);
  const auto &port = service.object.at("spec")
                         .as_object()
                         .at("ports")
                         .as_array()
                         .at(0)
                         .as_object();
  EXPECT_EQ(port.at("port").as_int64(), 80);
  EXPECT_EQ(port.at("targetPort").as_int64(), 3000);

  config.names.not_found_backend = "fallback";
  EXPECT_EQ(manifests::not_found_service(config).key.name, "fallback");
}

TEST(ManifestsTest, AcmeDnsConfigText) {
  auto text = manifests::acme_dns_config_text("example.com");
  EXPECT_NE(text.find("domain = \"acme.example.com\""), std::string::npos);
  EXPECT_NE(text.find("nsname = \"ns1.acme.example.com\""), std::string::npos);
  EXPECT_NE(text.find("nsadmin = \"admin.example.com\""), std::string::npos);
  EXPECT_NE(text.find("\"acme.example.com. NS ns1.acme.example.com.\""),
            std::string::npos);
  EXPECT_NE(text.find("port = \"80\""), std::string::npos);
  EXPECT_NE(text.find("disable_registration = false"), std::string::npos);
  EXPECT_NE(manifests::acme_dns_config_text("other.org"), text);
}

TEST(ManifestsTest, AcmeDnsWorkloadShape) {
  auto config = testutil::example_config();
  auto deploy = manifests::acme_dns_deployment(config, "abc");
  EXPECT_EQ(find_int(deploy.object, {"spec", "replicas"}), 2);
  EXPECT_EQ(template_annotation(deploy.object, kInputsDigestAnnotation), "abc");
  EXPECT_EQ(find_string(deploy.object,
                        {"spec", "selector", "matchLabels", "app"}),
            "acme-dns");
  const auto &pod_spec = *find_object(deploy.object, {"spec", "template", "spec"});
  const auto &container = pod_spec.at("containers").as_array().at(0).as_object();
  EXPECT_EQ(container.at("image").as_string(), "joohoi/acme-dns:v1.0");
  EXPECT_EQ(container.at("ports").as_array().size(), 3u);
  EXPECT_EQ(find_string(container, {"readinessProbe", "httpGet", "path"}),
            "/health");
  EXPECT_EQ(pod_spec.at("volumes").as_array().size(), 2u);

  auto pvc = manifests::acme_dns_pvc(config);
  EXPECT_EQ(pvc.key.name, "acme-dns-data");
  EXPECT_EQ(find_string(pvc.object, {"spec", "storageClassName"}),
            "storage-replica-1");
  EXPECT_EQ(find_string(pvc.object,
                        {"spec", "resources", "requests", "storage"}),
            "1Gi");

  auto dns = manifests::acme_dns_dns_service(config);
  EXPECT_EQ(dns.key.name, "acme-dns-dns");
  EXPECT_EQ(find_string(dns.object, {"spec", "type"}), "LoadBalancer");
  EXPECT_EQ(dns.object.at("spec").as_object().at("ports").as_array().size(), 2u);

  auto http = manifests::acme_dns_http_service(config);
  EXPECT_EQ(http.key.name, "acme-dns");
  EXPECT_EQ(find_string(http.object, {"spec", "type"}), "ClusterIP");

  auto cm = manifests::acme_dns_config_map(config);
  EXPECT_EQ(cm.key.name, "acme-dns-config");
  EXPECT_EQ(find_string(cm.object, {"data", "config.cfg"}),
            manifests::acme_dns_config_text("example.com"));
}

TEST(ManifestsTest, StorageClass) {
  auto sc = manifests::storage_class("storage-replica-2", 2);
  EXPECT_EQ(sc.key.to_string(), "StorageClass storage-replica-2");
  EXPECT_EQ(sc.object.at("provisioner").as_string(), "driver.longhorn.io");
  EXPECT_EQ(sc.object.at("volumeBindingMode").as_string(), "WaitForFirstConsumer");
  EXPECT_TRUE(sc.object.at("allowVolumeExpansion").as_bool());
  EXPECT_EQ(find_string(sc.object, {"parameters", "numberOfReplicas"}), "2");
}

} // namespace
} // namespace clusterboot
