#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace clusterboot
{
  namespace fs = std::filesystem;
  namespace json = boost::json;

  namespace detail
  {
    inline void read_string(const json::object &jo, const char *key,
                            std::string &target)
    {
      if (auto *p = jo.if_contains(key))
      {
        target = p->as_string().c_str();
      }
      else
      {
        std::cerr << key << " not found, using default '" << target << "'"
                  << std::endl;
      }
    }

    template <typename Int>
    inline void read_int(const json::object &jo, const char *key, Int &target)
    {
      if (auto *p = jo.if_contains(key))
      {
        target = static_cast<Int>(p->to_number<std::int64_t>());
      }
      else
      {
        std::cerr << key << " not found, using default " << target
                  << std::endl;
      }
    }
  } // namespace detail

  struct LoggingConfig
  {
    std::string level{"info"};
    std::string log_dir{};
    std::string log_file{"clusterboot"};
    std::uint64_t rotation_size{10 * 1024 * 1024};

    friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                    const json::value &jv)
    {
      LoggingConfig lc{};
      if (auto *jo_p = jv.if_object())
      {
        detail::read_string(*jo_p, "level", lc.level);
        detail::read_string(*jo_p, "log_dir", lc.log_dir);
        detail::read_string(*jo_p, "log_file", lc.log_file);
        detail::read_int(*jo_p, "rotation_size", lc.rotation_size);
        return lc;
      }
      throw std::runtime_error("LoggingConfig is not an object");
    }
  };

  // Every namespace and object name the provisioners touch.
  struct ResourceNames
  {
    std::string operator_namespace{"kibaship"};
    std::string issuer_name{"certmanager-acme-issuer"};
    std::string issuer_key_secret{"acme-certificates-private-key"};
    std::string certificate_name{"ingress-kibaship-certificate"};
    std::string gateway_name{"ingress-kibaship-gateway"};
    std::string http_redirect_route{"ingress-kibaship-http-redirect"};
    std::string https_route{"ingress-kibaship-https"};
    // 404 backend for hosts no application has claimed.
    std::string not_found_backend{"deployment-not-found"};
    std::string acme_dns_name{"acme-dns"};
    std::string acme_dns_route{"acme-dns-api"};
    std::string acme_dns_account_secret{"acme-dns-account"};
    std::string storage_class_replica1{"storage-replica-1"};
    std::string storage_class_replica2{"storage-replica-2"};
    std::string registry_namespace{"registry"};
    std::string registry_auth_secret{"registry-registry-auth"};
    std::string registry_keys_secret{"registry-auth-keys"};
    std::string registry_jwks_secret{"registry-auth-keys-jwks"};
    std::string registry_jwks_key_id{"registry-auth-jwt-signer"};
    std::string registry_tls_secret{"registry-tls"};
    std::string buildkit_namespace{"buildkit"};
    std::string buildkit_ca_secret{"registry-ca-cert"};
    std::string buildkit_deployment{"buildkitd"};
    std::string webhook_secret{"kibaship-webhook-signing"};
    std::string webhook_secret_key{"secret"};

    friend ResourceNames tag_invoke(const json::value_to_tag<ResourceNames> &,
                                    const json::value &jv)
    {
      ResourceNames rn{};
      auto *jo_p = jv.if_object();
      if (!jo_p)
      {
        throw std::runtime_error("ResourceNames is not an object");
      }
      const auto &jo = *jo_p;
      detail::read_string(jo, "operator_namespace", rn.operator_namespace);
      detail::read_string(jo, "issuer_name", rn.issuer_name);
      detail::read_string(jo, "issuer_key_secret", rn.issuer_key_secret);
      detail::read_string(jo, "certificate_name", rn.certificate_name);
      detail::read_string(jo, "gateway_name", rn.gateway_name);
      detail::read_string(jo, "http_redirect_route", rn.http_redirect_route);
      detail::read_string(jo, "https_route", rn.https_route);
      detail::read_string(jo, "not_found_backend", rn.not_found_backend);
      detail::read_string(jo, "acme_dns_name", rn.acme_dns_name);
      detail::read_string(jo, "acme_dns_route", rn.acme_dns_route);
      detail::read_string(jo, "acme_dns_account_secret",
                          rn.acme_dns_account_secret);
      detail::read_string(jo, "storage_class_replica1",
                          rn.storage_class_replica1);
      detail::read_string(jo, "storage_class_replica2",
                          rn.storage_class_replica2);
      detail::read_string(jo, "registry_namespace", rn.registry_namespace);
      detail::read_string(jo, "registry_auth_secret", rn.registry_auth_secret);
      detail::read_string(jo, "registry_keys_secret", rn.registry_keys_secret);
      detail::read_string(jo, "registry_jwks_secret", rn.registry_jwks_secret);
      detail::read_string(jo, "registry_jwks_key_id", rn.registry_jwks_key_id);
      detail::read_string(jo, "registry_tls_secret", rn.registry_tls_secret);
      detail::read_string(jo, "buildkit_namespace", rn.buildkit_namespace);
      detail::read_string(jo, "buildkit_ca_secret", rn.buildkit_ca_secret);
      detail::read_string(jo, "buildkit_deployment", rn.buildkit_deployment);
      detail::read_string(jo, "webhook_secret", rn.webhook_secret);
      detail::read_string(jo, "webhook_secret_key", rn.webhook_secret_key);
      return rn;
    }
  };

  struct PollingConfig
  {
    std::chrono::seconds interval{5};
    std::chrono::seconds deadline{300};
    double backoff_multiplier{1.0};
    std::chrono::seconds max_interval{30};

    friend PollingConfig tag_invoke(const json::value_to_tag<PollingConfig> &,
                                    const json::value &jv)
    {
      PollingConfig pc{};
      auto *jo_p = jv.if_object();
      if (!jo_p)
      {
        throw std::runtime_error("PollingConfig is not an object");
      }
      std::int64_t interval = pc.interval.count();
      std::int64_t deadline = pc.deadline.count();
      std::int64_t max_interval = pc.max_interval.count();
      detail::read_int(*jo_p, "interval_seconds", interval);
      detail::read_int(*jo_p, "deadline_seconds", deadline);
      detail::read_int(*jo_p, "max_interval_seconds", max_interval);
      if (auto *p = jo_p->if_contains("backoff_multiplier"))
        pc.backoff_multiplier = p->to_number<double>();
      pc.interval = std::chrono::seconds(interval);
      pc.deadline = std::chrono::seconds(deadline);
      pc.max_interval = std::chrono::seconds(max_interval);
      return pc;
    }
  };

  struct AcmeDnsConfig
  {
    bool enabled{true};
    std::string register_url{
        "http://acme-dns.kibaship.svc.cluster.local/register"};
    std::string image{"joohoi/acme-dns:v1.0"};
    int replicas{2};
    int register_attempts{5};
    std::chrono::seconds request_timeout{30};
    std::vector<std::string> allow_from{};

    friend AcmeDnsConfig tag_invoke(const json::value_to_tag<AcmeDnsConfig> &,
                                    const json::value &jv)
    {
      AcmeDnsConfig ac{};
      auto *jo_p = jv.if_object();
      if (!jo_p)
      {
        throw std::runtime_error("AcmeDnsConfig is not an object");
      }
      if (auto *p = jo_p->if_contains("enabled"))
        ac.enabled = p->as_bool();
      detail::read_string(*jo_p, "register_url", ac.register_url);
      detail::read_string(*jo_p, "image", ac.image);
      detail::read_int(*jo_p, "replicas", ac.replicas);
      detail::read_int(*jo_p, "register_attempts", ac.register_attempts);
      std::int64_t timeout = ac.request_timeout.count();
      detail::read_int(*jo_p, "request_timeout_seconds", timeout);
      ac.request_timeout = std::chrono::seconds(timeout);
      if (auto *p = jo_p->if_contains("allow_from"))
        ac.allow_from = json::value_to<std::vector<std::string>>(*p);
      return ac;
    }
  };

  struct BootstrapConfig
  {
    std::string domain{};
    std::string acme_email{};
    std::string acme_environment{"production"};
    std::string gateway_class_name{"cilium"};
    std::string webhook_url{};
    ResourceNames names{};
    PollingConfig polling{};
    AcmeDnsConfig acme_dns{};
    LoggingConfig log{};

    bool staging() const { return acme_environment == "staging"; }

    friend BootstrapConfig tag_invoke(
        const json::value_to_tag<BootstrapConfig> &, const json::value &jv)
    {
      try
      {
        if (auto *jo_p = jv.if_object())
        {
          BootstrapConfig bc{};
          detail::read_string(*jo_p, "domain", bc.domain);
          detail::read_string(*jo_p, "acme_email", bc.acme_email);
          detail::read_string(*jo_p, "acme_environment", bc.acme_environment);
          detail::read_string(*jo_p, "gateway_class_name",
                              bc.gateway_class_name);
          detail::read_string(*jo_p, "webhook_url", bc.webhook_url);
          if (auto *p = jo_p->if_contains("names"))
            bc.names = json::value_to<ResourceNames>(*p);
          if (auto *p = jo_p->if_contains("polling"))
            bc.polling = json::value_to<PollingConfig>(*p);
          if (auto *p = jo_p->if_contains("acme_dns"))
            bc.acme_dns = json::value_to<AcmeDnsConfig>(*p);
          if (auto *p = jo_p->if_contains("log"))
            bc.log = json::value_to<LoggingConfig>(*p);
          if (bc.acme_environment != "production" &&
              bc.acme_environment != "staging")
          {
            throw std::runtime_error("acme_environment must be 'production' "
                                     "or 'staging', got '" +
                                     bc.acme_environment + "'");
          }
          return bc;
        }
        else
        {
          throw std::runtime_error("BootstrapConfig is not an object");
        }
      }
      catch (const std::exception &e)
      {
        throw std::runtime_error(std::string("error in parsing BootstrapConfig: ") +
                                 e.what());
      }
    }
  };

  // CLUSTERBOOT_DOMAIN, CLUSTERBOOT_ACME_EMAIL and CLUSTERBOOT_WEBHOOK_URL win
  // over the file.
  inline void apply_env_overrides(BootstrapConfig &config)
  {
    auto apply = [](const char *name, std::string &target) {
      if (const char *value = std::getenv(name); value && *value)
      {
        target = value;
      }
    };
    apply("CLUSTERBOOT_DOMAIN", config.domain);
    apply("CLUSTERBOOT_ACME_EMAIL", config.acme_email);
    apply("CLUSTERBOOT_WEBHOOK_URL", config.webhook_url);
  }

  class IBootstrapConfigProvider
  {
  public:
    virtual ~IBootstrapConfigProvider() = default;

    virtual const BootstrapConfig &get() const = 0;
    virtual BootstrapConfig &get() = 0;
  };

  class BootstrapConfigProviderFile : public IBootstrapConfigProvider
  {
  private:
    BootstrapConfig config_;
    fs::path config_file_;

    static monad::MyResult<json::value> read_json(const fs::path &f)
    {
      std::ifstream ifs(f);
      if (!ifs)
      {
        return monad::MyResult<json::value>::Err(
            {.code = my_errors::GENERAL::FILE_READ_WRITE,
             .what = "Unable to open configuration file: " + f.string()});
      }
      std::string content((std::istreambuf_iterator<char>(ifs)),
                          std::istreambuf_iterator<char>());
      boost::system::error_code ec;
      json::value jv = json::parse(content, ec);
      if (ec || !jv.is_object())
      {
        return monad::MyResult<json::value>::Err(
            {.code = my_errors::JSON::MALFORMED,
             .what = "Configuration file is not a JSON object: " + f.string()});
      }
      return monad::MyResult<json::value>::Ok(std::move(jv));
    }

  public:
    explicit BootstrapConfigProviderFile(fs::path config_file)
        : config_file_(std::move(config_file))
    {
      auto jv = read_json(config_file_);
      if (jv.is_err())
      {
        throw std::runtime_error(jv.error().what);
      }
      config_ = json::value_to<BootstrapConfig>(jv.value());
      apply_env_overrides(config_);
    }

    const BootstrapConfig &get() const override { return config_; }
    BootstrapConfig &get() override { return config_; }

    const fs::path &path() const { return config_file_; }
  };
} // namespace clusterboot
