#include "provision/readiness_conditions.hpp"

#include "provision/kinds.hpp"

namespace clusterboot {

namespace {

using ProbeResult = monad::MyResult<ConditionState>;

// Fetches the object and hands it to check; not-found maps to a state.
template <typename Check>
ReadinessCondition make_condition(IResourceStore &store, std::string name,
                                  ResourceKey key, Check check) {
  return ReadinessCondition{
      std::move(name),
      [&store, key = std::move(key), check]() -> ProbeResult {
        auto r = store.get(key);
        if (r.is_err()) {
          if (is_not_found(r.error())) {
            return ProbeResult::Ok(ConditionState::NotFound);
          }
          return ProbeResult::Err(r.error());
        }
        return check(r.value());
      }};
}

ProbeResult satisfied_if(bool ok) {
  return ProbeResult::Ok(ok ? ConditionState::Satisfied
                            : ConditionState::Pending);
}

} // namespace

ReadinessCondition resource_exists(IResourceStore &store,
                                   const ResourceKey &key) {
  return make_condition(store, key.to_string(), key, [](const Resource &) {
    return ProbeResult::Ok(ConditionState::Satisfied);
  });
}

ReadinessCondition namespace_exists(IResourceStore &store,
                                    const std::string &ns) {
  auto condition = resource_exists(store, ResourceKey{kinds::kNamespace, "", ns});
  condition.name = "namespace " + ns;
  return condition;
}

ReadinessCondition secret_has_key(IResourceStore &store, const std::string &ns,
                                  const std::string &name,
                                  const std::string &key) {
  return make_condition(
      store, "secret " + ns + "/" + name + " has " + key,
      ResourceKey{kinds::kSecret, ns, name},
      [key](const Resource &secret) -> ProbeResult {
        auto value = secret_value(secret, key);
        if (value.is_err()) {
          return ProbeResult::Err(value.error());
        }
        return satisfied_if(value.value().has_value());
      });
}

ReadinessCondition service_has_external_address(IResourceStore &store,
                                                const std::string &ns,
                                                const std::string &name) {
  return make_condition(
      store, "service " + ns + "/" + name + " external address",
      ResourceKey{kinds::kService, ns, name},
      [](const Resource &svc) -> ProbeResult {
        auto *lb = find_object(svc.object, {"status", "loadBalancer"});
        if (!lb) {
          return satisfied_if(false);
        }
        auto *ingress = lb->if_contains("ingress");
        if (!ingress || !ingress->is_array() || ingress->get_array().empty() ||
            !ingress->get_array()[0].is_object()) {
          return satisfied_if(false);
        }
        const auto &first = ingress->get_array()[0].get_object();
        auto ip = find_string(first, {"ip"});
        auto host = find_string(first, {"hostname"});
        return satisfied_if((ip && !ip->empty()) || (host && !host->empty()));
      });
}

ReadinessCondition deployment_ready(IResourceStore &store,
                                    const std::string &ns,
                                    const std::string &name) {
  return make_condition(
      store, "deployment " + ns + "/" + name + " ready",
      ResourceKey{kinds::kDeployment, ns, name},
      [](const Resource &deploy) -> ProbeResult {
        auto desired = find_int(deploy.object, {"spec", "replicas"}).value_or(1);
        auto ready =
            find_int(deploy.object, {"status", "readyReplicas"}).value_or(0);
        return satisfied_if(ready > 0 && ready == desired);
      });
}

ReadinessCondition certificate_ready(IResourceStore &store,
                                     const std::string &ns,
                                     const std::string &name) {
  return make_condition(
      store, "certificate " + ns + "/" + name + " ready",
      ResourceKey{kinds::kCertificate, ns, name},
      [](const Resource &cert) -> ProbeResult {
        auto *status = find_object(cert.object, {"status"});
        if (!status) {
          return satisfied_if(false);
        }
        auto *conditions = status->if_contains("conditions");
        if (!conditions || !conditions->is_array()) {
          return satisfied_if(false);
        }
        for (const auto &c : conditions->get_array()) {
          if (!c.is_object()) {
            continue;
          }
          auto type = find_string(c.get_object(), {"type"});
          auto value = find_string(c.get_object(), {"status"});
          if (type == "Ready" && value == "True") {
            return satisfied_if(true);
          }
        }
        return satisfied_if(false);
      });
}

std::function<monad::MyResult<bool>()>
satisfied_now(ReadinessCondition condition) {
  return [condition = std::move(condition)]() -> monad::MyResult<bool> {
    auto state = condition.probe();
    if (state.is_err()) {
      return monad::MyResult<bool>::Err(state.error());
    }
    return monad::MyResult<bool>::Ok(state.value() == ConditionState::Satisfied);
  };
}

} // namespace clusterboot
