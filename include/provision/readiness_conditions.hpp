#pragma once

#include <functional>
#include <string>

#include "provision/readiness_poller.hpp"
#include "store/resource_store.hpp"

namespace clusterboot {

ReadinessCondition resource_exists(IResourceStore &store, const ResourceKey &key);

ReadinessCondition namespace_exists(IResourceStore &store,
                                    const std::string &ns);

// Key present with a non-empty value.
ReadinessCondition secret_has_key(IResourceStore &store, const std::string &ns,
                                  const std::string &name,
                                  const std::string &key);

// status.loadBalancer.ingress[0] has an ip or hostname.
ReadinessCondition service_has_external_address(IResourceStore &store,
                                                const std::string &ns,
                                                const std::string &name);

// status.readyReplicas > 0 and equal to spec.replicas.
ReadinessCondition deployment_ready(IResourceStore &store,
                                    const std::string &ns,
                                    const std::string &name);

// status.conditions contains {type: Ready, status: "True"}.
ReadinessCondition certificate_ready(IResourceStore &store,
                                     const std::string &ns,
                                     const std::string &name);

// Single probe as a stage precondition: Ok(true) only when Satisfied.
std::function<monad::MyResult<bool>()>
satisfied_now(ReadinessCondition condition);

} // namespace clusterboot
