#pragma once

#include "conf/bootstrap_config.hpp"
#include "provision/readiness_poller.hpp"
#include "store/resource_store.hpp"
#include "util/cancellation.hpp"

namespace clusterboot {

// What every provisioning flow runs against. Holds references only.
struct ProvisionContext {
  IResourceStore &store;
  const BootstrapConfig &config;
  const CancellationSignal *cancel{nullptr};

  const ResourceNames &names() const { return config.names; }

  PollOptions poll_options() const {
    return PollOptions::from_config(config.polling);
  }
};

} // namespace clusterboot
