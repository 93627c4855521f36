#pragma once

#include <vector>

#include "provision/provision_context.hpp"
#include "provision/stage_sequencer.hpp"
#include "result_monad.hpp"

namespace clusterboot {

// Issuer, wildcard certificate, gateway and routes for the base domain.
// The gateway waits for the issued certificate secret; until then the run
// ends early with the report naming the deferred stage.
class IngressProvisioner {
public:
  explicit IngressProvisioner(ProvisionContext ctx) : ctx_(ctx) {}

  monad::MyResult<SequenceReport> provision();

  std::vector<ProvisioningStage> stages();

private:
  monad::MyVoidResult ensure(const Resource &desired);

  ProvisionContext ctx_;
};

} // namespace clusterboot
