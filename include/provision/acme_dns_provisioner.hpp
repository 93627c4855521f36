#pragma once

#include <vector>

#include "provision/account_registrar.hpp"
#include "provision/provision_context.hpp"
#include "provision/stage_sequencer.hpp"
#include "result_monad.hpp"

namespace clusterboot {

// In-cluster acme-dns server plus the account cert-manager's dns01 solver
// reads from the account secret.
class AcmeDnsProvisioner {
public:
  AcmeDnsProvisioner(ProvisionContext ctx, IAccountRegistrar &registrar)
      : ctx_(ctx), registrar_(registrar) {}

  monad::MyResult<SequenceReport> provision();

  std::vector<ProvisioningStage> stages();

  // SHA-256 of config.cfg as stored in the ConfigMap the pods mount; this is
  // what the deployment's inputs digest is compared against.
  monad::MyResult<std::string> mounted_config_digest();

private:
  monad::MyVoidResult ensure(const Resource &desired);
  monad::MyVoidResult ensure_deployment();
  monad::MyVoidResult wait_for_server();
  monad::MyVoidResult ensure_account();

  ProvisionContext ctx_;
  IAccountRegistrar &registrar_;
};

} // namespace clusterboot
