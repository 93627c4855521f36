#pragma once

#include <functional>
#include <string>
#include <vector>

#include "provision/account_registrar.hpp"
#include "provision/provision_context.hpp"
#include "result_monad.hpp"

namespace clusterboot {

struct BootstrapStep {
  std::string name;
  std::function<monad::MyVoidResult()> run;
};

// Runs every provisioning flow once, in dependency order. A failed step is
// logged and the run moves on; the result names every failed step.
class Bootstrapper {
public:
  Bootstrapper(ProvisionContext ctx, IAccountRegistrar &registrar)
      : ctx_(ctx), registrar_(registrar) {}

  monad::MyVoidResult run();

  std::vector<BootstrapStep> steps();

private:
  ProvisionContext ctx_;
  IAccountRegistrar &registrar_;
};

} // namespace clusterboot
