#pragma once

#include <string>

#include "provision/provision_context.hpp"
#include "result_monad.hpp"

namespace clusterboot {

inline constexpr std::size_t kWebhookKeySize = 32;

class PlatformProvisioner {
public:
  explicit PlatformProvisioner(ProvisionContext ctx) : ctx_(ctx) {}

  // Single- and two-replica Longhorn storage classes.
  monad::MyVoidResult ensure_storage_classes();

  // Returns the raw signing key, generating it when the secret or its key is
  // missing. An existing non-empty key is never replaced.
  monad::MyResult<std::string> ensure_webhook_signing_secret();

  // Validated webhook_url; empty when notifications are not configured.
  monad::MyResult<std::string> webhook_target() const;

private:
  ProvisionContext ctx_;
};

} // namespace clusterboot
