#pragma once

#include "provision/provision_context.hpp"
#include "result_monad.hpp"

namespace clusterboot {

inline constexpr const char kRegistryHttpSecretKey[] = "http-secret";
inline constexpr const char kJwksKey[] = "jwks.json";
inline constexpr std::size_t kRegistryHttpSecretSize = 32;

// Secrets the registry and buildkit installs expect before they can start.
// Every operation waits (bounded) for the namespaces it writes into.
class RegistryProvisioner {
public:
  explicit RegistryProvisioner(ProvisionContext ctx) : ctx_(ctx) {}

  monad::MyVoidResult ensure_registry_credentials();

  // jwks.json derived from tls.crt of the registry signing-key secret.
  monad::MyVoidResult ensure_registry_jwks();

  // Copies ca.crt of the registry TLS secret into the buildkit namespace and
  // restarts buildkitd when the CA changed.
  monad::MyVoidResult ensure_registry_ca_in_buildkit();

private:
  ProvisionContext ctx_;
};

} // namespace clusterboot
