#pragma once

#include <boost/json.hpp>
#include <string>

#include "openssl/crypt_util.hpp"
#include "result_monad.hpp"

namespace clusterboot {
namespace jwks {

namespace json = boost::json;

// First CERTIFICATE block of the PEM text.
monad::MyResult<cryptutil::X509_ptr> load_certificate(const std::string& pem);

// {"kty","kid","use","alg","n","e"} in that order. Only RSA keys are accepted.
monad::MyResult<json::object> rsa_public_jwk(const std::string& certificate_pem,
                                             const std::string& key_id);

// Compact {"keys":[<jwk>]} document. Same input, same bytes.
monad::MyResult<std::string> derive_key_set(const std::string& certificate_pem,
                                            const std::string& key_id);

}  // namespace jwks
}  // namespace clusterboot
