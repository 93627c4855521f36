#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "conf/bootstrap_config.hpp"
#include "my_error_codes.hpp"
#include "provision/account_store.hpp"
#include "result_monad.hpp"
#include "util/cancellation.hpp"

namespace clusterboot {

class IAccountRegistrar {
public:
  virtual ~IAccountRegistrar() = default;

  // Registers a new acme-dns account restricted to allow_from (unrestricted
  // when empty).
  virtual monad::MyResult<AcmeDnsAccount>
  register_account(const std::vector<std::string> &allow_from,
                   const CancellationSignal *cancel) = 0;
};

inline constexpr std::chrono::milliseconds kRegisterRetryStep{
    std::chrono::seconds(2)};
// Longest an in-flight request runs on after cancel().
inline constexpr std::chrono::milliseconds kRequestCancelSlice{100};

// Network failures, 5xx and 429 are retried; other statuses are final.
inline bool is_retryable_registration_error(const monad::Error &err) {
  if (err.code == my_errors::PROVISION::CANCELLED ||
      err.code == my_errors::NETWORK::INVALID_URL ||
      err.code == my_errors::JSON::MALFORMED ||
      err.code == my_errors::JSON::MISSING_JSON_FIELD) {
    return false;
  }
  if (err.response_status >= 400 && err.response_status < 500 &&
      err.response_status != 429) {
    return false;
  }
  return true;
}

// POSTs to the acme-dns /register endpoint over plain HTTP with Boost.Beast.
class HttpAccountRegistrar : public IAccountRegistrar {
public:
  explicit HttpAccountRegistrar(const AcmeDnsConfig &config);

  monad::MyResult<AcmeDnsAccount>
  register_account(const std::vector<std::string> &allow_from,
                   const CancellationSignal *cancel) override;

  // Body sent to /register; allowfrom is omitted when empty.
  static std::string request_body(const std::vector<std::string> &allow_from);

  // Expects 201 and the account JSON.
  static monad::MyResult<AcmeDnsAccount>
  parse_response(int status, const std::string &body);

private:
  monad::MyResult<AcmeDnsAccount>
  register_once(const std::vector<std::string> &allow_from,
                const CancellationSignal *cancel);

  std::string register_url_;
  int attempts_;
  std::chrono::seconds timeout_;
};

} // namespace clusterboot
