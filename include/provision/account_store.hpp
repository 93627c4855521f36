#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "result_monad.hpp"
#include "store/resource_store.hpp"

namespace clusterboot {

namespace json = boost::json;

inline constexpr const char kAccountStoreKey[] = "acmedns.json";

// One acme-dns registration. JSON keys follow cert-manager's acme-dns solver.
struct AcmeDnsAccount {
  std::string username;
  std::string password;
  std::string fulldomain;
  std::string subdomain;
  std::vector<std::string> allowfrom;

  bool operator==(const AcmeDnsAccount &) const = default;

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const AcmeDnsAccount &a) {
    json::object jo;
    jo["username"] = a.username;
    jo["password"] = a.password;
    jo["fulldomain"] = a.fulldomain;
    jo["subdomain"] = a.subdomain;
    if (!a.allowfrom.empty()) {
      jo["allowfrom"] = json::value_from(a.allowfrom);
    }
    jv = std::move(jo);
  }

  friend AcmeDnsAccount tag_invoke(const json::value_to_tag<AcmeDnsAccount> &,
                                   const json::value &jv) {
    const auto &jo = jv.as_object();
    AcmeDnsAccount a;
    a.username = jo.at("username").as_string().c_str();
    a.password = jo.at("password").as_string().c_str();
    a.fulldomain = jo.at("fulldomain").as_string().c_str();
    a.subdomain = jo.at("subdomain").as_string().c_str();
    if (auto *p = jo.if_contains("allowfrom"); p && p->is_array()) {
      a.allowfrom = json::value_to<std::vector<std::string>>(*p);
    }
    return a;
  }
};

struct AccountSecretRef {
  std::string ns;
  std::string name;
  std::string key{kAccountStoreKey};
};

// store[domain] = account. Other entries are left as they are.
json::object merge_account(json::object store, const std::string &domain,
                           const AcmeDnsAccount &account);

// Empty text is an empty store; anything that is not a JSON object is an error.
monad::MyResult<json::object> parse_account_store(const std::string &text);

// Ok(nullopt) when the secret or the domain entry is missing.
monad::MyResult<std::optional<AcmeDnsAccount>>
find_account(IResourceStore &store, const AccountSecretRef &ref,
             const std::string &domain);

// Read-modify-write of the whole document, conditional on the version read.
// Conflicts and create races are retried up to max_attempts.
monad::MyVoidResult sync_account(IResourceStore &store,
                                 const AccountSecretRef &ref,
                                 const std::string &domain,
                                 const AcmeDnsAccount &account,
                                 int max_attempts = 5);

} // namespace clusterboot
