#pragma once

#include <boost/json.hpp>
#include <compare>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "result_monad.hpp"

namespace clusterboot {

namespace json = boost::json;

inline constexpr const char kManagedByLabel[] = "app.kubernetes.io/managed-by";
inline constexpr const char kManagedByValue[] = "clusterboot";

// Identity of a stored object. Cluster-scoped kinds leave ns empty.
struct ResourceKey {
  std::string kind;
  std::string ns;
  std::string name;

  std::string to_string() const {
    if (ns.empty()) {
      return kind + " " + name;
    }
    return kind + " " + ns + "/" + name;
  }

  auto operator<=>(const ResourceKey &) const = default;
  bool operator==(const ResourceKey &) const = default;
};

struct Resource {
  ResourceKey key;
  // Full document: apiVersion, kind, metadata and spec/data/status.
  json::object object;
  // Opaque; empty until the store has persisted the object.
  std::string resource_version;
};

using Labels = std::map<std::string, std::string>;

Resource make_resource(const std::string &api_version, const std::string &kind,
                       const std::string &ns, const std::string &name,
                       const Labels &labels = {});

// Walks nested objects; nullptr when any segment is missing or not an object.
const json::object *find_object(const json::object &root,
                                std::initializer_list<std::string_view> path);

// Creates missing intermediate objects.
json::object &ensure_object(json::object &root,
                            std::initializer_list<std::string_view> path);

std::optional<std::string> find_string(
    const json::object &root, std::initializer_list<std::string_view> path);

std::optional<std::int64_t> find_int(
    const json::object &root, std::initializer_list<std::string_view> path);

// Pod template annotations of a Deployment-like object.
std::optional<std::string> template_annotation(const json::object &workload,
                                               std::string_view name);
void set_template_annotation(json::object &workload, std::string_view name,
                             std::string_view value);

// Secret payloads. data values hold standard base64 of the raw bytes.
void set_secret_value(Resource &secret, std::string_view key,
                      std::string_view raw);

// Ok(nullopt) when the key is absent or empty; Err when it is not valid base64.
monad::MyResult<std::optional<std::string>> secret_value(
    const Resource &secret, std::string_view key);

} // namespace clusterboot
