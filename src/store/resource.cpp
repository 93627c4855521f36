#include "store/resource.hpp"

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"

namespace clusterboot {

Resource make_resource(const std::string &api_version, const std::string &kind,
                       const std::string &ns, const std::string &name,
                       const Labels &labels) {
  Resource r;
  r.key = ResourceKey{kind, ns, name};
  r.object["apiVersion"] = api_version;
  r.object["kind"] = kind;
  json::object metadata;
  metadata["name"] = name;
  if (!ns.empty()) {
    metadata["namespace"] = ns;
  }
  if (!labels.empty()) {
    json::object jlabels;
    for (const auto &[k, v] : labels) {
      jlabels[k] = v;
    }
    metadata["labels"] = std::move(jlabels);
  }
  r.object["metadata"] = std::move(metadata);
  return r;
}

const json::object *find_object(const json::object &root,
                                std::initializer_list<std::string_view> path) {
  const json::object *current = &root;
  for (auto segment : path) {
    auto *p = current->if_contains(segment);
    if (!p || !p->is_object()) {
      return nullptr;
    }
    current = &p->get_object();
  }
  return current;
}

json::object &ensure_object(json::object &root,
                            std::initializer_list<std::string_view> path) {
  json::object *current = &root;
  for (auto segment : path) {
    auto &slot = (*current)[segment];
    if (!slot.is_object()) {
      slot = json::object{};
    }
    current = &slot.get_object();
  }
  return *current;
}

namespace {
const json::value *find_leaf(const json::object &root,
                             std::initializer_list<std::string_view> path) {
  if (path.size() == 0) {
    return nullptr;
  }
  const json::object *current = &root;
  auto it = path.begin();
  for (; it + 1 != path.end(); ++it) {
    auto *p = current->if_contains(*it);
    if (!p || !p->is_object()) {
      return nullptr;
    }
    current = &p->get_object();
  }
  return current->if_contains(*it);
}
} // namespace

std::optional<std::string> find_string(
    const json::object &root, std::initializer_list<std::string_view> path) {
  auto *leaf = find_leaf(root, path);
  if (!leaf || !leaf->is_string()) {
    return std::nullopt;
  }
  return std::string(leaf->get_string());
}

std::optional<std::int64_t> find_int(
    const json::object &root, std::initializer_list<std::string_view> path) {
  auto *leaf = find_leaf(root, path);
  if (!leaf) {
    return std::nullopt;
  }
  if (leaf->is_int64()) {
    return leaf->get_int64();
  }
  if (leaf->is_uint64()) {
    return static_cast<std::int64_t>(leaf->get_uint64());
  }
  return std::nullopt;
}

std::optional<std::string> template_annotation(const json::object &workload,
                                               std::string_view name) {
  auto *annotations = find_object(
      workload, {"spec", "template", "metadata", "annotations"});
  if (!annotations) {
    return std::nullopt;
  }
  auto *p = annotations->if_contains(name);
  if (!p || !p->is_string()) {
    return std::nullopt;
  }
  return std::string(p->get_string());
}

void set_template_annotation(json::object &workload, std::string_view name,
                             std::string_view value) {
  auto &annotations = ensure_object(
      workload, {"spec", "template", "metadata", "annotations"});
  annotations[name] = value;
}

void set_secret_value(Resource &secret, std::string_view key,
                      std::string_view raw) {
  auto &data = ensure_object(secret.object, {"data"});
  data[key] = cryptutil::base64_encode(raw);
}

monad::MyResult<std::optional<std::string>> secret_value(
    const Resource &secret, std::string_view key) {
  using Result = monad::MyResult<std::optional<std::string>>;
  auto encoded = find_string(secret.object, {"data", key});
  if (!encoded || encoded->empty()) {
    return Result::Ok(std::nullopt);
  }
  auto decoded = cryptutil::base64_decode(*encoded);
  if (!decoded) {
    return Result::Err(monad::Error{
        .code = my_errors::JSON::TYPE_MISMATCH,
        .what = "Secret " + secret.key.to_string() + " key '" +
                std::string(key) + "' is not valid base64"});
  }
  if (decoded->empty()) {
    return Result::Ok(std::nullopt);
  }
  return Result::Ok(std::move(*decoded));
}

} // namespace clusterboot
