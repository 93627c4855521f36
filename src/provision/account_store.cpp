#include "provision/account_store.hpp"

#include "my_error_codes.hpp"
#include "provision/kinds.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

json::object merge_account(json::object store, const std::string &domain,
                           const AcmeDnsAccount &account) {
  store[domain] = json::value_from(account);
  return store;
}

monad::MyResult<json::object> parse_account_store(const std::string &text) {
  using Result = monad::MyResult<json::object>;
  if (text.empty()) {
    return Result::Ok(json::object{});
  }
  boost::system::error_code ec;
  json::value jv = json::parse(text, ec);
  if (ec) {
    return Result::Err(monad::Error{
        .code = my_errors::JSON::MALFORMED,
        .what = std::string("account store is not valid JSON: ") +
                ec.message()});
  }
  if (!jv.is_object()) {
    return Result::Err(
        monad::Error{.code = my_errors::JSON::TYPE_MISMATCH,
                     .what = "account store is not a JSON object"});
  }
  return Result::Ok(std::move(jv.as_object()));
}

monad::MyResult<std::optional<AcmeDnsAccount>>
find_account(IResourceStore &store, const AccountSecretRef &ref,
             const std::string &domain) {
  using Result = monad::MyResult<std::optional<AcmeDnsAccount>>;
  auto secret = store.get(ResourceKey{kinds::kSecret, ref.ns, ref.name});
  if (secret.is_err()) {
    if (is_not_found(secret.error())) {
      return Result::Ok(std::nullopt);
    }
    return Result::Err(secret.error());
  }
  auto raw = secret_value(secret.value(), ref.key);
  if (raw.is_err()) {
    return Result::Err(raw.error());
  }
  auto doc = parse_account_store(raw.value().value_or(""));
  if (doc.is_err()) {
    return Result::Err(doc.error());
  }
  auto *entry = doc.value().if_contains(domain);
  if (!entry) {
    return Result::Ok(std::nullopt);
  }
  try {
    return Result::Ok(json::value_to<AcmeDnsAccount>(*entry));
  } catch (const std::exception &e) {
    return Result::Err(monad::Error{
        .code = my_errors::JSON::MISSING_JSON_FIELD,
        .what = "account entry for " + domain + " is incomplete: " + e.what()});
  }
}

monad::MyVoidResult sync_account(IResourceStore &store,
                                 const AccountSecretRef &ref,
                                 const std::string &domain,
                                 const AcmeDnsAccount &account,
                                 int max_attempts) {
  const ResourceKey key{kinds::kSecret, ref.ns, ref.name};
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto current = store.get(key);
    bool exists = current.is_ok();
    if (!exists && !is_not_found(current.error())) {
      return monad::MyVoidResult::Err(current.error());
    }

    Resource secret;
    std::string text;
    if (exists) {
      secret = current.value();
      auto raw = secret_value(secret, ref.key);
      if (raw.is_err()) {
        return monad::MyVoidResult::Err(raw.error());
      }
      text = raw.value().value_or("");
    } else {
      secret = make_resource(kinds::kCoreV1, kinds::kSecret, ref.ns, ref.name,
                             {{kManagedByLabel, kManagedByValue}});
      secret.object["type"] = "Opaque";
    }

    auto doc = parse_account_store(text);
    if (doc.is_err()) {
      return monad::MyVoidResult::Err(monad::Error{
          .code = doc.error().code,
          .what = key.to_string() + ": " + doc.error().what});
    }
    auto merged = merge_account(std::move(doc.value()), domain, account);
    set_secret_value(secret, ref.key, json::serialize(merged));

    auto written = exists ? store.update(secret) : store.create(secret);
    if (written.is_ok()) {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Stored acme-dns account for " << domain << " in "
          << key.to_string();
      return monad::MyVoidResult::Ok();
    }
    const auto &err = written.error();
    if (!is_conflict(err) && !is_already_exists(err) && !is_not_found(err)) {
      return monad::MyVoidResult::Err(err);
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Concurrent write to " << key.to_string() << ", retrying ("
        << attempt << "/" << max_attempts << ")";
  }
  return monad::MyVoidResult::Err(monad::Error{
      .code = my_errors::PROVISION::RETRIES_EXHAUSTED,
      .what = "account store " + key.to_string() + " kept conflicting after " +
              std::to_string(max_attempts) + " attempts"});
}

} // namespace clusterboot
