#pragma once

#include <filesystem> // IWYU pragma: keep
#include <functional> // IWYU pragma: keep
#include <mutex>      // IWYU pragma: keep

#include "store/resource_store.hpp"

struct sqlite3;

namespace clusterboot {

// Persists resources in a single SQLite table. Resource versions are per-row
// counters; conditional updates run inside BEGIN IMMEDIATE transactions.
class SqliteResourceStore : public IResourceStore {
public:
  explicit SqliteResourceStore(std::filesystem::path db_path);
  ~SqliteResourceStore() override;

  SqliteResourceStore(const SqliteResourceStore &) = delete;
  SqliteResourceStore &operator=(const SqliteResourceStore &) = delete;

  monad::MyResult<Resource> get(const ResourceKey &key) override;
  monad::MyResult<Resource> create(const Resource &resource) override;
  monad::MyResult<Resource> update(const Resource &resource) override;
  monad::MyResult<std::vector<Resource>>
  list(const std::string &kind, const std::string &ns) override;

  const std::filesystem::path &path() const { return db_path_; }

private:
  monad::MyVoidResult ensure_initialized();
  void close_db();

  monad::MyResult<Resource> select_row(const ResourceKey &key);

  monad::MyVoidResult
  with_transaction(const std::function<monad::MyVoidResult()> &body);

  monad::Error backend_error(const std::string &what) const;

  std::filesystem::path db_path_;
  std::mutex mutex_;
  sqlite3 *db_{nullptr};
  bool initialized_{false};
};

} // namespace clusterboot
