#include "store/sqlite_resource_store.hpp"

#include <sqlite3.h>

#include <optional>
#include <system_error>

#include "util/my_logging.hpp"

namespace {
constexpr const char kCreateTableSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS resources (
  kind TEXT NOT NULL,
  namespace TEXT NOT NULL,
  name TEXT NOT NULL,
  body TEXT NOT NULL,
  resource_version INTEGER NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now')),
  PRIMARY KEY (kind, namespace, name)
);
)SQL";

constexpr const char kSelectSql[] = R"SQL(
SELECT body, resource_version FROM resources
WHERE kind = ?1 AND namespace = ?2 AND name = ?3 LIMIT 1;
)SQL";

constexpr const char kInsertSql[] = R"SQL(
INSERT INTO resources(kind, namespace, name, body, resource_version, updated_at)
VALUES(?1, ?2, ?3, ?4, 1, strftime('%s','now'));
)SQL";

constexpr const char kUpdateSql[] = R"SQL(
UPDATE resources SET
  body = ?4,
  resource_version = resource_version + 1,
  updated_at = strftime('%s','now')
WHERE kind = ?1 AND namespace = ?2 AND name = ?3;
)SQL";

constexpr const char kListSql[] = R"SQL(
SELECT namespace, name, body, resource_version FROM resources
WHERE kind = ?1 AND (?2 = '' OR namespace = ?2)
ORDER BY namespace, name;
)SQL";

void bind_key(sqlite3_stmt *stmt, const clusterboot::ResourceKey &key) {
  sqlite3_bind_text(stmt, 1, key.kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.ns.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, key.name.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_string(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : std::string{};
}
} // namespace

namespace clusterboot {

SqliteResourceStore::SqliteResourceStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

SqliteResourceStore::~SqliteResourceStore() {
  std::scoped_lock lock(mutex_);
  close_db();
}

monad::Error SqliteResourceStore::backend_error(const std::string &what) const {
  std::string detail = what;
  if (db_) {
    detail += ": ";
    detail += sqlite3_errmsg(db_);
  }
  return monad::Error{.code = my_errors::STORE::BACKEND_ERROR,
                      .what = std::move(detail)};
}

monad::MyVoidResult SqliteResourceStore::ensure_initialized() {
  if (initialized_) {
    if (db_) {
      return monad::MyVoidResult::Ok();
    }
    return monad::MyVoidResult::Err(
        backend_error("Resource database unavailable"));
  }
  initialized_ = true;

  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      return monad::MyVoidResult::Err(backend_error(
          "Failed to create directory '" + db_path_.parent_path().string() +
          "': " + ec.message()));
    }
  }

  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    auto err = backend_error("Failed to open " + db_path_.string());
    close_db();
    return monad::MyVoidResult::Err(std::move(err));
  }

  sqlite3_busy_timeout(db_, 5000);
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Failed to enable WAL mode: " << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  if (sqlite3_exec(db_, kCreateTableSql, nullptr, nullptr, &errmsg) !=
      SQLITE_OK) {
    std::string what = std::string("Failed to initialize resources table: ") +
                       (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    close_db();
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::STORE::BACKEND_ERROR, .what = what});
  }
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Resource store opened at " << db_path_.string();
  return monad::MyVoidResult::Ok();
}

void SqliteResourceStore::close_db() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

monad::MyResult<Resource>
SqliteResourceStore::select_row(const ResourceKey &key) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return monad::MyResult<Resource>::Err(
        backend_error("Failed to prepare select statement"));
  }
  bind_key(stmt, key);
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return monad::MyResult<Resource>::Err(
        store_error(my_errors::STORE::NOT_FOUND, key, "not found"));
  }
  if (rc != SQLITE_ROW) {
    auto err = backend_error("Failed to read " + key.to_string());
    sqlite3_finalize(stmt);
    return monad::MyResult<Resource>::Err(std::move(err));
  }
  std::string body = column_string(stmt, 0);
  std::int64_t version = sqlite3_column_int64(stmt, 1);
  sqlite3_finalize(stmt);

  boost::system::error_code ec;
  json::value jv = json::parse(body, ec);
  if (ec || !jv.is_object()) {
    return monad::MyResult<Resource>::Err(store_error(
        my_errors::STORE::BACKEND_ERROR, key, "stored body is not an object"));
  }
  return monad::MyResult<Resource>::Ok(
      Resource{key, std::move(jv.as_object()), std::to_string(version)});
}

monad::MyResult<Resource> SqliteResourceStore::get(const ResourceKey &key) {
  std::scoped_lock lock(mutex_);
  if (auto init = ensure_initialized(); init.is_err()) {
    return monad::MyResult<Resource>::Err(init.error());
  }
  return select_row(key);
}

monad::MyResult<Resource>
SqliteResourceStore::create(const Resource &resource) {
  std::scoped_lock lock(mutex_);
  if (auto init = ensure_initialized(); init.is_err()) {
    return monad::MyResult<Resource>::Err(init.error());
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return monad::MyResult<Resource>::Err(
        backend_error("Failed to prepare insert statement"));
  }
  std::string body = json::serialize(resource.object);
  bind_key(stmt, resource.key);
  sqlite3_bind_text(stmt, 4, body.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return monad::MyResult<Resource>::Err(store_error(
        my_errors::STORE::ALREADY_EXISTS, resource.key, "already exists"));
  }
  if (rc != SQLITE_DONE) {
    return monad::MyResult<Resource>::Err(
        backend_error("Failed to insert " + resource.key.to_string()));
  }
  return monad::MyResult<Resource>::Ok(
      Resource{resource.key, resource.object, "1"});
}

monad::MyResult<Resource>
SqliteResourceStore::update(const Resource &resource) {
  std::scoped_lock lock(mutex_);
  if (auto init = ensure_initialized(); init.is_err()) {
    return monad::MyResult<Resource>::Err(init.error());
  }

  std::optional<Resource> stored;
  auto body = [&]() -> monad::MyVoidResult {
    auto current = select_row(resource.key);
    if (current.is_err()) {
      return monad::MyVoidResult::Err(current.error());
    }
    if (!resource.resource_version.empty() &&
        resource.resource_version != current.value().resource_version) {
      return monad::MyVoidResult::Err(store_error(
          my_errors::STORE::CONFLICT, resource.key,
          "resource version " + resource.resource_version +
              " is stale (now " + current.value().resource_version + ")"));
    }
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kUpdateSql, -1, &stmt, nullptr) != SQLITE_OK) {
      return monad::MyVoidResult::Err(
          backend_error("Failed to prepare update statement"));
    }
    std::string text = json::serialize(resource.object);
    bind_key(stmt, resource.key);
    sqlite3_bind_text(stmt, 4, text.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return monad::MyVoidResult::Err(
          backend_error("Failed to update " + resource.key.to_string()));
    }
    auto after = select_row(resource.key);
    if (after.is_err()) {
      return monad::MyVoidResult::Err(after.error());
    }
    stored = after.value();
    return monad::MyVoidResult::Ok();
  };

  auto r = with_transaction(body);
  if (r.is_err()) {
    return monad::MyResult<Resource>::Err(r.error());
  }
  return monad::MyResult<Resource>::Ok(std::move(*stored));
}

monad::MyResult<std::vector<Resource>>
SqliteResourceStore::list(const std::string &kind, const std::string &ns) {
  using Result = monad::MyResult<std::vector<Resource>>;
  std::scoped_lock lock(mutex_);
  if (auto init = ensure_initialized(); init.is_err()) {
    return Result::Err(init.error());
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kListSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return Result::Err(backend_error("Failed to prepare list statement"));
  }
  sqlite3_bind_text(stmt, 1, kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, ns.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<Resource> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ResourceKey key{kind, column_string(stmt, 0), column_string(stmt, 1)};
    std::string body = column_string(stmt, 2);
    std::int64_t version = sqlite3_column_int64(stmt, 3);
    boost::system::error_code ec;
    json::value jv = json::parse(body, ec);
    if (ec || !jv.is_object()) {
      sqlite3_finalize(stmt);
      return Result::Err(store_error(my_errors::STORE::BACKEND_ERROR, key,
                                     "stored body is not an object"));
    }
    out.push_back(
        Resource{std::move(key), std::move(jv.as_object()),
                 std::to_string(version)});
  }
  if (rc != SQLITE_DONE) {
    auto err = backend_error("Failed to list " + kind);
    sqlite3_finalize(stmt);
    return Result::Err(std::move(err));
  }
  sqlite3_finalize(stmt);
  return Result::Ok(std::move(out));
}

monad::MyVoidResult SqliteResourceStore::with_transaction(
    const std::function<monad::MyVoidResult()> &body) {
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to begin transaction";
    sqlite3_free(errmsg);
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::STORE::BACKEND_ERROR, .what = err});
  }

  auto body_r = body();
  if (body_r.is_err()) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return body_r;
  }

  if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to commit transaction";
    sqlite3_free(errmsg);
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::STORE::BACKEND_ERROR, .what = err});
  }
  return monad::MyVoidResult::Ok();
}

} // namespace clusterboot
