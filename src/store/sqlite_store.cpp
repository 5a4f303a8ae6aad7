#include "devchain/store/sqlite_store.hpp"

#include "devchain/observability/global.hpp"

#include <cstring>

namespace devchain::store {

namespace {

constexpr const char *kSelectColumns =
    "SELECT device_id, embedding, descriptor, model_version, embedding_norm, generated_at "
    "FROM device_embeddings";

std::vector<unsigned char> vector_to_blob(const embedding::Vector &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

embedding::Vector blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }

  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(float);
  embedding::Vector values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string{} : std::string(text);
}

DeviceEmbedding read_row(sqlite3_stmt *stmt) {
  DeviceEmbedding row;
  row.device_id = column_text(stmt, 0);
  row.vector = blob_to_vector(sqlite3_column_blob(stmt, 1), sqlite3_column_bytes(stmt, 1));
  row.descriptor = column_text(stmt, 2);
  row.model_version = column_text(stmt, 3);
  row.norm = sqlite3_column_double(stmt, 4);
  // An unparseable timestamp reads as the epoch, which is never fresh.
  row.generated_at = common::parse_rfc3339(column_text(stmt, 5)).value_or(common::Timestamp{});
  return row;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::StorageFailure, msg);
  }
  return common::Status::success();
}

template <typename T> common::Result<T> storage_failure(sqlite3 *db) {
  return common::Result<T>::failure(common::ErrorCode::StorageFailure,
                                    db == nullptr ? "database is not open" : sqlite3_errmsg(db));
}

} // namespace

SqliteEmbeddingStore::SqliteEmbeddingStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    last_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  if (auto status = init_schema(); !status.ok()) {
    last_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteEmbeddingStore::~SqliteEmbeddingStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteEmbeddingStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, "PRAGMA busy_timeout=5000;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS device_embeddings (
  device_id TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  descriptor TEXT NOT NULL,
  model_version TEXT NOT NULL,
  embedding_norm REAL NOT NULL DEFAULT 0,
  generated_at TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_device_embeddings_version "
                       "ON device_embeddings(model_version);");
}

common::Result<std::optional<DeviceEmbedding>> SqliteEmbeddingStore::get(const std::string &device_id) {
  using GetResult = common::Result<std::optional<DeviceEmbedding>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_failure<std::optional<DeviceEmbedding>>(db_);
  }

  const std::string sql = std::string(kSelectColumns) + " WHERE device_id = ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<DeviceEmbedding>>(db_);
  }
  sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto row = read_row(stmt);
    sqlite3_finalize(stmt);
    return GetResult::success(std::move(row));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::optional<DeviceEmbedding>>(db_);
  }
  return GetResult::success(std::nullopt);
}

common::Status SqliteEmbeddingStore::upsert(const DeviceEmbedding &embedding) {
  if (embedding.device_id.empty()) {
    return common::Status::error(common::ErrorCode::StorageFailure, "empty device_id");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::StorageFailure, "database is not open");
  }

  const auto blob = vector_to_blob(embedding.vector);
  const std::string generated_at = common::format_rfc3339(embedding.generated_at);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO device_embeddings(device_id, embedding, descriptor, "
                    "model_version, embedding_norm, generated_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, embedding.device_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, embedding.descriptor.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, embedding.model_version.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 5, embedding.norm);
  sqlite3_bind_text(stmt, 6, generated_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorCode::StorageFailure, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

bool SqliteEmbeddingStore::is_fresh(const std::string &device_id,
                                    const std::string &current_model_version,
                                    const MaxAge max_age) {
  auto row = get(device_id);
  if (!row.ok()) {
    observability::record_warning("store.sqlite", "freshness check failed for " + device_id +
                                                      ": " + row.error());
    return false;
  }
  return row.value().has_value() &&
         is_fresh_embedding(*row.value(), current_model_version, max_age);
}

common::Result<std::unordered_map<std::string, embedding::Vector>> SqliteEmbeddingStore::all() {
  using AllResult = common::Result<std::unordered_map<std::string, embedding::Vector>>;
  auto rows = entries();
  if (!rows.ok()) {
    return AllResult::failure(rows.status());
  }
  std::unordered_map<std::string, embedding::Vector> out;
  out.reserve(rows.value().size());
  for (auto &row : rows.value()) {
    out.emplace(row.device_id, std::move(row.vector));
  }
  return AllResult::success(std::move(out));
}

common::Result<std::vector<DeviceEmbedding>> SqliteEmbeddingStore::entries() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_failure<std::vector<DeviceEmbedding>>(db_);
  }

  const std::string sql = std::string(kSelectColumns) + " ORDER BY device_id";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<DeviceEmbedding>>(db_);
  }

  std::vector<DeviceEmbedding> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(read_row(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::vector<DeviceEmbedding>>(db_);
  }
  return common::Result<std::vector<DeviceEmbedding>>::success(std::move(out));
}

common::Result<bool> SqliteEmbeddingStore::remove(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_failure<bool>(db_);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "DELETE FROM device_embeddings WHERE device_id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<bool>(db_);
  }
  sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<bool>(db_);
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> SqliteEmbeddingStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_failure<std::size_t>(db_);
  }
  auto status = exec_sql(db_, "DELETE FROM device_embeddings;");
  if (!status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Result<std::size_t> SqliteEmbeddingStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_failure<std::size_t>(db_);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM device_embeddings", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_failure<std::size_t>(db_);
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

bool SqliteEmbeddingStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return false;
  }
  return exec_sql(db_, "SELECT 1;").ok();
}

} // namespace devchain::store
