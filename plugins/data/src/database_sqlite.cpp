#include "dmk_data/database.h"

#include "dmk/log.h"

#include <filesystem>

#if DMK_HAVE_SQLITE3
#include <sqlite3.h>
#endif

namespace dmk::data {

void SqliteDatabase::record_error(const std::string& what) {
#if DMK_HAVE_SQLITE3
  last_error_ = what + ": " + (db_ ? sqlite3_errmsg(db_) : "no database");
#else
  last_error_ = what + ": sqlite not available";
#endif
  log::warn("sqlite " + last_error_);
}

bool SqliteDatabase::open(const std::string& path) {
#if DMK_HAVE_SQLITE3
  close();
  const std::filesystem::path p(path);
  if (path != ":memory:" && p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
  }
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    record_error("open failed (" + path + ")");
    close();
    return false;
  }
  sqlite3_busy_timeout(db_, 2000);
  return true;
#else
  last_error_ = "sqlite not available";
  log::warn("sqlite not available");
  (void)path;
  return false;
#endif
}

bool SqliteDatabase::exec(const std::string& sql) {
#if DMK_HAVE_SQLITE3
  if (!db_) {
    record_error("exec on closed database");
    return false;
  }
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    last_error_ = err_msg ? err_msg : "unknown error";
    log::warn("sqlite exec error: " + last_error_);
    if (err_msg) {
      sqlite3_free(err_msg);
    }
    return false;
  }
  return true;
#else
  (void)sql;
  return false;
#endif
}

void SqliteDatabase::close() {
#if DMK_HAVE_SQLITE3
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
#endif
}

SqliteDatabase::~SqliteDatabase() {
  close();
}

SqliteStatement::SqliteStatement(SqliteDatabase& db, const std::string& sql) : db_(db) {
#if DMK_HAVE_SQLITE3
  if (!db_.db_ || sqlite3_prepare_v2(db_.db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    db_.record_error("prepare failed");
    stmt_ = nullptr;
  }
#else
  (void)sql;
#endif
}

SqliteStatement::~SqliteStatement() {
#if DMK_HAVE_SQLITE3
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
#endif
}

bool SqliteStatement::bind_text(int index, const std::string& value) {
#if DMK_HAVE_SQLITE3
  if (!stmt_) return false;
  if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    db_.record_error("bind failed");
    return false;
  }
  return true;
#else
  (void)index;
  (void)value;
  return false;
#endif
}

bool SqliteStatement::bind_int64(int index, int64_t value) {
#if DMK_HAVE_SQLITE3
  if (!stmt_) return false;
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    db_.record_error("bind failed");
    return false;
  }
  return true;
#else
  (void)index;
  (void)value;
  return false;
#endif
}

bool SqliteStatement::step() {
#if DMK_HAVE_SQLITE3
  if (!stmt_ || failed_) return false;
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc != SQLITE_DONE) {
    failed_ = true;
    db_.record_error("step failed");
  }
  return false;
#else
  return false;
#endif
}

bool SqliteStatement::run() {
  if (!ok()) {
    return false;
  }
  while (step()) {
  }
  return !failed_;
}

std::string SqliteStatement::column_text(int index) const {
#if DMK_HAVE_SQLITE3
  if (!stmt_) return {};
  const unsigned char* text = sqlite3_column_text(stmt_, index);
  const int bytes = sqlite3_column_bytes(stmt_, index);
  return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes)) : std::string();
#else
  (void)index;
  return {};
#endif
}

} // namespace dmk::data
