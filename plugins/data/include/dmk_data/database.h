#pragma once

#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace dmk::data {

class IDatabase {
 public:
  virtual ~IDatabase() = default;
  virtual bool open(const std::string& path) = 0;
  virtual bool exec(const std::string& sql) = 0;
  virtual bool is_open() const = 0;
};

class SqliteDatabase;

// One prepared statement. Text parameters are bound by 1-based index; rows are
// read column by column after step() returns true.
class SqliteStatement {
 public:
  SqliteStatement(SqliteDatabase& db, const std::string& sql);
  ~SqliteStatement();
  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  bool ok() const { return stmt_ != nullptr; }
  bool bind_text(int index, const std::string& value);
  bool bind_int64(int index, int64_t value);
  // True while a row is available. Errors are logged and end iteration.
  bool step();
  // Runs to completion; false on error.
  bool run();
  std::string column_text(int index) const;

 private:
  SqliteDatabase& db_;
  sqlite3_stmt* stmt_ = nullptr;
  bool failed_ = false;
};

class SqliteDatabase final : public IDatabase {
 public:
  bool open(const std::string& path) override;
  bool exec(const std::string& sql) override;
  bool is_open() const override { return db_ != nullptr; }
  void close();
  const std::string& last_error() const { return last_error_; }
  ~SqliteDatabase() override;

 private:
  friend class SqliteStatement;
  void record_error(const std::string& what);

  sqlite3* db_ = nullptr;
  std::string last_error_;
};

} // namespace dmk::data
