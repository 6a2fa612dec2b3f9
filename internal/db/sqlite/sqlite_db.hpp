#pragma once

#include <sqlite3.h>

#include <string>

namespace relay::db::sqlite {

/*
  Owns the single sqlite3 connection the relay writes through.

  Opened FULLMUTEX with foreign keys and extended result codes on; WAL is
  used for file databases unless disabled in config. Statements are
  prepared per call by the repository.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Runs one or more statements that return no rows; throws on failure.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace relay::db::sqlite
