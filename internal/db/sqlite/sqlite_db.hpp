#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace foreman::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3 connection.

  The connection is shared by every transaction, so transactions are
  serialized on WriterMutex() for their whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // WAL, busy timeout, foreign keys
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace foreman::db::sqlite
