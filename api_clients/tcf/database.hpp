/*
 * database.hpp  Oct 5th, 2026
 *
 * RAII wrapper over a sqlite3 connection and its prepared statements, shared
 * by the checkpoint store and the sqlite warehouse. Every failure surfaces as
 * tcf::PersistenceError.
 *
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include "errors.hpp"

namespace tcf::dat {

/************ Deleters ************************************/
/* Close the connection and finalize statements when their owner goes away
 */
struct SqliteDeleter {
  void operator()(sqlite3* db) const noexcept
  {
    if ( db ) {
      sqlite3_close(db);
    }
  }
};

struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const noexcept
  {
    if ( stmt ) {
      sqlite3_finalize(stmt);
    }
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/************ SqliteDB ************************************/
/* Parent class for the stores that persist into sqlite. Children inherit
 * privately and drive statements through the protected helpers.
 */
class SqliteDB {
public:

  /********** Tx ******************************************/
  /* Immediate transaction, the write lock is taken at BEGIN so concurrent
   * writers queue on the busy timeout instead of failing at COMMIT. Rolls
   * back on destruction unless committed.
   */
  class Tx {
  public:
    explicit Tx(SqliteDB& db) : db_(db)
    {
      db_.exec("BEGIN IMMEDIATE TRANSACTION");
      open_ = true;
    }

    Tx(const Tx&) = delete;
    Tx& operator=(const Tx&) = delete;

    ~Tx()
    {
      if ( open_ ) {
        // nothrow path, a failed rollback leaves sqlite to abort the tx
        sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
      }
    }

    void commit()
    {
      if ( !open_ ) {
        throw PersistenceError("SqliteDB::Tx::commit: transaction already closed");
      }
      db_.exec("COMMIT");
      open_ = false;
    }

  private:
    SqliteDB& db_;
    bool open_{false};
  };

  /********** SqliteDB Constructor ************************/
  /* Opens (creating if needed) the database file in serialized mode.
   *
   * Throws:
   *   PersistenceError for failure to open sqlite connection
   */
  explicit SqliteDB(const std::string& path,
                    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                SQLITE_OPEN_FULLMUTEX)
  {
    sqlite3* raw = nullptr;
    const int code = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    db_.reset(raw);

    if ( code != SQLITE_OK ) {
      const std::string err = raw ? sqlite3_errmsg(raw)
                                  : "sqlite open error " + std::to_string(code);
      throw PersistenceError("SqliteDB: cannot open " + path + ": " + err);
    }
    sqlite3_busy_timeout(db_.get(), 5000);
  }

  SqliteDB(const SqliteDB&) = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;
  virtual ~SqliteDB() = default;

  sqlite3* handle() const noexcept { return db_.get(); }

  // true while a transaction is open on this connection
  bool in_transaction() const noexcept { return sqlite3_get_autocommit(db_.get()) == 0; }

  /********** exec() **************************************/
  /* Runs one or more statements that produce no rows.
   *
   * Throws:
   *   PersistenceError carrying sqlite's message
   */
  void exec(const std::string& sql)
  {
    char* errmsg = nullptr;
    const int code = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errmsg);
    if ( code != SQLITE_OK ) {
      const std::string err = errmsg ? errmsg : sqlite3_errmsg(db_.get());
      sqlite3_free(errmsg);
      throw PersistenceError("SqliteDB::exec: " + err);
    }
  }

protected:
  /********** prepare() ***********************************/
  /* Compiles a single statement. The returned handle finalizes itself.
   *
   * Throws:
   *   PersistenceError for failure to compile
   */
  Stmt prepare(std::string_view sql)
  {
    sqlite3_stmt* raw = nullptr;
    const int code = sqlite3_prepare_v2(db_.get(), sql.data(),
                                        static_cast<int>(sql.size()), &raw, nullptr);
    Stmt stmt{raw};
    if ( code != SQLITE_OK ) {
      fail_("prepare");
    }
    return stmt;
  }

  void bind(const Stmt& stmt, int idx, std::string_view value)
  {
    if ( sqlite3_bind_text(stmt.get(), idx, value.data(), static_cast<int>(value.size()),
                           SQLITE_TRANSIENT) != SQLITE_OK ) {
      fail_("bind");
    }
  }

  void bind(const Stmt& stmt, int idx, int64_t value)
  {
    if ( sqlite3_bind_int64(stmt.get(), idx, value) != SQLITE_OK ) {
      fail_("bind");
    }
  }

  /********** step() **************************************/
  /* We return:
   *   true while rows remain, false once the statement is done
   */
  bool step(const Stmt& stmt)
  {
    const int code = sqlite3_step(stmt.get());
    if ( code == SQLITE_ROW ) {
      return true;
    } else if ( code == SQLITE_DONE ) {
      return false;
    }
    fail_("step");
  }

  // Rewinds for the next row of a batch insert
  void rewind(const Stmt& stmt) noexcept
  {
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
  }

  static std::string column_text(const Stmt& stmt, int idx)
  {
    const auto* text = sqlite3_column_text(stmt.get(), idx);
    if ( text == nullptr ) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt.get(), idx)));
  }

  static int64_t column_int(const Stmt& stmt, int idx)
  {
    return sqlite3_column_int64(stmt.get(), idx);
  }

private:
  std::unique_ptr<sqlite3, SqliteDeleter> db_{nullptr};

  [[noreturn]] void fail_(const char* what) const
  {
    throw PersistenceError(std::string("SqliteDB::") + what + ": " +
                           sqlite3_errmsg(db_.get()));
  }
};

} // end namespace tcf::dat
