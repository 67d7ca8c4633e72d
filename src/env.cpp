#include "env.hpp"
#include <sqlite3.h>
#include <kj/debug.h>
#include <cctype>
#include <utility>

namespace quasar
{

  static StorageError sqlite_error(sqlite3 *db, int rc, std::string_view what)
  {
    std::string msg(what);
    msg += ": ";
    msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return StorageError(msg, rc);
  }

  // -------------------- Stmt --------------------

  Stmt::Stmt(sqlite3 *db, std::string_view sql) : db_(db)
  {
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK)
      throw sqlite_error(db_, rc, "prepare failed");
  }

  Stmt::~Stmt() noexcept
  {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }

  Stmt::Stmt(Stmt &&other) noexcept : db_(other.db_), stmt_(other.stmt_)
  {
    other.stmt_ = nullptr;
  }

  Stmt &Stmt::operator=(Stmt &&other) noexcept
  {
    if (this != &other)
    {
      if (stmt_)
        sqlite3_finalize(stmt_);
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  void Stmt::fail(int rc, const char *what) const
  {
    throw sqlite_error(db_, rc, what);
  }

  Stmt &Stmt::bind(int idx, int64_t v)
  {
    int rc = sqlite3_bind_int64(stmt_, idx, v);
    if (rc != SQLITE_OK)
      fail(rc, "bind failed");
    return *this;
  }

  Stmt &Stmt::bind(int idx, uint64_t v)
  {
    return bind(idx, static_cast<int64_t>(v));
  }

  Stmt &Stmt::bind(int idx, double v)
  {
    int rc = sqlite3_bind_double(stmt_, idx, v);
    if (rc != SQLITE_OK)
      fail(rc, "bind failed");
    return *this;
  }

  Stmt &Stmt::bind(int idx, std::string_view text)
  {
    int rc = sqlite3_bind_text64(stmt_, idx, text.data(), text.size(), SQLITE_TRANSIENT, SQLITE_UTF8);
    if (rc != SQLITE_OK)
      fail(rc, "bind failed");
    return *this;
  }

  Stmt &Stmt::bindBlob(int idx, std::string_view bytes)
  {
    // a null data pointer would bind NULL instead of an empty blob
    static const char empty = 0;
    const void *data = bytes.empty() ? &empty : bytes.data();
    int rc = sqlite3_bind_blob64(stmt_, idx, data, bytes.size(), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
      fail(rc, "bind failed");
    return *this;
  }

  Stmt &Stmt::bindNull(int idx)
  {
    int rc = sqlite3_bind_null(stmt_, idx);
    if (rc != SQLITE_OK)
      fail(rc, "bind failed");
    return *this;
  }

  Stmt &Stmt::bindCell(int idx, const Cell &cell, ValueType type)
  {
    if (std::holds_alternative<int64_t>(cell))
      return bind(idx, std::get<int64_t>(cell));
    if (std::holds_alternative<double>(cell))
      return bind(idx, std::get<double>(cell));
    if (std::holds_alternative<std::string>(cell))
    {
      const auto &s = std::get<std::string>(cell);
      return type == ValueType::Blob ? bindBlob(idx, s) : bind(idx, std::string_view(s));
    }
    return bindNull(idx);
  }

  bool Stmt::step()
  {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    fail(rc, "step failed");
  }

  void Stmt::run()
  {
    if (step())
      throw StorageError("statement unexpectedly returned rows");
  }

  void Stmt::reset()
  {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  bool Stmt::isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

  int64_t Stmt::int64(int col) const { return sqlite3_column_int64(stmt_, col); }

  uint64_t Stmt::id(int col) const { return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col)); }

  double Stmt::real(int col) const { return sqlite3_column_double(stmt_, col); }

  std::string Stmt::text(int col) const
  {
    const unsigned char *p = sqlite3_column_text(stmt_, col);
    int n = sqlite3_column_bytes(stmt_, col);
    if (!p)
      return std::string();
    return std::string(reinterpret_cast<const char *>(p), static_cast<size_t>(n));
  }

  Cell Stmt::cell(int col) const
  {
    switch (sqlite3_column_type(stmt_, col))
    {
    case SQLITE_INTEGER:
      return int64(col);
    case SQLITE_FLOAT:
      return real(col);
    case SQLITE_TEXT:
      return text(col);
    case SQLITE_BLOB:
    {
      const void *p = sqlite3_column_blob(stmt_, col);
      int n = sqlite3_column_bytes(stmt_, col);
      if (!p || n == 0)
        return std::string();
      return std::string(static_cast<const char *>(p), static_cast<size_t>(n));
    }
    default:
      return std::monostate{};
    }
  }

  // -------------------- Env --------------------

  Env::Env(const std::filesystem::path &path, const EnvOptions &options) : path_(path)
  {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK)
    {
      StorageError err = sqlite_error(db_, rc, "open " + path_.string());
      close();
      throw err;
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, options.busyTimeoutMs);

    try
    {
      exec(std::string("PRAGMA foreign_keys = ") + (options.foreignKeys ? "ON" : "OFF") + ";");
      if (!inMemory())
      {
        // pragma arguments cannot be bound, accept only plain identifiers
        for (const auto *s : {&options.journalMode, &options.synchronous})
          for (char c : *s)
            if (!std::isalpha(static_cast<unsigned char>(c)))
              throw StorageError("invalid pragma value: " + *s);
        exec("PRAGMA journal_mode = " + options.journalMode + ";");
        exec("PRAGMA synchronous = " + options.synchronous + ";");
      }
    }
    catch (...)
    {
      close();
      throw;
    }
    KJ_LOG(INFO, "opened graph database", path_.string(), sqlite3_libversion());
  }

  Env::~Env() noexcept
  {
    close();
  }

  Env::Env(Env &&other) noexcept : db_(other.db_), path_(std::move(other.path_)), depth_(other.depth_)
  {
    other.db_ = nullptr;
    other.depth_ = 0;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      close();
      db_ = other.db_;
      path_ = std::move(other.path_);
      depth_ = other.depth_;
      other.db_ = nullptr;
      other.depth_ = 0;
    }
    return *this;
  }

  void Env::close() noexcept
  {
    if (db_)
    {
      // statements are owned by Stmt objects and finalized before this point
      int rc = sqlite3_close_v2(db_);
      if (rc != SQLITE_OK)
        KJ_LOG(ERROR, "sqlite3_close failed", sqlite3_errstr(rc));
      db_ = nullptr;
    }
  }

  sqlite3 *Env::raw() const { return db_; }

  bool Env::inMemory() const
  {
    return path_.empty() || path_ == ":memory:";
  }

  Stmt Env::prepare(std::string_view sql) const
  {
    return Stmt(db_, sql);
  }

  void Env::exec(const std::string &sql) const
  {
    char *err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
      std::string msg = err ? err : sqlite3_errstr(rc);
      sqlite3_free(err);
      throw StorageError("exec failed: " + msg, rc);
    }
  }

  // -------------------- Txn --------------------

  Txn::Txn(Env &env) : env_(&env), level_(env.depth_), name_("quasar_sp" + std::to_string(env.depth_))
  {
    env_->exec("SAVEPOINT " + name_ + ";");
    ++env_->depth_;
  }

  Txn::~Txn() noexcept
  {
    abort();
  }

  Txn::Txn(Txn &&other) noexcept : env_(other.env_), level_(other.level_), name_(std::move(other.name_))
  {
    other.env_ = nullptr;
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      env_ = other.env_;
      level_ = other.level_;
      name_ = std::move(other.name_);
      other.env_ = nullptr;
    }
    return *this;
  }

  void Txn::commit()
  {
    if (!env_)
      throw StorageError("commit on finished transaction");
    env_->exec("RELEASE " + name_ + ";");
    --env_->depth_;
    env_ = nullptr;
  }

  void Txn::abort() noexcept
  {
    if (!env_)
      return;
    Env *env = env_;
    env_ = nullptr;
    --env->depth_;
    try
    {
      env->exec("ROLLBACK TO " + name_ + "; RELEASE " + name_ + ";");
    }
    catch (const std::exception &e)
    {
      // sqlite may already have rolled the whole transaction back (e.g. SQLITE_FULL)
      KJ_LOG(ERROR, "savepoint rollback failed", name_, e.what());
    }
  }

} // namespace quasar
