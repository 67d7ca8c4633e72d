#pragma once
#include "codec.hpp"
#include "errors.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace quasar
{

  struct EnvOptions
  {
    int busyTimeoutMs{5000};
    // ignored for in-memory databases
    std::string journalMode{"WAL"};
    std::string synchronous{"NORMAL"};
    bool foreignKeys{true};
  };

  // prepared statement, finalized on destruction
  class Stmt
  {
  public:
    Stmt(sqlite3 *db, std::string_view sql);
    ~Stmt() noexcept;
    Stmt(const Stmt &) = delete;
    Stmt &operator=(const Stmt &) = delete;
    Stmt(Stmt &&other) noexcept;
    Stmt &operator=(Stmt &&other) noexcept;

    // 1-based parameter indexes, like sqlite3_bind_*
    Stmt &bind(int idx, int64_t v);
    Stmt &bind(int idx, uint64_t v);
    Stmt &bind(int idx, double v);
    Stmt &bind(int idx, std::string_view text);
    Stmt &bindBlob(int idx, std::string_view bytes);
    Stmt &bindNull(int idx);
    // binds TEXT or BLOB depending on the tag for string cells
    Stmt &bindCell(int idx, const Cell &cell, ValueType type);

    // true while a row is available
    bool step();
    // step a statement that must not produce rows
    void run();
    void reset();

    bool isNull(int col) const;
    int64_t int64(int col) const;
    uint64_t id(int col) const;
    double real(int col) const;
    std::string text(int col) const;
    Cell cell(int col) const;

  private:
    [[noreturn]] void fail(int rc, const char *what) const;

    sqlite3 *db_{};
    sqlite3_stmt *stmt_{};
  };

  class Env
  {
  public:
    // ":memory:" opens a private in-memory database
    explicit Env(const std::filesystem::path &path, const EnvOptions &options = EnvOptions{});
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    sqlite3 *raw() const;
    const std::filesystem::path &path() const { return path_; }
    bool inMemory() const;

    Stmt prepare(std::string_view sql) const;
    // runs one or more statements without parameters
    void exec(const std::string &sql) const;

    // current savepoint nesting, 0 outside any transaction
    unsigned depth() const { return depth_; }

  private:
    friend class Txn;

    void close() noexcept;

    sqlite3 *db_{};
    std::filesystem::path path_;
    unsigned depth_{0};
  };

  // Savepoint-backed transaction. The outermost one begins a real sqlite
  // transaction, inner ones nest. Destroying an uncommitted Txn rolls back.
  class Txn
  {
  public:
    explicit Txn(Env &env);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    bool active() const { return env_ != nullptr; }
    bool outermost() const { return level_ == 0; }
    void commit();
    void abort() noexcept;

  private:
    Env *env_{};
    unsigned level_{0};
    std::string name_;
  };

} // namespace quasar
