#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace storefront {
namespace db {

/**
 * Prepared statement bound to one connection.
 *
 * Parameters are 1-based, columns are 0-based, as in SQLite.
 * Every failing SQLite call throws StoreError.
 */
class Statement {
public:
    Statement(sqlite3* handle, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind_null(int index);

    /**
     * Advance to the next row. Returns false when the statement is done.
     */
    bool step();

    /**
     * Run a statement that returns no rows.
     */
    void run();

    /**
     * Reset for re-execution with new bindings.
     */
    void reset();

    int64_t column_int64(int column) const;
    std::string column_text(int column) const;
    std::optional<std::string> column_optional_text(int column) const;
    bool column_is_null(int column) const;

private:
    sqlite3* handle_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

/**
 * One SQLite connection. Not thread-safe; use one connection per request
 * through ConnectionPool.
 */
class Connection {
public:
    Connection(const std::string& path, int busy_timeout_ms);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Execute one or more statements that return no rows.
     */
    void execute(const std::string& sql);

    Statement prepare(const std::string& sql);

    int64_t last_insert_id() const;

    /**
     * Rows modified by the most recent INSERT/UPDATE/DELETE.
     */
    int changes() const;

    const std::string& path() const { return path_; }

private:
    sqlite3* handle_ = nullptr;
    std::string path_;
};

/**
 * Fixed-size pool of connections to one database file.
 *
 * Components take the pool by reference and lease a connection per
 * operation; there is no process-wide store handle.
 */
class ConnectionPool {
public:
    /**
     * A leased connection, returned to the pool on destruction.
     */
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
            : pool_(pool), connection_(std::move(connection)) {}
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept
            : pool_(other.pool_), connection_(std::move(other.connection_)) {}
        Lease& operator=(Lease&&) = delete;

        Connection& operator*() { return *connection_; }
        Connection* operator->() { return connection_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<Connection> connection_;
    };

    /**
     * Open `size` connections to `path`. `busy_timeout_ms` bounds both
     * SQLite lock waits and waits for a free connection.
     */
    ConnectionPool(const std::string& path, size_t size, int busy_timeout_ms);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Lease a connection, waiting up to the busy timeout for one to free up.
     * @throws StoreError if none becomes available
     */
    Lease acquire();

    size_t size() const { return size_; }

private:
    void release(std::unique_ptr<Connection> connection);

    size_t size_;
    std::chrono::milliseconds wait_timeout_;
    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Connection>> idle_;
};

/**
 * RAII transaction. Rolls back on destruction unless committed.
 */
class Transaction {
public:
    enum class Mode {
        Deferred,
        Immediate  // take the write lock up front
    };

    explicit Transaction(Connection& connection, Mode mode = Mode::Immediate);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Connection& connection_;
    bool active_ = true;
};

} // namespace db
} // namespace storefront
