#include "storefront/db.hpp"
#include "storefront/errors.hpp"
#include "storefront/logging.hpp"

#include <sqlite3.h>

namespace storefront {
namespace db {

namespace {

[[noreturn]] void throw_store_error(sqlite3* handle, int rc, const std::string& context) {
    std::string detail = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
    throw StoreError(context + ": " + detail, rc);
}

} // anonymous namespace

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(sqlite3* handle, const std::string& sql)
    : handle_(handle), stmt_(nullptr), sql_(sql) {
    int rc = sqlite3_prepare_v2(handle_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw_store_error(handle_, rc, "prepare failed");
    }
}

Statement::Statement(Statement&& other) noexcept
    : handle_(other.handle_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) throw_store_error(handle_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_store_error(handle_, rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_store_error(handle_, rc, "bind failed");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_store_error(handle_, rc, "step failed");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (column_is_null(column)) return std::nullopt;
    return column_text(column);
}

bool Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// =============================================================================
// Connection
// =============================================================================

Connection::Connection(const std::string& path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &handle_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = handle_ ? sqlite3_errmsg(handle_) : sqlite3_errstr(rc);
        sqlite3_close(handle_);
        handle_ = nullptr;
        throw StoreError("open " + path + " failed: " + detail, rc);
    }
    sqlite3_busy_timeout(handle_, busy_timeout_ms);
    execute("PRAGMA foreign_keys = ON");
    execute("PRAGMA synchronous = NORMAL");
}

Connection::~Connection() {
    if (handle_) sqlite3_close_v2(handle_);
}

void Connection::execute(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string detail = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw StoreError("execute failed: " + detail, rc);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(handle_, sql);
}

int64_t Connection::last_insert_id() const {
    return sqlite3_last_insert_rowid(handle_);
}

int Connection::changes() const {
    return sqlite3_changes(handle_);
}

// =============================================================================
// ConnectionPool
// =============================================================================

ConnectionPool::Lease::~Lease() {
    if (connection_) pool_->release(std::move(connection_));
}

ConnectionPool::ConnectionPool(const std::string& path, size_t size, int busy_timeout_ms)
    : size_(size), wait_timeout_(busy_timeout_ms) {
    if (size == 0) throw ConfigError("connection pool size must be positive");
    idle_.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        idle_.push_back(std::make_unique<Connection>(path, busy_timeout_ms));
    }
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, wait_timeout_, [this] { return !idle_.empty(); })) {
        throw StoreError("no store connection available", SQLITE_BUSY);
    }
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    return Lease(this, std::move(connection));
}

void ConnectionPool::release(std::unique_ptr<Connection> connection) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(connection));
    }
    available_.notify_one();
}

// =============================================================================
// Transaction
// =============================================================================

Transaction::Transaction(Connection& connection, Mode mode) : connection_(connection) {
    connection_.execute(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
}

Transaction::~Transaction() {
    if (!active_) return;
    try {
        connection_.execute("ROLLBACK");
    } catch (const StoreError& e) {
        log_error("store", "rollback_failed", {{"error", e.what()}, {"code", e.code()}});
    }
}

void Transaction::commit() {
    connection_.execute("COMMIT");
    active_ = false;
}

} // namespace db
} // namespace storefront
