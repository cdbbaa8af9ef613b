#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "types.hpp"

namespace storefront {

/**
 * Base exception for all order core errors.
 *
 * Business-rule failures (validation, stock, identifier, transition,
 * not found) are distinct from transient store failures so callers can
 * tell "fix the input" from "retry safely".
 */
class OrderError : public std::runtime_error {
public:
    explicit OrderError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if retrying the whole operation may succeed.
     */
    virtual bool is_transient() const { return false; }

    /**
     * Convert to the gRPC status returned by the order service.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::UNKNOWN, what());
    }
};

/**
 * Malformed or empty input, rejected before any store access.
 */
class ValidationFailedError : public OrderError {
public:
    explicit ValidationFailedError(const std::string& message)
        : OrderError(message) {}

    bool is_invalid_argument() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * One or more line items exceed available stock. Carries every shortfall,
 * not just the first.
 */
class InsufficientStockError : public OrderError {
public:
    explicit InsufficientStockError(std::vector<StockShortfall> shortfalls);

    const std::vector<StockShortfall>& shortfalls() const { return shortfalls_; }

    bool is_precondition_failed() const override { return true; }

    grpc::Status to_grpc_status() const override;

private:
    static std::string describe(const std::vector<StockShortfall>& shortfalls);

    std::vector<StockShortfall> shortfalls_;
};

/**
 * Every order number candidate collided. Retry the whole checkout.
 */
class IdentifierExhaustedError : public OrderError {
public:
    explicit IdentifierExhaustedError(int attempts)
        : OrderError("Could not allocate a unique order number after " +
                     std::to_string(attempts) + " attempts"),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

    bool is_transient() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::ABORTED, what());
    }

private:
    int attempts_;
};

/**
 * Status change not permitted from the order's current state.
 */
class IllegalTransitionError : public OrderError {
public:
    IllegalTransitionError(OrderStatus current, OrderStatus attempted)
        : OrderError("Cannot change from " + to_string(current) + " to " + to_string(attempted)),
          current_(current), attempted_(attempted) {}

    OrderStatus current() const { return current_; }
    OrderStatus attempted() const { return attempted_; }

    bool is_precondition_failed() const override { return true; }

    grpc::Status to_grpc_status() const override;

private:
    OrderStatus current_;
    OrderStatus attempted_;
};

/**
 * Lookup found nothing. Used instead of "forbidden" so tenants cannot probe
 * each other's orders.
 */
class NotFoundError : public OrderError {
public:
    explicit NotFoundError(const std::string& message)
        : OrderError(message) {}

    bool is_not_found() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }
};

/**
 * Store-level failure (busy, I/O, constraint). Never swallowed by the core.
 */
class StoreError : public OrderError {
public:
    StoreError(const std::string& message, int code)
        : OrderError(message), code_(code) {}

    /// SQLite result code.
    int code() const { return code_; }

    bool is_transient() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, what());
    }

private:
    int code_;
};

/**
 * Invalid configuration value at startup.
 */
class ConfigError : public OrderError {
public:
    explicit ConfigError(const std::string& message)
        : OrderError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown by the client when a call fails with a status that has no
 * dedicated error type.
 */
class GrpcError : public OrderError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : OrderError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_precondition_failed() const override {
        return status_code_ == grpc::StatusCode::FAILED_PRECONDITION;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_transient() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE ||
               status_code_ == grpc::StatusCode::ABORTED;
    }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(status_code_, what());
    }

private:
    grpc::StatusCode status_code_;
};

} // namespace storefront
