#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace stockroom {

/**
 * Base exception for all Stockroom errors.
 *
 * Each subclass maps onto one gRPC status code so that a service boundary can
 * translate any engine failure with to_grpc_status().
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * gRPC status code reported for this error.
     */
    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

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
     * Returns true if a concurrent writer won the race for the stream.
     */
    virtual bool is_conflict() const { return false; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * Thrown when a command is malformed. Raised before any storage access.
 */
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when an aggregate or a reservation does not exist.
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
    bool is_not_found() const override { return true; }
};

/**
 * Thrown when a command is rejected by business logic.
 * Maps to gRPC FAILED_PRECONDITION status.
 */
class CommandRejectedError : public Error {
public:
    explicit CommandRejectedError(const std::string& message)
        : Error(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown by an event store when the stream moved past the expected version.
 */
class ConcurrencyConflictError : public Error {
public:
    ConcurrencyConflictError(const std::string& message, uint32_t expected, uint32_t actual)
        : Error(message), expected_(expected), actual_(actual) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::ABORTED; }
    bool is_conflict() const override { return true; }

    uint32_t expected_version() const { return expected_; }
    uint32_t actual_version() const { return actual_; }

private:
    uint32_t expected_;
    uint32_t actual_;
};

} // namespace stockroom
