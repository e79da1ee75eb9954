#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace sagabus {

/**
 * Base exception for all saga dispatch errors.
 */
class SagaError : public std::runtime_error {
public:
    explicit SagaError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if a saga lacks a capability it is required to have.
     */
    virtual bool is_contract_violation() const { return false; }

    /**
     * Returns true if the registry was configured inconsistently.
     */
    virtual bool is_configuration_error() const { return false; }

    /**
     * Returns true if a concurrent dispatch won a create or update race.
     */
    virtual bool is_concurrency_conflict() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }
};

/**
 * Thrown when a timeout arrives for a saga that has no handler for its payload.
 *
 * The saga scheduled the timeout itself, so the missing handler is a defect in
 * the saga, not in the message. The dispatch is aborted and nothing is persisted.
 */
class SagaContractViolation : public SagaError {
public:
    SagaContractViolation(const std::string& payload_type, const std::string& saga_type)
        : SagaError("Timeout arrived with state " + payload_type + ", but saga " + saga_type +
                    " has no timeout handler for " + payload_type +
                    ". Register on_timeout<" + payload_type + "> for " + saga_type),
          payload_type_(payload_type), saga_type_(saga_type) {}

    const std::string& payload_type() const { return payload_type_; }
    const std::string& saga_type() const { return saga_type_; }

    bool is_contract_violation() const override { return true; }

private:
    std::string payload_type_;
    std::string saga_type_;
};

/**
 * Thrown when the saga registry is built or queried inconsistently.
 */
class SagaConfigurationError : public SagaError {
public:
    explicit SagaConfigurationError(const std::string& message)
        : SagaError(message) {}

    bool is_configuration_error() const override { return true; }
};

/**
 * Thrown by persisters when a create finds the id taken or an update finds
 * a newer version stored.
 */
class ConcurrencyConflictError : public SagaError {
public:
    ConcurrencyConflictError(const std::string& message, const std::string& saga_id)
        : SagaError(message), saga_id_(saga_id) {}

    const std::string& saga_id() const { return saga_id_; }

    bool is_concurrency_conflict() const override { return true; }

private:
    std::string saga_id_;
};

/**
 * Thrown when an invalid argument is provided, e.g. a payload that does not
 * unpack into the registered message type.
 */
class InvalidArgumentError : public SagaError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : SagaError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when a gRPC call fails.
 */
class GrpcError : public SagaError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : SagaError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_connection_error() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE;
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when connection to a remote port fails.
 */
class ConnectionError : public SagaError {
public:
    explicit ConnectionError(const std::string& message)
        : SagaError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Map an error to the gRPC status returned to the transport.
 */
inline grpc::Status to_grpc_status(const SagaError& error) {
    if (error.is_contract_violation() || error.is_configuration_error()) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.what());
    }
    if (error.is_concurrency_conflict()) {
        return grpc::Status(grpc::StatusCode::ABORTED, error.what());
    }
    if (error.is_invalid_argument()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.what());
    }
    if (error.is_connection_error()) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, error.what());
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, error.what());
}

} // namespace sagabus
