#include <gtest/gtest.h>
#include "sagabus/errors.hpp"

using namespace sagabus;

// =============================================================================
// Predicates
// =============================================================================

TEST(ErrorIntrospectionTest, SagaContractViolation_ShouldReturnTrueForIsContractViolation) {
    SagaContractViolation error("examples.Reminder", "order");
    EXPECT_TRUE(error.is_contract_violation());
    EXPECT_FALSE(error.is_configuration_error());
}

TEST(ErrorIntrospectionTest, SagaConfigurationError_ShouldReturnTrueForIsConfigurationError) {
    SagaConfigurationError error("duplicate saga");
    EXPECT_TRUE(error.is_configuration_error());
    EXPECT_FALSE(error.is_contract_violation());
}

TEST(ErrorIntrospectionTest, ConcurrencyConflictError_ShouldReturnTrueForIsConcurrencyConflict) {
    ConcurrencyConflictError error("version mismatch", "X");
    EXPECT_TRUE(error.is_concurrency_conflict());
    EXPECT_EQ(error.saga_id(), "X");
}

TEST(ErrorIntrospectionTest, InvalidArgumentError_ShouldReturnTrueForIsInvalidArgument) {
    InvalidArgumentError error("bad input");
    EXPECT_TRUE(error.is_invalid_argument());
}

TEST(ErrorIntrospectionTest, GrpcError_WithInvalidArgument_ShouldReturnTrueForIsInvalidArgument) {
    GrpcError error("invalid argument", grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(error.is_invalid_argument());
}

TEST(ErrorIntrospectionTest, GrpcError_WithUnavailable_ShouldReturnTrueForIsConnectionError) {
    GrpcError error("unavailable", grpc::StatusCode::UNAVAILABLE);
    EXPECT_TRUE(error.is_connection_error());
}

TEST(ErrorIntrospectionTest, GrpcError_WithOtherCode_ShouldReturnFalseForPredicates) {
    GrpcError error("internal error", grpc::StatusCode::INTERNAL);
    EXPECT_FALSE(error.is_invalid_argument());
    EXPECT_FALSE(error.is_connection_error());
    EXPECT_FALSE(error.is_concurrency_conflict());
}

TEST(ErrorIntrospectionTest, ConnectionError_ShouldReturnTrueForIsConnectionError) {
    ConnectionError error("connection refused");
    EXPECT_TRUE(error.is_connection_error());
}

// =============================================================================
// Contract violation message
// =============================================================================

TEST(ErrorIntrospectionTest, SagaContractViolation_ShouldNamePayloadAndSaga) {
    SagaContractViolation error("examples.Reminder", "order");

    std::string message = error.what();
    EXPECT_NE(message.find("examples.Reminder"), std::string::npos);
    EXPECT_NE(message.find("saga order"), std::string::npos);
    EXPECT_EQ(error.payload_type(), "examples.Reminder");
    EXPECT_EQ(error.saga_type(), "order");
}

// =============================================================================
// gRPC status mapping
// =============================================================================

TEST(ErrorIntrospectionTest, ToGrpcStatus_ShouldMapEachCategory) {
    EXPECT_EQ(to_grpc_status(SagaContractViolation("T", "S")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(to_grpc_status(SagaConfigurationError("bad")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(to_grpc_status(ConcurrencyConflictError("race", "X")).error_code(),
              grpc::StatusCode::ABORTED);
    EXPECT_EQ(to_grpc_status(InvalidArgumentError("bad")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(to_grpc_status(ConnectionError("down")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(to_grpc_status(SagaError("boom")).error_code(), grpc::StatusCode::INTERNAL);
}
