#pragma once

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <grpcpp/grpcpp.h>
#include <google/protobuf/empty.pb.h>
#include "sagabus/types.pb.h"
#include "sagabus/store.pb.h"
#include "sagabus/store.grpc.pb.h"
#include "errors.hpp"
#include "helpers.hpp"
#include "persister.hpp"

namespace sagabus {

/**
 * SagaPersister backed by a remote SagaStoreService.
 *
 * Lets several dispatch hosts share one saga store. The store's create and
 * version checks surface as ConcurrencyConflictError exactly like a local
 * persister's.
 *
 * Example:
 *   auto persister = GrpcSagaPersister::connect("localhost:51101");
 *   auto registry = builder.build(std::move(persister));
 */
class GrpcSagaPersister : public SagaPersister {
public:
    /**
     * Connect to a saga store at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:51101")
     */
    static std::unique_ptr<GrpcSagaPersister> connect(const std::string& endpoint) {
        auto channel = grpc::CreateChannel(helpers::format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        return std::make_unique<GrpcSagaPersister>(channel);
    }

    /**
     * Connect using an endpoint from environment variable with fallback.
     */
    static std::unique_ptr<GrpcSagaPersister> from_env(const std::string& env_var,
                                                       const std::string& default_endpoint) {
        const char* endpoint = std::getenv(env_var.c_str());
        return connect(endpoint ? endpoint : default_endpoint);
    }

    explicit GrpcSagaPersister(std::shared_ptr<grpc::Channel> channel)
        : stub_(SagaStoreService::NewStub(channel)) {}

    void save(const SagaEntity& entity) override {
        google::protobuf::Empty response;
        grpc::ClientContext context;
        check(stub_->Save(&context, entity, &response), entity.id());
    }

    void update(const SagaEntity& entity) override {
        google::protobuf::Empty response;
        grpc::ClientContext context;
        check(stub_->Update(&context, entity, &response), entity.id());
    }

    void complete(const SagaEntity& entity) override {
        google::protobuf::Empty response;
        grpc::ClientContext context;
        check(stub_->Complete(&context, entity, &response), entity.id());
    }

    std::optional<SagaEntity> get(const std::string& entity_type,
                                  const std::string& id) override {
        GetSagaRequest request;
        request.set_entity_type(entity_type);
        request.set_id(id);

        SagaEntity response;
        grpc::ClientContext context;
        auto status = stub_->Get(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
            return std::nullopt;
        }
        check(status, id);
        return response;
    }

    std::optional<SagaEntity> find_by_property(const std::string& entity_type,
                                               const std::string& property,
                                               const std::string& value) override {
        FindSagaRequest request;
        request.set_entity_type(entity_type);
        request.set_property(property);
        request.set_value(value);

        SagaEntity response;
        grpc::ClientContext context;
        auto status = stub_->FindByProperty(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
            return std::nullopt;
        }
        check(status, "");
        return response;
    }

private:
    static void check(const grpc::Status& status, const std::string& saga_id) {
        if (status.ok()) {
            return;
        }
        switch (status.error_code()) {
            case grpc::StatusCode::ALREADY_EXISTS:
            case grpc::StatusCode::ABORTED:
                throw ConcurrencyConflictError(status.error_message(), saga_id);
            default:
                throw GrpcError(status.error_message(), status.error_code());
        }
    }

    std::unique_ptr<SagaStoreService::Stub> stub_;
};

} // namespace sagabus
