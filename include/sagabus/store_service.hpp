#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <google/protobuf/empty.pb.h>
#include "sagabus/store.grpc.pb.h"
#include "persister.hpp"

namespace sagabus {

/**
 * Serves any SagaPersister over gRPC.
 *
 * Status codes: ALREADY_EXISTS when Save finds the id taken, ABORTED when
 * Update loses a version race, NOT_FOUND when a lookup finds no active saga.
 */
class SagaStoreServiceImpl final : public SagaStoreService::Service {
public:
    SagaStoreServiceImpl(std::shared_ptr<SagaPersister> persister, std::string component)
        : persister_(std::move(persister)), component_(std::move(component)) {}

    grpc::Status Save(grpc::ServerContext* context, const SagaEntity* request,
                      google::protobuf::Empty* response) override;

    grpc::Status Update(grpc::ServerContext* context, const SagaEntity* request,
                        google::protobuf::Empty* response) override;

    grpc::Status Complete(grpc::ServerContext* context, const SagaEntity* request,
                          google::protobuf::Empty* response) override;

    grpc::Status Get(grpc::ServerContext* context, const GetSagaRequest* request,
                     SagaEntity* response) override;

    grpc::Status FindByProperty(grpc::ServerContext* context, const FindSagaRequest* request,
                                SagaEntity* response) override;

private:
    grpc::Status failed(const char* operation, const std::string& saga_id,
                        const grpc::Status& status) const;

    std::shared_ptr<SagaPersister> persister_;
    std::string component_;
};

} // namespace sagabus
