#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "sagabus/dispatch.grpc.pb.h"
#include "saga_orchestrator.hpp"

namespace sagabus {

/**
 * gRPC front of a SagaOrchestrator.
 *
 * Each call dispatches one envelope and answers with a DispatchReport listing
 * the deferral, timeout cancellations, timeout requests and replies the
 * transport must carry out. Saga errors map to gRPC status codes through
 * to_grpc_status(): a lost create or update race is ABORTED so the transport
 * redelivers, and a contract violation is FAILED_PRECONDITION.
 */
class SagaDispatchServiceImpl final : public SagaDispatchService::Service {
public:
    SagaDispatchServiceImpl(std::shared_ptr<const SagaOrchestrator> orchestrator,
                            std::string component)
        : orchestrator_(std::move(orchestrator)), component_(std::move(component)) {}

    grpc::Status Dispatch(grpc::ServerContext* context,
                          const Envelope* request,
                          DispatchReport* response) override;

private:
    std::shared_ptr<const SagaOrchestrator> orchestrator_;
    std::string component_;
};

} // namespace sagabus
