#include "sagabus/store_service.hpp"

#include "sagabus/errors.hpp"
#include "sagabus/logging.hpp"

namespace sagabus {

grpc::Status SagaStoreServiceImpl::Save(grpc::ServerContext* context, const SagaEntity* request,
                                        google::protobuf::Empty* response) {
    try {
        persister_->save(*request);
    } catch (const ConcurrencyConflictError& e) {
        return failed("save", request->id(),
                      grpc::Status(grpc::StatusCode::ALREADY_EXISTS, e.what()));
    } catch (const SagaError& e) {
        return failed("save", request->id(), to_grpc_status(e));
    }
    return grpc::Status::OK;
}

grpc::Status SagaStoreServiceImpl::Update(grpc::ServerContext* context, const SagaEntity* request,
                                          google::protobuf::Empty* response) {
    try {
        persister_->update(*request);
    } catch (const SagaError& e) {
        return failed("update", request->id(), to_grpc_status(e));
    }
    return grpc::Status::OK;
}

grpc::Status SagaStoreServiceImpl::Complete(grpc::ServerContext* context, const SagaEntity* request,
                                            google::protobuf::Empty* response) {
    try {
        persister_->complete(*request);
    } catch (const SagaError& e) {
        return failed("complete", request->id(), to_grpc_status(e));
    }
    return grpc::Status::OK;
}

grpc::Status SagaStoreServiceImpl::Get(grpc::ServerContext* context, const GetSagaRequest* request,
                                       SagaEntity* response) {
    if (request->id().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "saga id is required");
    }
    auto entity = persister_->get(request->entity_type(), request->id());
    if (!entity) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "No active " + request->entity_type() + " saga " + request->id());
    }
    *response = std::move(*entity);
    return grpc::Status::OK;
}

grpc::Status SagaStoreServiceImpl::FindByProperty(grpc::ServerContext* context,
                                                  const FindSagaRequest* request,
                                                  SagaEntity* response) {
    if (request->property().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "property is required");
    }
    auto entity = persister_->find_by_property(request->entity_type(), request->property(),
                                               request->value());
    if (!entity) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "No active " + request->entity_type() + " saga with " +
                                request->property() + "=" + request->value());
    }
    *response = std::move(*entity);
    return grpc::Status::OK;
}

grpc::Status SagaStoreServiceImpl::failed(const char* operation, const std::string& saga_id,
                                          const grpc::Status& status) const {
    log_warn(component_, "store_operation_rejected",
             {{"operation", operation},
              {"saga_id", saga_id},
              {"code", static_cast<int>(status.error_code())},
              {"error", status.error_message()}});
    return status;
}

} // namespace sagabus
