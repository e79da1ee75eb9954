#include "sagabus/dispatch_service.hpp"

#include "sagabus/bus_context.hpp"
#include "sagabus/errors.hpp"
#include "sagabus/logging.hpp"
#include "sagabus/message.hpp"

namespace sagabus {

grpc::Status SagaDispatchServiceImpl::Dispatch(grpc::ServerContext* context,
                                               const Envelope* request,
                                               DispatchReport* response) {
    ReportingBusContext bus(*request, response);
    try {
        orchestrator_->dispatch(*request, bus);
    } catch (const SagaError& e) {
        auto status = to_grpc_status(e);
        log_error(component_, "dispatch_failed",
                  {{"message_id", request->message_id()},
                   {"message_type", message_type(*request)},
                   {"code", static_cast<int>(status.error_code())},
                   {"error", e.what()}});
        return status;
    } catch (const std::exception& e) {
        log_error(component_, "dispatch_failed",
                  {{"message_id", request->message_id()},
                   {"message_type", message_type(*request)},
                   {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

} // namespace sagabus
