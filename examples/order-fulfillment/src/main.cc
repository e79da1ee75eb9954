#include "order_saga.hpp"
#include "sagabus/dispatch_service.hpp"
#include "sagabus/store_client.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    auto config = sagabus::BusConfig::from_env();
    sagabus::set_log_level(config.log_level);

    std::shared_ptr<sagabus::SagaPersister> persister;
    if (config.uses_remote_store()) {
        persister = sagabus::GrpcSagaPersister::connect(config.store_endpoint);
    } else {
        persister = std::make_shared<sagabus::InMemorySagaPersister>();
    }

    sagabus::SagaRegistry::Builder builder;
    order_fulfillment::register_order_saga(builder);

    std::shared_ptr<const sagabus::SagaRegistry> registry;
    try {
        registry = builder.build(persister);
    } catch (const sagabus::SagaConfigurationError& e) {
        sagabus::log_error(config.service_name, "invalid_saga_configuration", {{"error", e.what()}});
        return 1;
    }

    auto unclaimed = std::make_shared<sagabus::FunctionNotFoundHandler>(
        "log-unclaimed", [&config](const sagabus::Envelope& message) {
            sagabus::log_warn(config.service_name, "message_unclaimed",
                              {{"message_id", message.message_id()},
                               {"message_type", sagabus::message_type(message)}});
        });

    auto orchestrator = std::make_shared<sagabus::SagaOrchestrator>(
        registry, persister, std::make_shared<sagabus::CombIdGenerator>(),
        std::vector<std::shared_ptr<sagabus::SagaNotFoundHandler>>{unclaimed});

    grpc::EnableDefaultHealthCheckService(true);

    sagabus::SagaDispatchServiceImpl service(orchestrator, config.service_name);

    grpc::ServerBuilder server_builder;
    server_builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    server_builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(server_builder.BuildAndStart());
    if (!server) {
        sagabus::log_error(config.service_name, "server_start_failed",
                           {{"address", config.listen_address}});
        return 1;
    }

    sagabus::log_info(config.service_name, "saga_server_started",
                      {{"address", config.listen_address},
                       {"store", config.uses_remote_store() ? config.store_endpoint : "in-memory"},
                       {"sagas", registry->saga_types()}});

    server->Wait();

    return 0;
}
