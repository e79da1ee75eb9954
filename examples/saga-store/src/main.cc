#include "sagabus/config.hpp"
#include "sagabus/logging.hpp"
#include "sagabus/persister.hpp"
#include "sagabus/store_service.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    auto config = sagabus::BusConfig::from_env();
    sagabus::set_log_level(config.log_level);

    auto persister = std::make_shared<sagabus::InMemorySagaPersister>();

    grpc::EnableDefaultHealthCheckService(true);

    sagabus::SagaStoreServiceImpl service(persister, config.service_name);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        sagabus::log_error(config.service_name, "server_start_failed",
                           {{"address", config.listen_address}});
        return 1;
    }

    sagabus::log_info(config.service_name, "saga_store_started",
                      {{"address", config.listen_address}});

    server->Wait();

    return 0;
}
