#pragma once

#include <string>
#include "logging.hpp"

namespace sagabus {

/**
 * Process configuration for a saga dispatch host.
 *
 * Production deployments configure through environment variables so the same
 * binary runs unchanged in every environment:
 *
 * - PORT: listening port (default 51100)
 * - SAGABUS_STORE_ENDPOINT: remote saga store; empty selects the in-memory persister
 * - SAGABUS_LOG_LEVEL: debug, info, warn or error (default info)
 * - SAGABUS_SERVICE_NAME: component name used in log records
 */
struct BusConfig {
    static constexpr const char* DEFAULT_PORT = "51100";
    static constexpr const char* DEFAULT_SERVICE_NAME = "sagabus";

    std::string listen_address = std::string("0.0.0.0:") + DEFAULT_PORT;
    std::string store_endpoint;
    LogLevel log_level = LogLevel::Info;
    std::string service_name = DEFAULT_SERVICE_NAME;

    /**
     * Returns true if sagas are stored by a remote SagaStoreService.
     */
    bool uses_remote_store() const { return !store_endpoint.empty(); }

    /**
     * Read the configuration from the environment, falling back to defaults.
     */
    static BusConfig from_env();
};

/**
 * Read an environment variable, returning `fallback` when unset or empty.
 */
std::string env_or(const std::string& name, const std::string& fallback);

} // namespace sagabus
