#include "sagabus/config.hpp"

#include <cstdlib>
#include "sagabus/helpers.hpp"

namespace sagabus {

std::string env_or(const std::string& name, const std::string& fallback) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

BusConfig BusConfig::from_env() {
    BusConfig config;
    config.listen_address = "0.0.0.0:" + env_or("PORT", DEFAULT_PORT);
    config.store_endpoint = helpers::format_endpoint(env_or("SAGABUS_STORE_ENDPOINT", ""));
    config.service_name = env_or("SAGABUS_SERVICE_NAME", DEFAULT_SERVICE_NAME);

    auto level_text = env_or("SAGABUS_LOG_LEVEL", "info");
    if (!parse_log_level(level_text, config.log_level)) {
        log_warn(config.service_name, "unknown_log_level",
                 {{"value", level_text}, {"fallback", "info"}});
        config.log_level = LogLevel::Info;
    }
    return config;
}

} // namespace sagabus
