#include "sagabus/saga_not_found.hpp"

#include "sagabus/logging.hpp"
#include "sagabus/message.hpp"

namespace sagabus {

namespace {

const char* const COMPONENT = "saga-orchestrator";

}  // namespace

void SagaNotFoundFallback::invoke(const Envelope& message) const {
    log_info(COMPONENT, "saga_not_found",
             {{"message_type", message_type(message)},
              {"message_id", message.message_id()},
              {"handlers", handlers_.size()}});

    for (const auto& handler : handlers_) {
        log_debug(COMPONENT, "invoking_saga_not_found_handler", {{"handler", handler->name()}});
        handler->handle(message);
    }
}

} // namespace sagabus
