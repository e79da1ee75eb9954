#include "sagabus/timeout_dispatcher.hpp"

#include "sagabus/helpers.hpp"
#include "sagabus/message.hpp"

namespace sagabus {

void TimeoutDispatcher::dispatch_timeout(SagaInstance& saga, const Envelope& message) const {
    const auto& payload = timeout_payload(message);
    auto payload_type = helpers::type_name_from_url(payload.type_url());

    if (const auto* handler = registry_->timeout_handler_for(saga.saga_type(), payload_type)) {
        (*handler)(saga, payload);
        return;
    }

    if (const auto* handler = registry_->any_timeout_handler_for(saga.saga_type())) {
        (*handler)(saga, payload);
        return;
    }

    throw SagaContractViolation(payload_type.empty() ? "<empty>" : payload_type, saga.saga_type());
}

} // namespace sagabus
