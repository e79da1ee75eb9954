#pragma once

#include <memory>
#include "sagabus/types.pb.h"
#include "saga.hpp"
#include "saga_registry.hpp"

namespace sagabus {

/**
 * Delivers a due timeout notice to the saga instance that requested it.
 *
 * The payload is the notice state when present, otherwise the envelope body.
 * A typed handler registered for the payload's exact type wins; a catch-all
 * handler receives anything else. A saga with neither cannot process a
 * timeout it scheduled itself, which is a SagaContractViolation.
 */
class TimeoutDispatcher {
public:
    explicit TimeoutDispatcher(std::shared_ptr<const SagaRegistry> registry)
        : registry_(std::move(registry)) {}

    /**
     * @throws SagaContractViolation if the saga cannot handle the payload type
     */
    void dispatch_timeout(SagaInstance& saga, const Envelope& message) const;

private:
    std::shared_ptr<const SagaRegistry> registry_;
};

} // namespace sagabus
