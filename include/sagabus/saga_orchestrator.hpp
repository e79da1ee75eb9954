#pragma once

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "sagabus/types.pb.h"
#include "bus_context.hpp"
#include "id_generator.hpp"
#include "message.hpp"
#include "persister.hpp"
#include "saga.hpp"
#include "saga_not_found.hpp"
#include "saga_registry.hpp"
#include "timeout_dispatcher.hpp"

namespace sagabus {

/**
 * Routes an inbound message to every saga it concerns.
 *
 * For each saga type the registry supplies finders for, the orchestrator
 * loads every entity those finders locate. When none of them locates one
 * it starts a new saga if the registry maps the message to a start. It binds a fresh
 * instance to the entity and invokes the handler. Then it persists the result
 * or finalizes the saga if the handler completed it. Messages no saga claims
 * go to the not-found handlers.
 *
 * The orchestrator holds no per-message state and may be shared across
 * threads. Concurrent dispatches for the same saga are serialized by the
 * persister: save() is create-if-absent and update() rejects stale versions,
 * both by throwing ConcurrencyConflictError.
 */
class SagaOrchestrator {
public:
    SagaOrchestrator(std::shared_ptr<const SagaRegistry> registry,
                     std::shared_ptr<SagaPersister> persister,
                     std::shared_ptr<IdGenerator> ids,
                     std::vector<std::shared_ptr<SagaNotFoundHandler>> not_found_handlers = {},
                     std::shared_ptr<const SagaInstanceBuilder> builder = nullptr);

    /**
     * Dispatch `message` within the bus context of its delivery.
     *
     * @throws SagaContractViolation if a timeout reaches a saga with no handler for its payload
     * @throws ConcurrencyConflictError if the persister rejects a write
     */
    void dispatch(const Envelope& message, BusContext& bus) const;

private:
    struct DispatchState {
        // (entity_type, id) of every saga that already saw the message
        std::set<std::pair<std::string, std::string>> handled_entities;
        std::set<std::string> started_saga_types;
        MessageKind kind;
        std::string message_type;
    };

    bool need_to_handle(const Envelope& message, MessageKind kind,
                        const std::string& message_type, BusContext& bus) const;

    SagaEntity create_entity(const Envelope& message, const std::string& saga_type,
                             BusContext& bus) const;

    void have_saga_handle_message(SagaInstance& saga, const Envelope& message,
                                  const DispatchState& state, bool persistent,
                                  BusContext& bus) const;

    std::shared_ptr<const SagaRegistry> registry_;
    std::shared_ptr<SagaPersister> persister_;
    std::shared_ptr<IdGenerator> ids_;
    std::shared_ptr<const SagaInstanceBuilder> builder_;
    TimeoutDispatcher timeout_dispatcher_;
    SagaNotFoundFallback not_found_;
};

} // namespace sagabus
