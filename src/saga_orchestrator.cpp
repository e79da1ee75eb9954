#include "sagabus/saga_orchestrator.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "sagabus/helpers.hpp"
#include "sagabus/logging.hpp"
#include "sagabus/message.hpp"

namespace sagabus {

namespace {

const char* const COMPONENT = "saga-orchestrator";

std::pair<std::string, std::string> entity_key(const SagaEntity& entity) {
    return {entity.entity_type(), entity.id()};
}

// Finders grouped by saga type, groups in order of first appearance.
std::vector<std::pair<std::string, std::vector<const SagaFinder*>>> group_by_saga_type(
    const SagaRegistry::FinderList& finders) {
    std::vector<std::pair<std::string, std::vector<const SagaFinder*>>> groups;
    for (const auto& finder : finders) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == finder->saga_type(); });
        if (it == groups.end()) {
            groups.emplace_back(finder->saga_type(), std::vector<const SagaFinder*>{});
            it = std::prev(groups.end());
        }
        it->second.push_back(finder.get());
    }
    return groups;
}

}  // namespace

SagaOrchestrator::SagaOrchestrator(std::shared_ptr<const SagaRegistry> registry,
                                   std::shared_ptr<SagaPersister> persister,
                                   std::shared_ptr<IdGenerator> ids,
                                   std::vector<std::shared_ptr<SagaNotFoundHandler>> not_found_handlers,
                                   std::shared_ptr<const SagaInstanceBuilder> builder)
    : registry_(std::move(registry)),
      persister_(std::move(persister)),
      ids_(std::move(ids)),
      builder_(std::move(builder)),
      timeout_dispatcher_(registry_),
      not_found_(std::move(not_found_handlers)) {
    if (!registry_ || !persister_ || !ids_) {
        throw SagaConfigurationError("Saga orchestrator requires a registry, a persister and an id generator");
    }
    if (!builder_) {
        builder_ = registry_;
    }
}

void SagaOrchestrator::dispatch(const Envelope& message, BusContext& bus) const {
    DispatchState state;
    state.kind = kind_of(message);
    state.message_type = message_type(message);

    if (!need_to_handle(message, state.kind, state.message_type, bus)) {
        return;
    }

    for (const auto& [saga_type, finders] : group_by_saga_type(registry_->finders_for(state.message_type))) {
        // A saga is only started when none of its finders locates an entity,
        // so a plain redelivery of a start message reaches the existing saga.
        bool located = false;
        for (const auto* finder : finders) {
            auto found = finder->find(message);
            if (!found) {
                continue;
            }
            located = true;
            if (state.handled_entities.count(entity_key(*found)) > 0) {
                continue;
            }
            auto saga = builder_->build(registry_->saga_type_for_entity_type(found->entity_type()));
            saga->bind(std::move(*found), bus);
            have_saga_handle_message(*saga, message, state, true, bus);
            state.handled_entities.insert(entity_key(saga->entity()));
        }
        if (located) {
            continue;
        }

        auto start = registry_->saga_type_to_start(state.message_type, *finders.front());
        if (!start || state.started_saga_types.count(*start) > 0) {
            continue;
        }
        auto saga = builder_->build(*start);
        saga->bind(create_entity(message, *start, bus), bus);
        have_saga_handle_message(*saga, message, state, false, bus);
        state.handled_entities.insert(entity_key(saga->entity()));
        state.started_saga_types.insert(saga->saga_type());
    }

    if (state.handled_entities.empty()) {
        not_found_.invoke(message);
    }
}

bool SagaOrchestrator::need_to_handle(const Envelope& message, MessageKind kind,
                                      const std::string& message_type, BusContext& bus) const {
    switch (kind) {
        case MessageKind::Timeout:
            if (timeout_expired(message, helpers::now())) {
                return true;
            }
            log_debug(COMPONENT, "timeout_deferred",
                      {{"saga_id", message.timeout().saga_id()},
                       {"expires_at", helpers::to_iso8601(message.timeout().expires_at())},
                       {"message_id", message.message_id()}});
            bus.defer_current_message();
            return false;
        case MessageKind::Correlated:
            return true;
        case MessageKind::Plain:
            break;
    }
    return registry_->is_saga_relevant(message_type);
}

SagaEntity SagaOrchestrator::create_entity(const Envelope& message, const std::string& saga_type,
                                           BusContext& bus) const {
    auto id = correlation_id(message);

    SagaEntity entity;
    entity.set_id(id.empty() ? ids_->next() : id);
    entity.set_originator(bus.current_reply_to());
    entity.set_originating_message_id(bus.current_message_id());
    entity.set_entity_type(registry_->saga_entity_type_for(saga_type));

    log_debug(COMPONENT, "saga_created",
              {{"saga_type", saga_type},
               {"saga_id", entity.id()},
               {"originator", entity.originator()}});
    return entity;
}

void SagaOrchestrator::have_saga_handle_message(SagaInstance& saga, const Envelope& message,
                                                const DispatchState& state, bool persistent,
                                                BusContext& bus) const {
    if (state.kind == MessageKind::Timeout) {
        timeout_dispatcher_.dispatch_timeout(saga, message);
    } else if (const auto* handler = registry_->handler_for(saga.saga_type(), state.message_type)) {
        (*handler)(saga, message.body());
    }

    if (!saga.completed()) {
        const auto& entity = saga.prepare_for_persistence();
        if (persistent) {
            persister_->update(entity);
        } else {
            persister_->save(entity);
        }
        return;
    }

    if (persistent) {
        persister_->complete(saga.prepare_for_persistence());
    }
    bus.cancel_timeouts_for(saga.entity().id());

    log_debug(COMPONENT, "saga_completed",
              {{"saga_type", saga.saga_type()},
               {"saga_id", saga.entity().id()}});
}

} // namespace sagabus
