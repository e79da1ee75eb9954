#include "sagabus/saga_registry.hpp"

#include "sagabus/logging.hpp"

namespace sagabus {

namespace {

const char* const COMPONENT = "saga-registry";

}  // namespace

const SagaRegistry::FinderList& SagaRegistry::finders_for(const std::string& message_type) const {
    static const FinderList empty;
    auto it = finders_.find(message_type);
    return it != finders_.end() ? it->second : empty;
}

std::optional<std::string> SagaRegistry::saga_type_to_start(const std::string& message_type,
                                                            const SagaFinder& finder) const {
    auto it = by_saga_type_.find(finder.saga_type());
    if (it == by_saga_type_.end()) {
        return std::nullopt;
    }
    const auto& def = definitions_[it->second];
    if (def.started_by.count(message_type) == 0) {
        return std::nullopt;
    }
    return def.saga_type;
}

const std::string& SagaRegistry::saga_entity_type_for(const std::string& saga_type) const {
    return definition(saga_type).entity_type;
}

const std::string& SagaRegistry::saga_type_for_entity_type(const std::string& entity_type) const {
    auto it = by_entity_type_.find(entity_type);
    if (it == by_entity_type_.end()) {
        throw SagaConfigurationError("No saga is registered for entity type " + entity_type);
    }
    return definitions_[it->second].saga_type;
}

const SagaHandler* SagaRegistry::handler_for(const std::string& saga_type,
                                             const std::string& message_type) const {
    const auto& handlers = definition(saga_type).handlers;
    auto it = handlers.find(message_type);
    return it != handlers.end() ? &it->second : nullptr;
}

const SagaHandler* SagaRegistry::timeout_handler_for(const std::string& saga_type,
                                                     const std::string& payload_type) const {
    const auto& handlers = definition(saga_type).timeout_handlers;
    auto it = handlers.find(payload_type);
    return it != handlers.end() ? &it->second : nullptr;
}

const SagaHandler* SagaRegistry::any_timeout_handler_for(const std::string& saga_type) const {
    const auto& handler = definition(saga_type).any_timeout_handler;
    return handler ? &handler : nullptr;
}

bool SagaRegistry::is_saga_relevant(const std::string& message_type) const {
    return relevant_types_.count(message_type) > 0;
}

std::unique_ptr<SagaInstance> SagaRegistry::build(const std::string& saga_type) const {
    auto instance = definition(saga_type).factory();
    instance->saga_type_ = saga_type;
    return instance;
}

std::vector<std::string> SagaRegistry::saga_types() const {
    std::vector<std::string> result;
    result.reserve(definitions_.size());
    for (const auto& def : definitions_) {
        result.push_back(def.saga_type);
    }
    return result;
}

const SagaDefinition& SagaRegistry::definition(const std::string& saga_type) const {
    auto it = by_saga_type_.find(saga_type);
    if (it == by_saga_type_.end()) {
        throw SagaConfigurationError("Unknown saga type " + saga_type);
    }
    return definitions_[it->second];
}

std::shared_ptr<const SagaRegistry> SagaRegistry::Builder::build(
    std::shared_ptr<SagaPersister> persister) const {
    if (!persister) {
        throw SagaConfigurationError("Saga registry requires a persister for its finders");
    }

    std::shared_ptr<SagaRegistry> registry(new SagaRegistry());
    const auto timeout_notice_type = helpers::type_name<TimeoutNotice>();

    for (const auto& def : definitions_) {
        for (const auto& scheduled : def.scheduled_timeouts) {
            if (def.timeout_handlers.count(scheduled) == 0 && !def.any_timeout_handler) {
                throw SagaConfigurationError("Saga " + def.saga_type +
                                             " schedules timeouts with state " + scheduled +
                                             " but has no on_timeout<" + scheduled + "> handler");
            }
        }
        if (def.handlers.empty() && def.timeout_handlers.empty() && !def.any_timeout_handler) {
            log_warn(COMPONENT, "saga_without_handlers", {{"saga_type", def.saga_type}});
        }

        size_t index = registry->definitions_.size();
        registry->definitions_.push_back(def);
        registry->by_saga_type_[def.saga_type] = index;
        registry->by_entity_type_[def.entity_type] = index;

        // Saga id lookup first, then the saga's own finders in declaration order.
        auto id_finder = std::make_shared<SagaIdFinder>(def.saga_type, def.entity_type, persister);
        for (const auto& message_type : def.message_types) {
            auto& finders = registry->finders_[message_type];
            finders.push_back(id_finder);
            for (const auto& [finder_type, make_finder] : def.finders) {
                if (finder_type == message_type) {
                    finders.push_back(make_finder(persister));
                }
            }
        }

        if (!def.timeout_handlers.empty() || def.any_timeout_handler) {
            registry->finders_[timeout_notice_type].push_back(id_finder);
        }

        for (const auto& [message_type, _] : def.handlers) {
            registry->relevant_types_.insert(message_type);
        }
        for (const auto& [message_type, _] : def.finders) {
            registry->relevant_types_.insert(message_type);
        }

        log_debug(COMPONENT, "saga_registered",
                  {{"saga_type", def.saga_type},
                   {"entity_type", def.entity_type},
                   {"message_types", def.message_types}});
    }

    return registry;
}

} // namespace sagabus
