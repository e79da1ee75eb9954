#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "sagabus/types.pb.h"
#include "errors.hpp"
#include "finder.hpp"
#include "helpers.hpp"
#include "persister.hpp"
#include "saga.hpp"

namespace sagabus {

/**
 * Type-erased saga capability: unpacks the payload and calls the typed
 * member function on the instance.
 */
using SagaHandler = std::function<void(SagaInstance&, const google::protobuf::Any&)>;

/**
 * Produces a fresh saga instance for a registered saga type.
 */
class SagaInstanceBuilder {
public:
    virtual ~SagaInstanceBuilder() = default;

    /**
     * @throws SagaConfigurationError if `saga_type` is unknown
     */
    virtual std::unique_ptr<SagaInstance> build(const std::string& saga_type) const = 0;
};

/**
 * Everything registered for one saga type.
 */
struct SagaDefinition {
    using FinderFactory = std::function<std::shared_ptr<const SagaFinder>(
        const std::shared_ptr<SagaPersister>&)>;

    std::string saga_type;
    std::string entity_type;
    std::function<std::unique_ptr<SagaInstance>()> factory;

    // Every message type this saga can be reached by, in first-declared order.
    std::vector<std::string> message_types;
    std::set<std::string> started_by;
    std::map<std::string, SagaHandler> handlers;
    std::map<std::string, SagaHandler> timeout_handlers;
    SagaHandler any_timeout_handler;
    std::vector<std::string> scheduled_timeouts;
    std::vector<std::pair<std::string, FinderFactory>> finders;
};

template<typename SagaT>
class SagaBindingBuilder;

/**
 * Immutable map from message types to finders, start rules and saga
 * capabilities. Built once at startup and shared by every dispatch.
 *
 * Example:
 *   SagaRegistry::Builder builder;
 *   builder.saga<OrderFulfillmentSaga>("order-fulfillment")
 *       .started_by<OrderPlaced>(&OrderFulfillmentSaga::handle_order_placed)
 *       .handles<ShipmentDispatched>(&OrderFulfillmentSaga::handle_shipment_dispatched)
 *       .correlate<OrderPlaced>("order_id",
 *           [](const OrderPlaced& e) { return e.order_id(); },
 *           [](const OrderSagaData& s) { return s.order_id(); })
 *       .on_timeout<PaymentDeadline>(&OrderFulfillmentSaga::timeout_payment_deadline)
 *       .schedules<PaymentDeadline>();
 *   auto registry = builder.build(persister);
 */
class SagaRegistry : public SagaInstanceBuilder {
public:
    class Builder;

    using FinderList = std::vector<std::shared_ptr<const SagaFinder>>;

    /**
     * Finders to try for a message type, in dispatch order.
     */
    const FinderList& finders_for(const std::string& message_type) const;

    /**
     * Saga type to start when `finder` finds nothing for `message_type`.
     */
    std::optional<std::string> saga_type_to_start(const std::string& message_type,
                                                  const SagaFinder& finder) const;

    /**
     * @throws SagaConfigurationError if `saga_type` is unknown
     */
    const std::string& saga_entity_type_for(const std::string& saga_type) const;

    /**
     * @throws SagaConfigurationError if no saga stores `entity_type`
     */
    const std::string& saga_type_for_entity_type(const std::string& entity_type) const;

    /**
     * Handler for (saga, message), or nullptr when the saga ignores the message.
     */
    const SagaHandler* handler_for(const std::string& saga_type,
                                   const std::string& message_type) const;

    /**
     * Typed timeout handler for exactly `payload_type`, or nullptr.
     */
    const SagaHandler* timeout_handler_for(const std::string& saga_type,
                                           const std::string& payload_type) const;

    /**
     * Catch-all timeout handler for payloads without a typed handler, or nullptr.
     */
    const SagaHandler* any_timeout_handler_for(const std::string& saga_type) const;

    /**
     * Returns true if any saga handles, starts on, or correlates `message_type`.
     */
    bool is_saga_relevant(const std::string& message_type) const;

    std::unique_ptr<SagaInstance> build(const std::string& saga_type) const override;

    /**
     * Registered saga types in registration order.
     */
    std::vector<std::string> saga_types() const;

private:
    SagaRegistry() = default;

    const SagaDefinition& definition(const std::string& saga_type) const;

    std::vector<SagaDefinition> definitions_;
    std::map<std::string, size_t> by_saga_type_;
    std::map<std::string, size_t> by_entity_type_;
    std::map<std::string, FinderList> finders_;
    std::set<std::string> relevant_types_;
};

/**
 * Collects saga definitions and validates them into a SagaRegistry.
 */
class SagaRegistry::Builder {
public:
    /**
     * Start registering saga type `saga_type` implemented by SagaT.
     * @throws SagaConfigurationError if the saga type or its entity type is taken
     */
    template<typename SagaT>
    SagaBindingBuilder<SagaT> saga(const std::string& saga_type);

    /**
     * Validate the definitions and create the finders against `persister`.
     * @throws SagaConfigurationError on inconsistent definitions
     */
    std::shared_ptr<const SagaRegistry> build(std::shared_ptr<SagaPersister> persister) const;

private:
    template<typename SagaT>
    friend class SagaBindingBuilder;

    SagaDefinition& definition_at(size_t index) { return definitions_.at(index); }

    std::vector<SagaDefinition> definitions_;
};

/**
 * Fluent registration of one saga's capabilities.
 */
template<typename SagaT>
class SagaBindingBuilder {
public:
    using State = typename SagaT::State;

    SagaBindingBuilder(SagaRegistry::Builder& owner, size_t index)
        : owner_(owner), index_(index) {}

    /**
     * Start a new saga when message M finds no entity, and handle M.
     */
    template<typename M>
    SagaBindingBuilder& started_by(void (SagaT::*method)(const M&)) {
        auto& def = definition();
        def.started_by.insert(helpers::type_name<M>());
        return handles<M>(method);
    }

    /**
     * Handle message M on existing sagas.
     */
    template<typename M>
    SagaBindingBuilder& handles(void (SagaT::*method)(const M&)) {
        auto& def = definition();
        auto type = helpers::type_name<M>();
        add_message_type(type);
        def.handlers[type] = make_handler<M>(method);
        return *this;
    }

    /**
     * Handle timeouts whose payload is exactly T.
     */
    template<typename T>
    SagaBindingBuilder& on_timeout(void (SagaT::*method)(const T&)) {
        auto& def = definition();
        auto type = helpers::type_name<T>();
        add_message_type(type);
        def.timeout_handlers[type] = make_handler<T>(method);
        return *this;
    }

    /**
     * Handle timeouts whose payload has no typed handler.
     */
    SagaBindingBuilder& on_any_timeout(void (SagaT::*method)(const google::protobuf::Any&)) {
        definition().any_timeout_handler =
            [method](SagaInstance& instance, const google::protobuf::Any& payload) {
                (static_cast<SagaT&>(instance).*method)(payload);
            };
        return *this;
    }

    /**
     * Declare that the saga requests timeouts carrying T, so the registry can
     * reject it at build time when no handler would receive them.
     */
    template<typename T>
    SagaBindingBuilder& schedules() {
        definition().scheduled_timeouts.push_back(helpers::type_name<T>());
        return *this;
    }

    /**
     * Find sagas for message M by matching `message_key(M)` against the state
     * value `state_key(State)` indexed under `property`.
     */
    template<typename M>
    SagaBindingBuilder& correlate(const std::string& property,
                                  std::function<std::string(const M&)> message_key,
                                  std::function<std::string(const State&)> state_key) {
        auto& def = definition();
        auto type = helpers::type_name<M>();
        add_message_type(type);
        auto indexed = std::find_if(indexed_properties_->begin(), indexed_properties_->end(),
                                    [&](const auto& entry) { return entry.first == property; });
        if (indexed == indexed_properties_->end()) {
            indexed_properties_->emplace_back(property, std::move(state_key));
        }

        auto saga_type = def.saga_type;
        auto entity_type = def.entity_type;
        def.finders.emplace_back(type,
            [saga_type, entity_type, property, message_key](
                const std::shared_ptr<SagaPersister>& persister) {
                PropertyFinder::MessageKey key = [message_key](const google::protobuf::Any& body) {
                    M message;
                    if (!body.UnpackTo(&message)) {
                        throw InvalidArgumentError("Cannot unpack " +
                                                   helpers::type_name_from_url(body.type_url()) +
                                                   " as " + helpers::type_name<M>());
                    }
                    return message_key(message);
                };
                return std::make_shared<PropertyFinder>(saga_type, entity_type, persister,
                                                        property, std::move(key));
            });
        return *this;
    }

    /**
     * Find sagas for message M with a custom lookup against the persister.
     */
    template<typename M>
    SagaBindingBuilder& finds(
        std::function<std::optional<SagaEntity>(const M&, SagaPersister&)> lookup) {
        auto& def = definition();
        auto type = helpers::type_name<M>();
        add_message_type(type);

        auto saga_type = def.saga_type;
        auto entity_type = def.entity_type;
        def.finders.emplace_back(type,
            [saga_type, entity_type, lookup](const std::shared_ptr<SagaPersister>& persister) {
                FunctionFinder::Lookup wrapped =
                    [lookup, persister](const Envelope& envelope) -> std::optional<SagaEntity> {
                        M message;
                        if (!envelope.has_body() || !envelope.body().UnpackTo(&message)) {
                            return std::nullopt;
                        }
                        return lookup(message, *persister);
                    };
                return std::make_shared<FunctionFinder>(saga_type, entity_type, std::move(wrapped));
            });
        return *this;
    }

private:
    friend class SagaRegistry::Builder;

    using IndexedProperties =
        std::vector<std::pair<std::string, typename Saga<State>::PropertyExtractor>>;

    SagaDefinition& definition() { return owner_.definition_at(index_); }

    std::function<std::unique_ptr<SagaInstance>()> make_factory() const {
        return [properties = indexed_properties_]() -> std::unique_ptr<SagaInstance> {
            auto saga = std::make_unique<SagaT>();
            auto& base = static_cast<Saga<State>&>(*saga);
            for (const auto& [property, extract] : *properties) {
                base.index_property(property, extract);
            }
            return saga;
        };
    }

    void add_message_type(const std::string& type) {
        auto& types = definition().message_types;
        for (const auto& existing : types) {
            if (existing == type) return;
        }
        types.push_back(type);
    }

    template<typename M>
    static SagaHandler make_handler(void (SagaT::*method)(const M&)) {
        return [method](SagaInstance& instance, const google::protobuf::Any& payload) {
            M message;
            if (!payload.UnpackTo(&message)) {
                throw InvalidArgumentError("Cannot unpack " +
                                           helpers::type_name_from_url(payload.type_url()) +
                                           " as " + helpers::type_name<M>());
            }
            (static_cast<SagaT&>(instance).*method)(message);
        };
    }

    SagaRegistry::Builder& owner_;
    size_t index_;
    // Shared with the definition's factory, which applies them to each new instance.
    std::shared_ptr<IndexedProperties> indexed_properties_ = std::make_shared<IndexedProperties>();
};

template<typename SagaT>
SagaBindingBuilder<SagaT> SagaRegistry::Builder::saga(const std::string& saga_type) {
    static_assert(std::is_base_of_v<Saga<typename SagaT::State>, SagaT>,
                  "SagaT must derive from sagabus::Saga<State>");

    auto entity_type = SagaT::entity_type();
    for (const auto& existing : definitions_) {
        if (existing.saga_type == saga_type) {
            throw SagaConfigurationError("Saga type " + saga_type + " registered twice");
        }
        if (existing.entity_type == entity_type) {
            throw SagaConfigurationError("Entity type " + entity_type + " is already used by saga " +
                                         existing.saga_type);
        }
    }

    SagaBindingBuilder<SagaT> binding(*this, definitions_.size());

    SagaDefinition def;
    def.saga_type = saga_type;
    def.entity_type = entity_type;
    def.factory = binding.make_factory();
    definitions_.push_back(std::move(def));
    return binding;
}

} // namespace sagabus
