#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "sagabus/types.pb.h"
#include "bus_context.hpp"
#include "errors.hpp"
#include "helpers.hpp"

namespace sagabus {

template<typename SagaT>
class SagaBindingBuilder;

/**
 * Transient behavior object bound to one saga entity for one dispatch.
 *
 * The orchestrator builds a fresh instance per (message, entity), binds it,
 * invokes the handler and discards it. Nothing survives between dispatches
 * except what is written to the entity.
 */
class SagaInstance {
public:
    virtual ~SagaInstance() = default;

    /**
     * Registered saga type name.
     */
    const std::string& saga_type() const { return saga_type_; }

    /**
     * The bound entity. Only valid after bind().
     */
    const SagaEntity& entity() const { return entity_; }

    /**
     * Returns true once the saga has marked itself complete.
     */
    bool completed() const { return completed_; }

    /**
     * Attach the entity and the bus for the current dispatch, then load the
     * typed state from entity.data().
     */
    void bind(SagaEntity entity, BusContext& bus) {
        entity_ = std::move(entity);
        bus_ = &bus;
        load_state();
    }

    /**
     * Write the typed state and its indexed correlation properties back into
     * the entity, and return it ready for the persister.
     */
    const SagaEntity& prepare_for_persistence() {
        flush_state();
        return entity_;
    }

protected:
    /**
     * Finish the saga. Completion is permanent for this run.
     */
    void mark_as_complete() { completed_ = true; }

    /**
     * The bus for the current dispatch.
     * @throws SagaConfigurationError if the instance is not bound
     */
    BusContext& bus() const {
        if (bus_ == nullptr) {
            throw SagaConfigurationError("Saga " + saga_type_ + " used outside a dispatch");
        }
        return *bus_;
    }

    /**
     * Ask the bus to deliver `state` back to this saga after `delay`.
     */
    template<typename T>
    void request_timeout(std::chrono::milliseconds delay, const T& state) {
        bus().request_timeout(entity_.id(), helpers::from_now(delay), helpers::pack_any(state));
    }

    /**
     * Send `message` to the address that started this saga.
     */
    template<typename T>
    void reply_to_originator(const T& message) {
        bus().reply(entity_.originator(), entity_.id(), helpers::pack_any(message));
    }

    SagaEntity& mutable_entity() { return entity_; }

    virtual void load_state() = 0;
    virtual void flush_state() = 0;

private:
    friend class SagaRegistry;

    std::string saga_type_;
    SagaEntity entity_;
    BusContext* bus_ = nullptr;
    bool completed_ = false;
};

/**
 * Base class for sagas whose business state is the protobuf message StateT.
 *
 * Usage:
 *   class OrderFulfillmentSaga : public Saga<OrderSagaData> {
 *   public:
 *       void handle_order_placed(const OrderPlaced& event) {
 *           mutable_state().set_order_id(event.order_id());
 *           request_timeout(std::chrono::minutes(30), PaymentDeadline{});
 *       }
 *
 *       void handle_shipment_dispatched(const ShipmentDispatched&) {
 *           mark_as_complete();
 *       }
 *   };
 */
template<typename StateT>
class Saga : public SagaInstance {
public:
    using State = StateT;
    using PropertyExtractor = std::function<std::string(const StateT&)>;

    /**
     * Full protobuf name of the state message, used as the entity type.
     */
    static std::string entity_type() { return helpers::type_name<StateT>(); }

    const StateT& state() const { return state_; }
    StateT& mutable_state() { return state_; }

protected:
    void load_state() override {
        state_ = StateT{};
        const auto& data = entity().data();
        if (data.type_url().empty()) {
            return;
        }
        if (!data.Is<StateT>() || !data.UnpackTo(&state_)) {
            throw InvalidArgumentError("Saga " + saga_type() + " cannot load entity " +
                                       entity().id() + " of type " +
                                       helpers::type_name_from_url(data.type_url()));
        }
    }

    void flush_state() override {
        auto& entity = mutable_entity();
        entity.set_entity_type(entity_type());
        entity.mutable_data()->PackFrom(state_, helpers::TYPE_URL_PREFIX);
        for (const auto& [property, extract] : indexed_properties_) {
            (*entity.mutable_correlation_properties())[property] = extract(state_);
        }
    }

private:
    template<typename SagaT>
    friend class SagaBindingBuilder;

    void index_property(const std::string& property, PropertyExtractor extract) {
        indexed_properties_.emplace_back(property, std::move(extract));
    }

    StateT state_;
    std::vector<std::pair<std::string, PropertyExtractor>> indexed_properties_;
};

} // namespace sagabus
