#pragma once

#include <memory>
#include "orders.pb.h"
#include "sagabus/sagabus.hpp"

namespace order_fulfillment {

/**
 * Tracks one order from placement to shipment.
 *
 * Requests a payment deadline when the order is placed and sends the
 * customer a reminder each time it fires, up to MAX_REMINDERS. An unpaid
 * order is then cancelled. Shipment or cancellation completes the saga.
 */
class OrderFulfillmentSaga : public sagabus::Saga<examples::OrderSagaData> {
public:
    static constexpr int MAX_REMINDERS = 3;

    void handle_order_placed(const examples::OrderPlaced& event);
    void handle_payment_received(const examples::PaymentReceived& event);
    void handle_shipment_dispatched(const examples::ShipmentDispatched& event);
    void handle_order_cancelled(const examples::OrderCancelled& event);
    void timeout_payment_deadline(const examples::PaymentDeadline& deadline);

private:
    void notify(const std::string& status);
};

/**
 * Register the order saga and its order_id correlation.
 */
void register_order_saga(sagabus::SagaRegistry::Builder& builder);

}  // namespace order_fulfillment
