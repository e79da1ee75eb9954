#include "order_saga.hpp"

#include <chrono>

namespace order_fulfillment {

namespace {

const auto PAYMENT_WINDOW = std::chrono::minutes(30);

std::string order_id_of_state(const examples::OrderSagaData& state) {
    return state.order_id();
}

}  // namespace

void OrderFulfillmentSaga::handle_order_placed(const examples::OrderPlaced& event) {
    auto& data = mutable_state();
    data.set_order_id(event.order_id());
    data.set_customer_id(event.customer_id());
    data.set_total_cents(event.total_cents());

    examples::PaymentDeadline deadline;
    deadline.set_order_id(event.order_id());
    request_timeout(PAYMENT_WINDOW, deadline);

    notify("awaiting_payment");
}

void OrderFulfillmentSaga::handle_payment_received(const examples::PaymentReceived& event) {
    auto& data = mutable_state();
    data.set_paid_cents(data.paid_cents() + event.amount_cents());
    if (data.paid_cents() >= data.total_cents()) {
        notify("paid");
    }
}

void OrderFulfillmentSaga::handle_shipment_dispatched(const examples::ShipmentDispatched&) {
    notify("shipped");
    mark_as_complete();
}

void OrderFulfillmentSaga::handle_order_cancelled(const examples::OrderCancelled&) {
    notify("cancelled");
    mark_as_complete();
}

void OrderFulfillmentSaga::timeout_payment_deadline(const examples::PaymentDeadline& deadline) {
    if (state().paid_cents() >= state().total_cents()) {
        return;
    }

    auto& data = mutable_state();
    if (data.reminders_sent() >= MAX_REMINDERS) {
        notify("cancelled_unpaid");
        mark_as_complete();
        return;
    }

    data.set_reminders_sent(data.reminders_sent() + 1);
    examples::PaymentDeadline next = deadline;
    next.set_reminder(data.reminders_sent());
    request_timeout(PAYMENT_WINDOW, next);
    notify("payment_reminder");
}

void OrderFulfillmentSaga::notify(const std::string& status) {
    examples::OrderStatusChanged changed;
    changed.set_order_id(state().order_id());
    changed.set_status(status);
    reply_to_originator(changed);
}

void register_order_saga(sagabus::SagaRegistry::Builder& builder) {
    using examples::OrderCancelled;
    using examples::OrderPlaced;
    using examples::PaymentReceived;
    using examples::ShipmentDispatched;

    builder.saga<OrderFulfillmentSaga>("order-fulfillment")
        .started_by<OrderPlaced>(&OrderFulfillmentSaga::handle_order_placed)
        .handles<PaymentReceived>(&OrderFulfillmentSaga::handle_payment_received)
        .handles<ShipmentDispatched>(&OrderFulfillmentSaga::handle_shipment_dispatched)
        .handles<OrderCancelled>(&OrderFulfillmentSaga::handle_order_cancelled)
        .correlate<OrderPlaced>("order_id",
            [](const OrderPlaced& e) { return e.order_id(); }, order_id_of_state)
        .correlate<PaymentReceived>("order_id",
            [](const PaymentReceived& e) { return e.order_id(); }, order_id_of_state)
        .correlate<ShipmentDispatched>("order_id",
            [](const ShipmentDispatched& e) { return e.order_id(); }, order_id_of_state)
        .correlate<OrderCancelled>("order_id",
            [](const OrderCancelled& e) { return e.order_id(); }, order_id_of_state)
        .on_timeout<examples::PaymentDeadline>(&OrderFulfillmentSaga::timeout_payment_deadline)
        .schedules<examples::PaymentDeadline>();
}

}  // namespace order_fulfillment
