#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "order_saga.hpp"
#include "test_support.hpp"

using namespace sagabus;
using sagabus_test::RecordingBusContext;

class OrderFulfillmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_sink([](const nlohmann::json&) {});

        persister = std::make_shared<InMemorySagaPersister>();
        SagaRegistry::Builder builder;
        order_fulfillment::register_order_saga(builder);
        orchestrator = std::make_unique<SagaOrchestrator>(
            builder.build(persister), persister, std::make_shared<CombIdGenerator>());

        examples::OrderPlaced placed;
        placed.set_order_id("o-1");
        placed.set_customer_id("c-1");
        placed.set_total_cents(5000);
        orchestrator->dispatch(MessageBuilder().correlated_to("X").with_body(placed).build(), bus);
    }

    void TearDown() override { set_log_sink(nullptr); }

    void fire_deadline() {
        examples::PaymentDeadline deadline;
        deadline.set_order_id("o-1");
        orchestrator->dispatch(MessageBuilder()
                                   .as_timeout("X", helpers::from_now(std::chrono::seconds(-1)))
                                   .with_timeout_state(deadline)
                                   .build(),
                               bus);
    }

    std::string last_status() const {
        examples::OrderStatusChanged changed;
        bus.replies.back().body.UnpackTo(&changed);
        return changed.status();
    }

    std::shared_ptr<InMemorySagaPersister> persister;
    std::unique_ptr<SagaOrchestrator> orchestrator;
    RecordingBusContext bus{"storefront", "m-0"};
};

TEST_F(OrderFulfillmentTest, OrderPlaced_ShouldRequestPaymentDeadline) {
    ASSERT_EQ(bus.timeouts.size(), 1u);
    EXPECT_TRUE(bus.timeouts[0].state.Is<examples::PaymentDeadline>());
    EXPECT_EQ(bus.replies[0].destination, "storefront");
    EXPECT_EQ(last_status(), "awaiting_payment");
}

TEST_F(OrderFulfillmentTest, FullPayment_ShouldReportPaid) {
    examples::PaymentReceived payment;
    payment.set_order_id("o-1");
    payment.set_amount_cents(5000);

    orchestrator->dispatch(MessageBuilder().with_body(payment).build(), bus);

    EXPECT_EQ(last_status(), "paid");
}

TEST_F(OrderFulfillmentTest, UnpaidDeadlines_ShouldRemindThenCancel) {
    // Given an unpaid order
    // When the deadline fires once per reminder and once more
    for (int i = 0; i < order_fulfillment::OrderFulfillmentSaga::MAX_REMINDERS; ++i) {
        fire_deadline();
        EXPECT_EQ(last_status(), "payment_reminder");
    }
    fire_deadline();

    // Then the order is cancelled and the saga completes
    EXPECT_EQ(last_status(), "cancelled_unpaid");
    EXPECT_FALSE(persister->get(order_fulfillment::OrderFulfillmentSaga::entity_type(), "X").has_value());
    EXPECT_EQ(bus.cancelled, std::vector<std::string>{"X"});
}

TEST_F(OrderFulfillmentTest, Shipment_ShouldCompleteSaga) {
    examples::ShipmentDispatched shipped;
    shipped.set_order_id("o-1");

    orchestrator->dispatch(MessageBuilder().with_body(shipped).build(), bus);

    EXPECT_EQ(last_status(), "shipped");
    EXPECT_EQ(persister->size(), 0u);
}
