#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "test_support.hpp"

using namespace sagabus;
using namespace sagabus_test;

class TimeoutDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        SagaRegistry::Builder builder;
        register_order_saga(builder)
            .on_timeout<ReminderDue>(&OrderSaga::timeout_reminder);
        builder.saga<InvoiceSaga>("invoice")
            .started_by<InvoiceIssued>(&InvoiceSaga::handle_invoice_issued)
            .on_any_timeout(&InvoiceSaga::timeout_any);
        registry = builder.build(std::make_shared<InMemorySagaPersister>());
        dispatcher = std::make_unique<TimeoutDispatcher>(registry);
    }

    std::unique_ptr<SagaInstance> bound(const std::string& saga_type, const std::string& id) {
        SagaEntity entity;
        entity.set_id(id);
        entity.set_entity_type(registry->saga_entity_type_for(saga_type));
        auto saga = registry->build(saga_type);
        saga->bind(entity, bus);
        return saga;
    }

    static Envelope expired_timeout(const std::string& saga_id) {
        return MessageBuilder().as_timeout(saga_id, helpers::from_now(std::chrono::seconds(-5))).build();
    }

    std::shared_ptr<const SagaRegistry> registry;
    std::unique_ptr<TimeoutDispatcher> dispatcher;
    RecordingBusContext bus;
};

TEST_F(TimeoutDispatcherTest, DispatchTimeout_TypedState_ShouldInvokeMatchingHandler) {
    // Given an OrderSaga with PaymentDeadline and ReminderDue handlers
    auto saga = bound("order", "X");

    // When a ReminderDue timeout is dispatched
    ReminderDue reminder;
    reminder.set_attempt(2);
    auto message = MessageBuilder()
                       .as_timeout("X", helpers::from_now(std::chrono::seconds(-5)))
                       .with_timeout_state(reminder)
                       .build();
    dispatcher->dispatch_timeout(*saga, message);

    // Then only the ReminderDue handler runs
    auto state = unpack_state<OrderSagaData>(saga->prepare_for_persistence());
    EXPECT_EQ(state.reminders(), 1);
    EXPECT_EQ(state.deadlines(), 0);
}

TEST_F(TimeoutDispatcherTest, DispatchTimeout_PayloadInBody_ShouldUseBodyAsState) {
    // Given an OrderSaga
    auto saga = bound("order", "X");

    // When a timeout without state carries a PaymentDeadline body
    auto message = MessageBuilder()
                       .as_timeout("X", helpers::from_now(std::chrono::seconds(-5)))
                       .with_body(PaymentDeadline{})
                       .build();
    dispatcher->dispatch_timeout(*saga, message);

    // Then the body is handed to the PaymentDeadline handler
    auto state = unpack_state<OrderSagaData>(saga->prepare_for_persistence());
    EXPECT_EQ(state.deadlines(), 1);
}

TEST_F(TimeoutDispatcherTest, DispatchTimeout_CatchAllHandler_ShouldReceiveAnyPayload) {
    // Given an InvoiceSaga with only a catch-all timeout handler
    auto saga = bound("invoice", "I");

    // When a ReminderDue timeout is dispatched
    auto message = MessageBuilder()
                       .as_timeout("I", helpers::from_now(std::chrono::seconds(-5)))
                       .with_timeout_state(ReminderDue{})
                       .build();
    dispatcher->dispatch_timeout(*saga, message);

    // Then the catch-all handler runs
    auto state = unpack_state<InvoiceSagaData>(saga->prepare_for_persistence());
    EXPECT_EQ(state.seen(), 100);
}

TEST_F(TimeoutDispatcherTest, DispatchTimeout_NoMatchingHandler_ShouldThrowContractViolation) {
    // Given an OrderSaga without a handler for UnknownTimeout
    auto saga = bound("order", "X");

    // When an UnknownTimeout is dispatched
    auto message = MessageBuilder()
                       .as_timeout("X", helpers::from_now(std::chrono::seconds(-5)))
                       .with_timeout_state(UnknownTimeout{})
                       .build();

    // Then a contract violation names the payload and the saga
    try {
        dispatcher->dispatch_timeout(*saga, message);
        FAIL() << "expected SagaContractViolation";
    } catch (const SagaContractViolation& e) {
        EXPECT_TRUE(e.is_contract_violation());
        EXPECT_EQ(e.payload_type(), "sagabus_test.UnknownTimeout");
        EXPECT_EQ(e.saga_type(), "order");
        EXPECT_NE(std::string(e.what()).find("on_timeout<sagabus_test.UnknownTimeout>"),
                  std::string::npos);
    }
}

TEST_F(TimeoutDispatcherTest, DispatchTimeout_EmptyPayload_ShouldThrowContractViolation) {
    // Given an OrderSaga
    auto saga = bound("order", "X");

    // When a timeout without state or body is dispatched
    // Then nothing can receive it
    EXPECT_THROW(dispatcher->dispatch_timeout(*saga, expired_timeout("X")), SagaContractViolation);
}
