#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "test_support.hpp"

using namespace sagabus;
using namespace sagabus_test;

class FinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        SagaEntity entity;
        entity.set_id("X");
        entity.set_entity_type("sagabus_test.OrderSagaData");
        (*entity.mutable_correlation_properties())["order_id"] = "o-1";
        persister->save(entity);
    }

    static PropertyFinder::MessageKey order_id_of() {
        return [](const google::protobuf::Any& body) {
            PaymentReceived payment;
            body.UnpackTo(&payment);
            return payment.order_id();
        };
    }

    std::shared_ptr<InMemorySagaPersister> persister = std::make_shared<InMemorySagaPersister>();
};

TEST_F(FinderTest, SagaIdFinder_CorrelatedMessage_ShouldLoadEntity) {
    SagaIdFinder finder("order", "sagabus_test.OrderSagaData", persister);

    auto found = finder.find(MessageBuilder().correlated_to("X").build());

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), "X");
    EXPECT_EQ(finder.name(), "order/saga_id");
}

TEST_F(FinderTest, SagaIdFinder_TimeoutNotice_ShouldUseNoticeSagaId) {
    SagaIdFinder finder("order", "sagabus_test.OrderSagaData", persister);

    auto found = finder.find(MessageBuilder().as_timeout("X", helpers::now()).build());

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), "X");
}

TEST_F(FinderTest, SagaIdFinder_PlainMessage_ShouldFindNothing) {
    SagaIdFinder finder("order", "sagabus_test.OrderSagaData", persister);

    EXPECT_FALSE(finder.find(MessageBuilder().with_body(PaymentReceived()).build()).has_value());
}

TEST_F(FinderTest, SagaIdFinder_OtherEntityType_ShouldFindNothing) {
    SagaIdFinder finder("invoice", "sagabus_test.InvoiceSagaData", persister);

    EXPECT_FALSE(finder.find(MessageBuilder().correlated_to("X").build()).has_value());
}

TEST_F(FinderTest, PropertyFinder_MatchingValue_ShouldFindEntity) {
    PropertyFinder finder("order", "sagabus_test.OrderSagaData", persister, "order_id", order_id_of());
    PaymentReceived payment;
    payment.set_order_id("o-1");

    auto found = finder.find(MessageBuilder().with_body(payment).build());

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), "X");
    EXPECT_EQ(finder.name(), "order/order_id");
}

TEST_F(FinderTest, PropertyFinder_EmptyKey_ShouldFindNothing) {
    PropertyFinder finder("order", "sagabus_test.OrderSagaData", persister, "order_id", order_id_of());

    EXPECT_FALSE(finder.find(MessageBuilder().with_body(PaymentReceived()).build()).has_value());
    EXPECT_FALSE(finder.find(MessageBuilder().correlated_to("X").build()).has_value());
}

TEST_F(FinderTest, FunctionFinder_EntityOfOtherType_ShouldBeIgnored) {
    FunctionFinder finder("invoice", "sagabus_test.InvoiceSagaData",
                          [this](const Envelope&) { return persister->get("sagabus_test.OrderSagaData", "X"); });

    EXPECT_FALSE(finder.find(MessageBuilder().build()).has_value());
    EXPECT_EQ(finder.name(), "invoice/custom");
}
