#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace sagabus;
using namespace sagabus_test;

TEST(ReportingBusContextTest, CurrentMessage_ShouldExposeEnvelopeMetadata) {
    auto message = MessageBuilder().with_message_id("m-1").with_reply_to("client").build();
    DispatchReport report;
    ReportingBusContext bus(message, &report);

    EXPECT_EQ(bus.current_message_id(), "m-1");
    EXPECT_EQ(bus.current_reply_to(), "client");
}

TEST(ReportingBusContextTest, SideEffects_ShouldBeRecordedInReport) {
    // Given a reporting bus for message m-1
    auto message = MessageBuilder().with_message_id("m-1").build();
    DispatchReport report;
    ReportingBusContext bus(message, &report);
    auto expires_at = helpers::from_now(std::chrono::minutes(5));

    // When every side effect is requested
    bus.defer_current_message();
    bus.cancel_timeouts_for("X");
    bus.request_timeout("X", expires_at, helpers::pack_any(ReminderDue()));
    bus.reply("client", "X", helpers::pack_any(PaymentConfirmed()));

    // Then the report lists them for the transport
    EXPECT_TRUE(report.deferred());
    ASSERT_EQ(report.cancelled_timeouts_size(), 1);
    EXPECT_EQ(report.cancelled_timeouts(0), "X");
    ASSERT_EQ(report.scheduled_timeouts_size(), 1);
    EXPECT_EQ(report.scheduled_timeouts(0).saga_id(), "X");
    EXPECT_EQ(report.scheduled_timeouts(0).expires_at().seconds(), expires_at.seconds());
    EXPECT_TRUE(report.scheduled_timeouts(0).state().Is<ReminderDue>());
    ASSERT_EQ(report.replies_size(), 1);
    EXPECT_EQ(report.replies(0).destination(), "client");
    EXPECT_EQ(report.replies(0).in_reply_to(), "m-1");
    EXPECT_TRUE(report.replies(0).body().Is<PaymentConfirmed>());
}
