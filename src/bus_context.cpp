#include "sagabus/bus_context.hpp"

namespace sagabus {

void ReportingBusContext::defer_current_message() {
    report_->set_deferred(true);
}

void ReportingBusContext::cancel_timeouts_for(const std::string& saga_id) {
    report_->add_cancelled_timeouts(saga_id);
}

void ReportingBusContext::request_timeout(const std::string& saga_id,
                                          const google::protobuf::Timestamp& expires_at,
                                          const google::protobuf::Any& state) {
    auto* timeout = report_->add_scheduled_timeouts();
    timeout->set_saga_id(saga_id);
    *timeout->mutable_expires_at() = expires_at;
    *timeout->mutable_state() = state;
}

void ReportingBusContext::reply(const std::string& destination, const std::string& saga_id,
                                const google::protobuf::Any& body) {
    auto* reply = report_->add_replies();
    reply->set_destination(destination);
    reply->set_saga_id(saga_id);
    reply->set_in_reply_to(message_.message_id());
    *reply->mutable_body() = body;
}

} // namespace sagabus
