#pragma once

#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "sagabus/types.pb.h"
#include "sagabus/dispatch.pb.h"

namespace sagabus {

/**
 * The bus as seen from inside one dispatch.
 *
 * Implemented by the transport. Every call refers to the message currently
 * being dispatched.
 */
class BusContext {
public:
    virtual ~BusContext() = default;

    /**
     * Address replies to the current message should go to.
     */
    virtual std::string current_reply_to() const = 0;

    /**
     * Transport id of the current message.
     */
    virtual std::string current_message_id() const = 0;

    /**
     * Ask the transport to deliver the current message again later.
     */
    virtual void defer_current_message() = 0;

    /**
     * Drop every outstanding timeout requested by the saga `saga_id`.
     * Must be safe to call for sagas that never requested one.
     */
    virtual void cancel_timeouts_for(const std::string& saga_id) = 0;

    /**
     * Schedule a TimeoutNotice carrying `state` for `saga_id` at `expires_at`.
     */
    virtual void request_timeout(const std::string& saga_id,
                                 const google::protobuf::Timestamp& expires_at,
                                 const google::protobuf::Any& state) = 0;

    /**
     * Send `body` to `destination` on behalf of the saga `saga_id`.
     */
    virtual void reply(const std::string& destination, const std::string& saga_id,
                       const google::protobuf::Any& body) = 0;
};

/**
 * BusContext that records every side effect into a DispatchReport.
 *
 * Used by the gRPC dispatch service: the remote transport receives the report
 * and performs the deferral, cancellations, timeouts and replies itself.
 */
class ReportingBusContext : public BusContext {
public:
    ReportingBusContext(const Envelope& message, DispatchReport* report)
        : message_(message), report_(report) {}

    std::string current_reply_to() const override { return message_.reply_to(); }
    std::string current_message_id() const override { return message_.message_id(); }

    void defer_current_message() override;
    void cancel_timeouts_for(const std::string& saga_id) override;
    void request_timeout(const std::string& saga_id,
                         const google::protobuf::Timestamp& expires_at,
                         const google::protobuf::Any& state) override;
    void reply(const std::string& destination, const std::string& saga_id,
               const google::protobuf::Any& body) override;

private:
    const Envelope& message_;
    DispatchReport* report_;
};

} // namespace sagabus
