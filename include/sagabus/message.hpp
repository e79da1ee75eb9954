#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "sagabus/types.pb.h"
#include "errors.hpp"
#include "helpers.hpp"

namespace sagabus {

/**
 * Role of an inbound message, resolved once per dispatch.
 */
enum class MessageKind {
    Plain,
    Correlated,
    Timeout
};

/**
 * Resolve the role of an envelope from its `kind` oneof.
 */
inline MessageKind kind_of(const Envelope& message) {
    switch (message.kind_case()) {
        case Envelope::kSagaId:
            return MessageKind::Correlated;
        case Envelope::kTimeout:
            return MessageKind::Timeout;
        default:
            return MessageKind::Plain;
    }
}

/**
 * Registry key for a message: the full protobuf name of its body.
 * A timeout notice without a body is keyed by sagabus.TimeoutNotice.
 */
std::string message_type(const Envelope& message);

/**
 * The explicit correlation identifier carried by the message, or empty.
 */
std::string correlation_id(const Envelope& message);

/**
 * Payload handed to a saga's timeout handler: the notice state when set,
 * otherwise the body.
 */
const google::protobuf::Any& timeout_payload(const Envelope& message);

/**
 * Returns true if the timeout notice is due at `now`. Non-timeout messages
 * are never considered expired.
 */
bool timeout_expired(const Envelope& message, const google::protobuf::Timestamp& now);

/**
 * Fluent builder for inbound envelopes.
 *
 * Example:
 *   auto envelope = MessageBuilder()
 *       .with_reply_to("billing")
 *       .correlated_to(order_saga_id)
 *       .with_body(payment_received)
 *       .build();
 */
class MessageBuilder {
public:
    MessageBuilder& with_message_id(const std::string& id) {
        message_id_ = id;
        return *this;
    }

    MessageBuilder& with_reply_to(const std::string& reply_to) {
        reply_to_ = reply_to;
        return *this;
    }

    template<typename T>
    MessageBuilder& with_body(const T& body) {
        body_ = helpers::pack_any(body);
        return *this;
    }

    MessageBuilder& with_body_any(const google::protobuf::Any& body) {
        body_ = body;
        return *this;
    }

    /**
     * Mark the message as belonging to the saga with id `saga_id`.
     */
    MessageBuilder& correlated_to(const std::string& saga_id) {
        saga_id_ = saga_id;
        timeout_.reset();
        return *this;
    }

    /**
     * Turn the message into a timeout notice for `saga_id`.
     */
    MessageBuilder& as_timeout(const std::string& saga_id,
                               const google::protobuf::Timestamp& expires_at) {
        TimeoutNotice notice;
        notice.set_saga_id(saga_id);
        *notice.mutable_expires_at() = expires_at;
        timeout_ = std::move(notice);
        saga_id_.reset();
        return *this;
    }

    /**
     * Attach timeout state. Only valid after as_timeout().
     */
    template<typename T>
    MessageBuilder& with_timeout_state(const T& state) {
        if (!timeout_.has_value()) {
            throw InvalidArgumentError("timeout state requires as_timeout()");
        }
        *timeout_->mutable_state() = helpers::pack_any(state);
        return *this;
    }

    MessageBuilder& with_header(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    MessageBuilder& with_deferral_count(uint32_t count) {
        deferral_count_ = count;
        return *this;
    }

    /**
     * Build the Envelope. A message id is generated when none was set.
     */
    Envelope build() const;

private:
    std::optional<std::string> message_id_;
    std::string reply_to_;
    std::optional<google::protobuf::Any> body_;
    std::optional<std::string> saga_id_;
    std::optional<TimeoutNotice> timeout_;
    std::map<std::string, std::string> headers_;
    uint32_t deferral_count_ = 0;
};

} // namespace sagabus
