#include "sagabus/message.hpp"

#include "sagabus/id_generator.hpp"

namespace sagabus {

std::string message_type(const Envelope& message) {
    if (message.has_body()) {
        return helpers::type_name_from_url(message.body().type_url());
    }
    if (message.has_timeout()) {
        return helpers::type_name<TimeoutNotice>();
    }
    return "";
}

std::string correlation_id(const Envelope& message) {
    switch (message.kind_case()) {
        case Envelope::kSagaId:
            return message.saga_id();
        case Envelope::kTimeout:
            return message.timeout().saga_id();
        default:
            return "";
    }
}

const google::protobuf::Any& timeout_payload(const Envelope& message) {
    if (message.has_timeout() && message.timeout().has_state()) {
        return message.timeout().state();
    }
    return message.body();
}

bool timeout_expired(const Envelope& message, const google::protobuf::Timestamp& now) {
    if (!message.has_timeout()) {
        return false;
    }
    return !helpers::is_before(now, message.timeout().expires_at());
}

Envelope MessageBuilder::build() const {
    Envelope envelope;
    if (message_id_.has_value()) {
        envelope.set_message_id(message_id_.value());
    } else {
        static CombIdGenerator ids;
        envelope.set_message_id(ids.next());
    }
    envelope.set_reply_to(reply_to_);

    if (body_.has_value()) {
        *envelope.mutable_body() = body_.value();
    }
    if (saga_id_.has_value()) {
        envelope.set_saga_id(saga_id_.value());
    } else if (timeout_.has_value()) {
        *envelope.mutable_timeout() = timeout_.value();
    }

    for (const auto& [key, value] : headers_) {
        (*envelope.mutable_headers())[key] = value;
    }
    envelope.set_deferral_count(deferral_count_);
    return envelope;
}

} // namespace sagabus
