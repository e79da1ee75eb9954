#include "sagabus/finder.hpp"

#include "sagabus/message.hpp"

namespace sagabus {

std::string SagaIdFinder::name() const {
    return saga_type() + "/saga_id";
}

std::optional<SagaEntity> SagaIdFinder::find(const Envelope& message) const {
    auto id = correlation_id(message);
    if (id.empty()) {
        return std::nullopt;
    }
    return persister_->get(entity_type(), id);
}

std::string PropertyFinder::name() const {
    return saga_type() + "/" + property_;
}

std::optional<SagaEntity> PropertyFinder::find(const Envelope& message) const {
    if (!message.has_body()) {
        return std::nullopt;
    }
    auto value = message_key_(message.body());
    if (value.empty()) {
        return std::nullopt;
    }
    return persister_->find_by_property(entity_type(), property_, value);
}

std::string FunctionFinder::name() const {
    return saga_type() + "/custom";
}

std::optional<SagaEntity> FunctionFinder::find(const Envelope& message) const {
    auto entity = lookup_(message);
    // A custom lookup may hand back anything; only entities of our type count.
    if (entity.has_value() && entity->entity_type() != entity_type()) {
        return std::nullopt;
    }
    return entity;
}

} // namespace sagabus
