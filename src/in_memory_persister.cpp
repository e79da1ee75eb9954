#include "sagabus/persister.hpp"

namespace sagabus {

void InMemorySagaPersister::save(const SagaEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = key_of(entity);
    if (entities_.count(key) > 0 || completed_.count(key) > 0) {
        throw ConcurrencyConflictError("Saga " + entity.id() + " already exists", entity.id());
    }

    SagaEntity stored = entity;
    stored.set_version(1);
    index(stored);
    entities_.emplace(std::move(key), std::move(stored));
}

void InMemorySagaPersister::update(const SagaEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(key_of(entity));
    if (it == entities_.end()) {
        throw ConcurrencyConflictError("Saga " + entity.id() + " is not active", entity.id());
    }
    if (it->second.version() != entity.version()) {
        throw ConcurrencyConflictError(
            "Saga " + entity.id() + " was modified concurrently (stored version " +
                std::to_string(it->second.version()) + ", update based on " +
                std::to_string(entity.version()) + ")",
            entity.id());
    }

    unindex(it->second);
    it->second = entity;
    it->second.set_version(entity.version() + 1);
    index(it->second);
}

void InMemorySagaPersister::complete(const SagaEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = key_of(entity);
    auto it = entities_.find(key);
    if (it != entities_.end()) {
        unindex(it->second);
        entities_.erase(it);
    }
    completed_.insert(std::move(key));
}

std::optional<SagaEntity> InMemorySagaPersister::get(const std::string& entity_type,
                                                     const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find({entity_type, id});
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SagaEntity> InMemorySagaPersister::find_by_property(const std::string& entity_type,
                                                                  const std::string& property,
                                                                  const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = property_index_.find({entity_type, property});
    if (index_it == property_index_.end()) {
        return std::nullopt;
    }
    auto value_it = index_it->second.find(value);
    if (value_it == index_it->second.end()) {
        return std::nullopt;
    }
    auto entity_it = entities_.find({entity_type, value_it->second});
    if (entity_it == entities_.end()) {
        return std::nullopt;
    }
    return entity_it->second;
}

size_t InMemorySagaPersister::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

void InMemorySagaPersister::index(const SagaEntity& entity) {
    for (const auto& [property, value] : entity.correlation_properties()) {
        property_index_[{entity.entity_type(), property}][value] = entity.id();
    }
}

void InMemorySagaPersister::unindex(const SagaEntity& entity) {
    for (const auto& [property, value] : entity.correlation_properties()) {
        auto index_it = property_index_.find({entity.entity_type(), property});
        if (index_it == property_index_.end()) continue;

        auto value_it = index_it->second.find(value);
        if (value_it != index_it->second.end() && value_it->second == entity.id()) {
            index_it->second.erase(value_it);
        }
    }
}

} // namespace sagabus
