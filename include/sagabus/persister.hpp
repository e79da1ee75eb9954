#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "sagabus/types.pb.h"
#include "errors.hpp"

namespace sagabus {

/**
 * Durable storage for saga entities.
 *
 * Entities are keyed by (entity_type, id): sagas of different types may
 * share an id when one correlated message starts both. Implementations
 * must make save() an atomic create-if-absent and must detect concurrent updates; both cases
 * throw ConcurrencyConflictError. After complete() the entity must never be
 * returned by a lookup again.
 */
class SagaPersister {
public:
    virtual ~SagaPersister() = default;

    /**
     * Store a new entity.
     * @throws ConcurrencyConflictError if an entity with the same type and id exists
     */
    virtual void save(const SagaEntity& entity) = 0;

    /**
     * Replace the stored entity with the same type and id.
     * @throws ConcurrencyConflictError if the stored version differs from entity.version()
     */
    virtual void update(const SagaEntity& entity) = 0;

    /**
     * Remove the entity from the active search scope.
     */
    virtual void complete(const SagaEntity& entity) = 0;

    /**
     * Look up an active entity of `entity_type` by id.
     */
    virtual std::optional<SagaEntity> get(const std::string& entity_type,
                                          const std::string& id) = 0;

    /**
     * Look up an active entity of `entity_type` whose indexed correlation
     * property `property` equals `value`.
     */
    virtual std::optional<SagaEntity> find_by_property(const std::string& entity_type,
                                                       const std::string& property,
                                                       const std::string& value) = 0;
};

/**
 * Thread-safe in-process SagaPersister.
 *
 * Versions start at 1 on save and are bumped on every update. Completed
 * keys are remembered so a late save for a finished saga is rejected.
 */
class InMemorySagaPersister : public SagaPersister {
public:
    void save(const SagaEntity& entity) override;
    void update(const SagaEntity& entity) override;
    void complete(const SagaEntity& entity) override;
    std::optional<SagaEntity> get(const std::string& entity_type,
                                  const std::string& id) override;
    std::optional<SagaEntity> find_by_property(const std::string& entity_type,
                                               const std::string& property,
                                               const std::string& value) override;

    /**
     * Number of active (not completed) entities.
     */
    size_t size() const;

private:
    using EntityKey = std::pair<std::string, std::string>;
    using PropertyKey = std::pair<std::string, std::string>;

    static EntityKey key_of(const SagaEntity& entity) { return {entity.entity_type(), entity.id()}; }

    void index(const SagaEntity& entity);
    void unindex(const SagaEntity& entity);

    mutable std::mutex mutex_;
    std::map<EntityKey, SagaEntity> entities_;
    std::set<EntityKey> completed_;
    // (entity_type, property) -> value -> id
    std::map<PropertyKey, std::map<std::string, std::string>> property_index_;
};

} // namespace sagabus
