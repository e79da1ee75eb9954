#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include "sagabus/types.pb.h"
#include "persister.hpp"

namespace sagabus {

/**
 * Maps an incoming message to an existing saga entity, or reports no match.
 *
 * Every finder belongs to one saga type; the registry uses that association
 * to decide which saga to start when the finder comes back empty.
 */
class SagaFinder {
public:
    SagaFinder(std::string saga_type, std::string entity_type)
        : saga_type_(std::move(saga_type)), entity_type_(std::move(entity_type)) {}

    virtual ~SagaFinder() = default;

    const std::string& saga_type() const { return saga_type_; }
    const std::string& entity_type() const { return entity_type_; }

    /**
     * Short description for diagnostics.
     */
    virtual std::string name() const = 0;

    /**
     * Locate the active entity this message belongs to.
     */
    virtual std::optional<SagaEntity> find(const Envelope& message) const = 0;

private:
    std::string saga_type_;
    std::string entity_type_;
};

/**
 * Finds the entity whose id equals the message's explicit correlation
 * identifier. Messages without one are never matched.
 */
class SagaIdFinder : public SagaFinder {
public:
    SagaIdFinder(std::string saga_type, std::string entity_type,
                 std::shared_ptr<SagaPersister> persister)
        : SagaFinder(std::move(saga_type), std::move(entity_type)),
          persister_(std::move(persister)) {}

    std::string name() const override;
    std::optional<SagaEntity> find(const Envelope& message) const override;

private:
    std::shared_ptr<SagaPersister> persister_;
};

/**
 * Finds the entity whose indexed correlation property equals a value taken
 * from the message body.
 */
class PropertyFinder : public SagaFinder {
public:
    /**
     * Extracts the lookup value from the body. An empty result means no match.
     */
    using MessageKey = std::function<std::string(const google::protobuf::Any&)>;

    PropertyFinder(std::string saga_type, std::string entity_type,
                   std::shared_ptr<SagaPersister> persister,
                   std::string property, MessageKey message_key)
        : SagaFinder(std::move(saga_type), std::move(entity_type)),
          persister_(std::move(persister)),
          property_(std::move(property)),
          message_key_(std::move(message_key)) {}

    const std::string& property() const { return property_; }

    std::string name() const override;
    std::optional<SagaEntity> find(const Envelope& message) const override;

private:
    std::shared_ptr<SagaPersister> persister_;
    std::string property_;
    MessageKey message_key_;
};

/**
 * Finder backed by a user-supplied lookup function.
 */
class FunctionFinder : public SagaFinder {
public:
    using Lookup = std::function<std::optional<SagaEntity>(const Envelope&)>;

    FunctionFinder(std::string saga_type, std::string entity_type, Lookup lookup)
        : SagaFinder(std::move(saga_type), std::move(entity_type)),
          lookup_(std::move(lookup)) {}

    std::string name() const override;
    std::optional<SagaEntity> find(const Envelope& message) const override;

private:
    Lookup lookup_;
};

} // namespace sagabus
