#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "sagabus/types.pb.h"

namespace sagabus {

/**
 * Called with a message that no saga instance claimed.
 */
class SagaNotFoundHandler {
public:
    virtual ~SagaNotFoundHandler() = default;

    virtual std::string name() const = 0;
    virtual void handle(const Envelope& message) = 0;
};

/**
 * SagaNotFoundHandler backed by a function.
 */
class FunctionNotFoundHandler : public SagaNotFoundHandler {
public:
    FunctionNotFoundHandler(std::string name, std::function<void(const Envelope&)> fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    void handle(const Envelope& message) override { fn_(message); }

private:
    std::string name_;
    std::function<void(const Envelope&)> fn_;
};

/**
 * Invokes every registered SagaNotFoundHandler, in registration order.
 */
class SagaNotFoundFallback {
public:
    explicit SagaNotFoundFallback(std::vector<std::shared_ptr<SagaNotFoundHandler>> handlers)
        : handlers_(std::move(handlers)) {}

    void invoke(const Envelope& message) const;

    size_t handler_count() const { return handlers_.size(); }

private:
    std::vector<std::shared_ptr<SagaNotFoundHandler>> handlers_;
};

} // namespace sagabus
