#ifndef MEDIATE_STREAMS_HPP
#define MEDIATE_STREAMS_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace mediate
{

// ============================================================================
// Message - payload envelope
// ============================================================================

/// Wraps a payload together with its metadata and an acknowledgement callback
template <typename T>
class Message
{
  public:
    using PayloadType = T;
    using Acknowledger = std::function<void()>;

    explicit Message(T payload, nlohmann::json metadata = nlohmann::json::object(),
                     Acknowledger acknowledger = nullptr)
        : payload_(std::move(payload)), metadata_(std::move(metadata)),
          acknowledger_(std::move(acknowledger))
    {
    }

    const T& payload() const
    {
        return payload_;
    }

    T& payload()
    {
        return payload_;
    }

    const nlohmann::json& metadata() const
    {
        return metadata_;
    }

    /// Acknowledge the message. No-op when no acknowledger was attached.
    void ack() const
    {
        if (acknowledger_)
            acknowledger_();
    }

    /// Same metadata and acknowledgement, different payload
    template <typename U>
    Message<U> with_payload(U payload) const
    {
        return Message<U>(std::move(payload), metadata_, acknowledger_);
    }

  private:
    T payload_;
    nlohmann::json metadata_;
    Acknowledger acknowledger_;
};

template <typename T>
Message<std::decay_t<T>> make_message(T&& payload)
{
    return Message<std::decay_t<T>>(std::forward<T>(payload));
}

// ============================================================================
// Raw stream interfaces (push-based, demand driven)
// ============================================================================

class Subscription
{
  public:
    virtual ~Subscription() = default;

    /// Signal demand for @p n more items
    virtual void request(int64_t n) = 0;
    virtual void cancel() = 0;
};

template <typename T>
class Subscriber
{
  public:
    using ValueType = T;

    virtual ~Subscriber() = default;

    virtual void on_subscribe(std::shared_ptr<Subscription> subscription) = 0;
    virtual void on_next(T item) = 0;
    virtual void on_error(std::exception_ptr error) = 0;
    virtual void on_complete() = 0;
};

template <typename T>
class Publisher
{
  public:
    using ValueType = T;

    virtual ~Publisher() = default;

    virtual void subscribe(std::shared_ptr<Subscriber<T>> subscriber) = 0;
};

/// Both a subscriber of I and a publisher of O
template <typename I, typename O>
class Processor : public Subscriber<I>, public Publisher<O>
{
  public:
    using InputType = I;
    using OutputType = O;
};

// ============================================================================
// Builder wrappers
// ============================================================================

/// Fluent wrapper around a raw publisher
template <typename T>
class PublisherBuilder
{
  public:
    explicit PublisherBuilder(std::shared_ptr<Publisher<T>> publisher)
        : publisher_(std::move(publisher))
    {
        if (!publisher_)
            throw std::invalid_argument("PublisherBuilder requires a publisher");
    }

    /// Route the stream through @p processor
    template <typename O>
    PublisherBuilder<O> via(std::shared_ptr<Processor<T, O>> processor) const
    {
        if (!processor)
            throw std::invalid_argument("PublisherBuilder::via requires a processor");
        publisher_->subscribe(processor);
        return PublisherBuilder<O>(std::move(processor));
    }

    /// Attach @p subscriber and start the stream
    void to(std::shared_ptr<Subscriber<T>> subscriber) const
    {
        publisher_->subscribe(std::move(subscriber));
    }

    std::shared_ptr<Publisher<T>> build() const
    {
        return publisher_;
    }

  private:
    std::shared_ptr<Publisher<T>> publisher_;
};

/// Fluent wrapper around a raw processor
template <typename I, typename O>
class ProcessorBuilder
{
  public:
    explicit ProcessorBuilder(std::shared_ptr<Processor<I, O>> processor)
        : processor_(std::move(processor))
    {
        if (!processor_)
            throw std::invalid_argument("ProcessorBuilder requires a processor");
    }

    std::shared_ptr<Processor<I, O>> build() const
    {
        return processor_;
    }

  private:
    std::shared_ptr<Processor<I, O>> processor_;
};

} // namespace mediate

#endif // MEDIATE_STREAMS_HPP
