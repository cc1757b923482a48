#include <mediate/classifier.hpp>
#include <utility>

namespace mediate
{

namespace
{

// Production/consumption pair chosen by one validation branch
struct Modes
{
    Production production = Production::None;
    Consumption consumption = Consumption::None;
    bool uses_builder_types = false;
};

using BranchResult = std::variant<Modes, ConfigurationFailure>;

class Validator
{
  public:
    explicit Validator(const Signature& signature) : signature_(signature) {}

    BranchResult subscriber() const;
    BranchResult publisher() const;
    BranchResult processor() const;
    BranchResult stream_transformer() const;

  private:
    ConfigurationFailure fail(BindingContext context, std::string reason) const
    {
        return ConfigurationFailure{context, signature_.identity, std::move(reason)};
    }

    ConfigurationFailure incoming_error(std::string reason) const
    {
        return fail(BindingContext::Incoming, std::move(reason));
    }

    ConfigurationFailure outgoing_error(std::string reason) const
    {
        return fail(BindingContext::Outgoing, std::move(reason));
    }

    ConfigurationFailure incoming_and_outgoing_error(std::string reason) const
    {
        return fail(BindingContext::IncomingAndOutgoing, std::move(reason));
    }

    BranchResult returning_a_processor() const;
    BranchResult consuming_single_producing_a_stream() const;
    BranchResult consuming_single_producing_single() const;

    const Signature& signature_;
};

// Element a stream source emits: a Processor<I, O> emits its second argument
const TypeDescriptor* stream_element(const TypeDescriptor& stream)
{
    if (stream.kind == TypeKind::Processor)
        return stream.argument(1);
    return stream.argument(0);
}

Production stream_production(const TypeDescriptor& element)
{
    return is_envelope(element) ? Production::StreamOfMessage : Production::StreamOfPayload;
}

Consumption stream_consumption(const TypeDescriptor& element)
{
    return is_envelope(element) ? Consumption::StreamOfMessage : Consumption::StreamOfPayload;
}

Production completion_stage_production(const TypeDescriptor& value)
{
    return is_envelope(value) ? Production::CompletionStageOfMessage
                              : Production::CompletionStageOfPayload;
}

Consumption single_consumption(const TypeDescriptor& param)
{
    return is_envelope(param) ? Consumption::Message : Consumption::Payload;
}

// ----------------------------------------------------------------------------
// Subscriber
//   Subscriber<Message<I>> method()       Subscriber<I> method()
//   future<?> method(Message<I>)          future<?> method(I)
//   void/? method(Message<I>)             void/? method(I)
// ----------------------------------------------------------------------------
BranchResult Validator::subscriber() const
{
    const TypeDescriptor& returned = signature_.return_type;

    if (is_subscriber(returned))
    {
        if (signature_.parameter_count() != 0)
            return incoming_error("when returning a subscriber, no parameters are expected");

        // A Processor<I, O> consumes its first argument
        const TypeDescriptor* element = returned.argument(0);
        if (element == nullptr)
            return incoming_error("the returned subscriber must declare a type parameter");

        return Modes{Production::None, stream_consumption(*element), false};
    }

    if (is_completion_stage(returned))
    {
        if (signature_.parameter_count() != 1)
            return incoming_error("when returning an asynchronous value, one parameter is expected");

        return Modes{Production::None, single_consumption(*signature_.parameter(0)), false};
    }

    if (signature_.parameter_count() == 1)
        return Modes{Production::None, single_consumption(*signature_.parameter(0)), false};

    return incoming_error("unsupported signature");
}

// ----------------------------------------------------------------------------
// Publisher
//   Publisher<Message<O>> method()        Publisher<O> method()
//   PublisherBuilder<Message<O>> method() PublisherBuilder<O> method()
//   Message<O> method()                   O method() (O not void)
//   future<Message<O>> method()           future<O> method()
// ----------------------------------------------------------------------------
BranchResult Validator::publisher() const
{
    const TypeDescriptor& returned = signature_.return_type;

    if (is_void(returned))
        return outgoing_error("the method must not be `void`");

    if (signature_.parameter_count() != 0)
        return outgoing_error("no parameters expected");

    if (is_publisher(returned) || is_publisher_builder(returned))
    {
        const TypeDescriptor* element = stream_element(returned);
        if (element == nullptr)
            return outgoing_error("expected a type parameter for the returned stream");

        return Modes{stream_production(*element), Consumption::None,
                     is_publisher_builder(returned)};
    }

    if (is_envelope(returned))
        return Modes{Production::IndividualMessage, Consumption::None, false};

    if (is_completion_stage(returned))
    {
        const TypeDescriptor* value = returned.argument(0);
        if (value == nullptr)
            return outgoing_error("expected a type parameter in the return asynchronous value");

        return Modes{completion_stage_production(*value), Consumption::None, false};
    }

    return Modes{Production::IndividualPayload, Consumption::None, false};
}

// ----------------------------------------------------------------------------
// Processor
//   Processor<Message<I>, Message<O>> method()    Processor<I, O> method()
//   ProcessorBuilder<...> method()
//   Publisher<Message<O>> method(Message<I>)      Publisher<O> method(I)
//   PublisherBuilder<...> method(...)
//   Message<O> method(Message<I>)                 O method(I)
//   future<Message<O>> method(Message<I>)         future<O> method(I)
// ----------------------------------------------------------------------------
BranchResult Validator::processor() const
{
    const TypeDescriptor& returned = signature_.return_type;

    if (is_processor(returned))
        return returning_a_processor();

    if (is_stream(returned))
    {
        if (signature_.parameter_count() != 1)
            return incoming_and_outgoing_error("one parameter expected");
        return consuming_single_producing_a_stream();
    }

    return consuming_single_producing_single();
}

BranchResult Validator::returning_a_processor() const
{
    if (signature_.parameter_count() != 0)
        return incoming_and_outgoing_error("the method must not have parameters");

    const TypeDescriptor& returned = signature_.return_type;
    const TypeDescriptor* input = returned.argument(0);
    const TypeDescriptor* output = returned.argument(1);
    if (input == nullptr || output == nullptr)
        return incoming_and_outgoing_error("expected 2 type parameters for the returned processor");

    return Modes{stream_production(*output), stream_consumption(*input),
                 returned.kind == TypeKind::ProcessorBuilder};
}

BranchResult Validator::consuming_single_producing_a_stream() const
{
    const TypeDescriptor& returned = signature_.return_type;
    const TypeDescriptor* element = stream_element(returned);
    if (element == nullptr)
        return outgoing_error("expected a type parameter for the returned stream");

    // The parameter is one item; the runtime feeds the upstream into it item by item.
    return Modes{stream_production(*element), stream_consumption(*signature_.parameter(0)),
                 is_publisher_builder(returned)};
}

BranchResult Validator::consuming_single_producing_single() const
{
    const TypeDescriptor& returned = signature_.return_type;

    Production production = Production::IndividualPayload;
    if (is_completion_stage(returned))
    {
        const TypeDescriptor* value = returned.argument(0);
        if (value == nullptr)
        {
            return incoming_and_outgoing_error(
                "expected a type parameter in the return asynchronous value");
        }
        production = completion_stage_production(*value);
    }
    else if (is_void(returned))
    {
        return incoming_and_outgoing_error("the method must not be `void`");
    }
    else
    {
        production =
            is_envelope(returned) ? Production::IndividualMessage : Production::IndividualPayload;
    }

    if (signature_.parameter_count() != 1)
        return incoming_and_outgoing_error("one parameter expected");

    return Modes{production, single_consumption(*signature_.parameter(0)), false};
}

// ----------------------------------------------------------------------------
// Stream transformer
//   Publisher<Message<O>> method(Publisher<Message<I>>)
//   Publisher<O> method(Publisher<I>)
//   PublisherBuilder<Message<O>> method(PublisherBuilder<Message<I>>)
//   PublisherBuilder<O> method(PublisherBuilder<I>)
// ----------------------------------------------------------------------------
BranchResult Validator::stream_transformer() const
{
    if (signature_.parameter_count() != 1)
        return incoming_and_outgoing_error("one parameter expected");

    const TypeDescriptor& returned = signature_.return_type;
    const TypeDescriptor* produced = stream_element(returned);
    if (produced == nullptr)
        return outgoing_error("expected a type parameter for the returned stream");

    // Element type of the consumed stream comes from the parameter itself
    const TypeDescriptor* consumed = stream_element(*signature_.parameter(0));
    if (consumed == nullptr)
        return incoming_error("expected a type parameter for the consumed stream");

    return Modes{stream_production(*produced), stream_consumption(*consumed),
                 is_publisher_builder(returned)};
}

} // namespace

Shape deduce_shape(const Signature& signature, bool has_incoming, bool has_outgoing)
{
    if (has_incoming && has_outgoing)
    {
        const TypeDescriptor* first = signature.parameter(0);
        if (is_stream(signature.return_type) && first != nullptr && is_stream(*first))
            return Shape::StreamTransformer;
        return Shape::Processor;
    }
    if (has_incoming)
        return Shape::Subscriber;
    return Shape::Publisher;
}

ClassificationResult try_classify(const Signature& signature,
                                  const std::optional<ChannelBinding>& incoming,
                                  const std::optional<ChannelBinding>& outgoing)
{
    if (!incoming.has_value() && !outgoing.has_value())
    {
        return ConfigurationFailure{BindingContext::None, signature.identity,
                                    "the method is not bound to any channel"};
    }
    if (incoming.has_value() && incoming->channel.empty())
    {
        return ConfigurationFailure{BindingContext::Incoming, signature.identity,
                                    "the channel name must not be empty"};
    }
    if (outgoing.has_value() && outgoing->channel.empty())
    {
        return ConfigurationFailure{BindingContext::Outgoing, signature.identity,
                                    "the channel name must not be empty"};
    }

    Shape shape = deduce_shape(signature, incoming.has_value(), outgoing.has_value());

    Validator validator(signature);
    BranchResult branch;
    switch (shape)
    {
    case Shape::Subscriber:
        branch = validator.subscriber();
        break;
    case Shape::Publisher:
        branch = validator.publisher();
        break;
    case Shape::Processor:
        branch = validator.processor();
        break;
    case Shape::StreamTransformer:
        branch = validator.stream_transformer();
        break;
    }

    if (auto* failure = std::get_if<ConfigurationFailure>(&branch))
        return std::move(*failure);

    const Modes& modes = std::get<Modes>(branch);
    return MediatorConfiguration(signature, shape, modes.production, modes.consumption,
                                 modes.uses_builder_types, incoming, outgoing);
}

MediatorConfiguration classify(const Signature& signature,
                               const std::optional<ChannelBinding>& incoming,
                               const std::optional<ChannelBinding>& outgoing)
{
    ClassificationResult result = try_classify(signature, incoming, outgoing);
    if (const ConfigurationFailure* failure = result.error())
        throw ConfigurationError(*failure);
    return result.value();
}

} // namespace mediate
