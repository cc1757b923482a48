#include <mediate/types.hpp>

namespace mediate
{

const char* to_string(Shape shape)
{
    switch (shape)
    {
    case Shape::Subscriber:
        return "SUBSCRIBER";
    case Shape::Publisher:
        return "PUBLISHER";
    case Shape::Processor:
        return "PROCESSOR";
    case Shape::StreamTransformer:
        return "STREAM_TRANSFORMER";
    }
    return "UNKNOWN";
}

const char* to_string(Production production)
{
    switch (production)
    {
    case Production::None:
        return "NONE";
    case Production::IndividualPayload:
        return "INDIVIDUAL_PAYLOAD";
    case Production::IndividualMessage:
        return "INDIVIDUAL_MESSAGE";
    case Production::CompletionStageOfPayload:
        return "COMPLETION_STAGE_OF_PAYLOAD";
    case Production::CompletionStageOfMessage:
        return "COMPLETION_STAGE_OF_MESSAGE";
    case Production::StreamOfPayload:
        return "STREAM_OF_PAYLOAD";
    case Production::StreamOfMessage:
        return "STREAM_OF_MESSAGE";
    }
    return "UNKNOWN";
}

const char* to_string(Consumption consumption)
{
    switch (consumption)
    {
    case Consumption::None:
        return "NONE";
    case Consumption::Payload:
        return "PAYLOAD";
    case Consumption::Message:
        return "MESSAGE";
    case Consumption::StreamOfPayload:
        return "STREAM_OF_PAYLOAD";
    case Consumption::StreamOfMessage:
        return "STREAM_OF_MESSAGE";
    }
    return "UNKNOWN";
}

const char* to_string(BindingContext context)
{
    switch (context)
    {
    case BindingContext::None:
        return "no channel";
    case BindingContext::Incoming:
        return "an incoming channel";
    case BindingContext::Outgoing:
        return "an outgoing channel";
    case BindingContext::IncomingAndOutgoing:
        return "incoming and outgoing channels";
    }
    return "unknown channels";
}

} // namespace mediate
