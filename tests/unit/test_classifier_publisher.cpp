#include "test_utils.hpp"

#include <mediate/classifier.hpp>
#include <gtest/gtest.h>

using namespace mediate;
using namespace mediate::test;

TEST(PublisherClassifier, StreamOfPayload)
{
    auto config = classify(signature(publisher(payload())), none, out("prices"));

    EXPECT_EQ(config.shape(), Shape::Publisher);
    EXPECT_EQ(config.production(), Production::StreamOfPayload);
    EXPECT_EQ(config.consumption(), Consumption::None);
    EXPECT_FALSE(config.uses_builder_types());
    EXPECT_EQ(config.outgoing(), "prices");
    EXPECT_FALSE(config.incoming().has_value());
}

TEST(PublisherClassifier, StreamOfMessage)
{
    auto config = classify(signature(publisher(message())), none, out());

    EXPECT_EQ(config.production(), Production::StreamOfMessage);
    EXPECT_FALSE(config.uses_builder_types());
}

TEST(PublisherClassifier, BuilderStreamOfMessage)
{
    auto config = classify(signature(publisher_builder(message())), none, out());

    EXPECT_EQ(config.shape(), Shape::Publisher);
    EXPECT_EQ(config.production(), Production::StreamOfMessage);
    EXPECT_TRUE(config.uses_builder_types());
}

TEST(PublisherClassifier, BuilderStreamOfPayload)
{
    auto config = classify(signature(publisher_builder(payload())), none, out());

    EXPECT_EQ(config.production(), Production::StreamOfPayload);
    EXPECT_TRUE(config.uses_builder_types());
}

TEST(PublisherClassifier, IndividualMessage)
{
    auto config = classify(signature(message()), none, out());

    EXPECT_EQ(config.production(), Production::IndividualMessage);
    EXPECT_EQ(config.consumption(), Consumption::None);
}

TEST(PublisherClassifier, EnvelopeWithoutTypeArgumentIsStillAMessage)
{
    auto config = classify(signature(raw_message()), none, out());

    EXPECT_EQ(config.production(), Production::IndividualMessage);
}

TEST(PublisherClassifier, IndividualPayload)
{
    auto config = classify(signature(payload("double")), none, out());

    EXPECT_EQ(config.production(), Production::IndividualPayload);
}

TEST(PublisherClassifier, CompletionStageOfPayload)
{
    auto config = classify(signature(future(payload())), none, out());

    EXPECT_EQ(config.production(), Production::CompletionStageOfPayload);
}

TEST(PublisherClassifier, CompletionStageOfMessage)
{
    auto config = classify(signature(future(message())), none, out());

    EXPECT_EQ(config.production(), Production::CompletionStageOfMessage);
}

TEST(PublisherClassifier, RejectsParameters)
{
    EXPECT_EQ(failure_reason(signature(publisher(payload()), {payload()}), none, out()),
              "no parameters expected");
    EXPECT_EQ(failure_reason(signature(payload(), {payload(), payload()}), none, out()),
              "no parameters expected");
}

TEST(PublisherClassifier, RejectsVoid)
{
    EXPECT_EQ(failure_reason(signature(void_type()), none, out()),
              "the method must not be `void`");
}

TEST(PublisherClassifier, VoidIsReportedBeforeParameters)
{
    EXPECT_EQ(failure_reason(signature(void_type(), {payload()}), none, out()),
              "the method must not be `void`");
}

TEST(PublisherClassifier, RejectsCompletionStageWithoutTypeArgument)
{
    EXPECT_EQ(failure_reason(signature(raw_future()), none, out()),
              "expected a type parameter in the return asynchronous value");
}

TEST(PublisherClassifier, RejectsStreamWithoutTypeArgument)
{
    EXPECT_EQ(failure_reason(signature(raw_publisher()), none, out()),
              "expected a type parameter for the returned stream");
    EXPECT_EQ(failure_reason(signature(raw_publisher_builder()), none, out()),
              "expected a type parameter for the returned stream");
}

TEST(PublisherClassifier, ErrorCarriesOutgoingContextAndIdentity)
{
    try
    {
        classify(signature(void_type(), {}, "PriceSource#generate"), none, out());
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.context(), BindingContext::Outgoing);
        EXPECT_EQ(e.identity(), "PriceSource#generate");
        EXPECT_EQ(std::string(e.what()),
                  "Invalid mediator bound to an outgoing channel: PriceSource#generate - the "
                  "method must not be `void`");
    }
}

TEST(PublisherClassifier, ProviderTagIsPassedThrough)
{
    auto config = classify(signature(payload()), none, ChannelBinding{"prices", "kafka"});

    EXPECT_EQ(config.outgoing_provider(), "kafka");
    EXPECT_FALSE(config.incoming_provider().has_value());
}

TEST(PublisherClassifier, ReturnedProcessorEmitsItsOutputType)
{
    auto config = classify(signature(processor(payload(), message())), none, out());

    EXPECT_EQ(config.shape(), Shape::Publisher);
    EXPECT_EQ(config.production(), Production::StreamOfMessage);

    config = classify(signature(processor(message(), payload())), none, out());
    EXPECT_EQ(config.production(), Production::StreamOfPayload);
}
