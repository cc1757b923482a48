#include "../../src/internal/manifest_parser.hpp"

#include <mediate/errors.hpp>
#include <mediate/manifest.hpp>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace mediate;
using namespace mediate::internal;

TEST(ManifestParser, ParseProcessorEntry)
{
    std::string manifest = R"({
        "mediators": [{
            "identity": "PriceConverter#process",
            "incoming": {"channel": "prices"},
            "outgoing": {"channel": "my-data-stream", "provider": "kafka"},
            "returns": "double",
            "parameters": [{"kind": "message", "name": "Message", "arguments": ["int"]}]
        }]
    })";

    auto declarations = parse_manifest(manifest);
    ASSERT_EQ(declarations.size(), 1u);

    const auto& decl = declarations[0];
    EXPECT_EQ(decl.signature.identity, "PriceConverter#process");
    EXPECT_EQ(decl.signature.return_type.kind, TypeKind::Payload);
    EXPECT_EQ(decl.signature.return_type.name, "double");
    ASSERT_EQ(decl.signature.parameter_count(), 1u);
    EXPECT_EQ(decl.signature.parameter(0)->kind, TypeKind::Message);
    EXPECT_EQ(decl.signature.parameter(0)->argument(0)->name, "int");

    ASSERT_TRUE(decl.incoming.has_value());
    EXPECT_EQ(decl.incoming->channel, "prices");
    EXPECT_FALSE(decl.incoming->provider.has_value());
    ASSERT_TRUE(decl.outgoing.has_value());
    EXPECT_EQ(decl.outgoing->provider, "kafka");
}

TEST(ManifestParser, ChannelShorthandAndMissingSide)
{
    auto decl = ManifestParser::parse_declaration(json::parse(R"({
        "identity": "Sink#consume",
        "incoming": "prices",
        "outgoing": null,
        "returns": "void",
        "parameters": ["Price"]
    })"));

    ASSERT_TRUE(decl.incoming.has_value());
    EXPECT_EQ(decl.incoming->channel, "prices");
    EXPECT_FALSE(decl.outgoing.has_value());
    EXPECT_EQ(decl.signature.return_type.kind, TypeKind::Void);
}

TEST(ManifestParser, ParametersDefaultToNone)
{
    auto decl = ManifestParser::parse_declaration(
        json::parse(R"({"identity": "Source#tick", "outgoing": "ticks", "returns": "long"})"));

    EXPECT_EQ(decl.signature.parameter_count(), 0u);
}

TEST(ManifestParser, NestedGenericTypes)
{
    TypeDescriptor type = ManifestParser::parse_type(json::parse(R"({
        "kind": "processor_builder",
        "arguments": [{"kind": "message", "arguments": ["Order"]}, "Invoice"]
    })"));

    EXPECT_EQ(type.kind, TypeKind::ProcessorBuilder);
    ASSERT_EQ(type.arguments.size(), 2u);
    EXPECT_EQ(type.arguments[0].kind, TypeKind::Message);
    EXPECT_EQ(type.arguments[0].argument(0)->name, "Order");
    EXPECT_EQ(type.arguments[1].kind, TypeKind::Payload);
}

TEST(ManifestParser, RawGenericHasNoArguments)
{
    TypeDescriptor type = ManifestParser::parse_type(json::parse(R"({"kind": "subscriber"})"));

    EXPECT_EQ(type.kind, TypeKind::Subscriber);
    EXPECT_FALSE(type.is_generic());
}

TEST(ManifestParser, InvalidJson)
{
    EXPECT_THROW(parse_manifest("{not json"), JSONDecodeError);
}

TEST(ManifestParser, MissingMediatorsArray)
{
    EXPECT_THROW(parse_manifest(R"({"beans": []})"), ManifestParseError);
    EXPECT_THROW(parse_manifest(R"({"mediators": {}})"), ManifestParseError);
    EXPECT_THROW(parse_manifest(R"([])"), ManifestParseError);
}

TEST(ManifestParser, EntryErrors)
{
    // No return type
    EXPECT_THROW(parse_manifest(R"({"mediators": [{"identity": "A#b", "outgoing": "x"}]})"),
                 ManifestParseError);
    // Empty identity
    EXPECT_THROW(parse_manifest(R"({"mediators": [{"identity": "", "returns": "int"}]})"),
                 ManifestParseError);
    // Identity of the wrong type
    EXPECT_THROW(parse_manifest(R"({"mediators": [{"identity": 7, "returns": "int"}]})"),
                 ManifestParseError);
    // Binding of the wrong type
    EXPECT_THROW(
        parse_manifest(R"({"mediators": [{"identity": "A#b", "returns": "int", "incoming": 3}]})"),
        ManifestParseError);
}

TEST(ManifestParser, UnknownKindKeepsOffendingData)
{
    try
    {
        ManifestParser::parse_type(json::parse(R"({"kind": "observable"})"));
        FAIL() << "expected ManifestParseError";
    }
    catch (const ManifestParseError& e)
    {
        EXPECT_EQ(std::string(e.what()), "Unknown type kind: observable");
        ASSERT_NE(e.data(), nullptr);
        EXPECT_EQ((*e.data())["kind"], "observable");
    }
}

TEST(Manifest, RegisterAndClassify)
{
    auto declarations = parse_manifest(R"({
        "mediators": [
            {"identity": "Source#generate", "outgoing": "prices",
             "returns": {"kind": "publisher", "arguments": ["int"]}},
            {"identity": "Converter#toEuro", "incoming": "prices", "outgoing": "euros",
             "returns": {"kind": "publisher_builder", "arguments": [{"kind": "message", "arguments": ["double"]}]},
             "parameters": [{"kind": "publisher_builder", "arguments": ["int"]}]},
            {"identity": "Sink#consume", "incoming": "euros",
             "returns": {"kind": "completion_stage", "arguments": ["void"]},
             "parameters": [{"kind": "message", "arguments": ["double"]}]}
        ]
    })");

    RegistryOptions options;
    options.diagnostic_callback = [](const std::string&) {};
    MediatorRegistry registry(options);
    register_manifest(registry, declarations);
    ASSERT_EQ(registry.size(), 3u);

    registry.classify_all();

    const MediatorConfiguration* converter = registry.find("Converter#toEuro");
    ASSERT_NE(converter, nullptr);
    EXPECT_EQ(converter->shape(), Shape::StreamTransformer);
    EXPECT_EQ(converter->production(), Production::StreamOfMessage);
    EXPECT_EQ(converter->consumption(), Consumption::StreamOfPayload);
    EXPECT_TRUE(converter->uses_builder_types());

    const MediatorConfiguration* sink = registry.find("Sink#consume");
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->shape(), Shape::Subscriber);
    EXPECT_EQ(sink->consumption(), Consumption::Message);
}

TEST(Manifest, UnboundDeclarationIsRejectedOnRegistration)
{
    auto declarations =
        parse_manifest(R"({"mediators": [{"identity": "Orphan#run", "returns": "int"}]})");

    MediatorRegistry registry;
    EXPECT_THROW(register_manifest(registry, declarations), ConfigurationError);
}

TEST(Manifest, LoadFromFile)
{
    std::string path = ::testing::TempDir() + "mediate_manifest_test.json";
    {
        std::ofstream file(path);
        file << R"({"mediators": [{"identity": "Source#tick", "outgoing": "ticks", "returns": "long"}]})";
    }

    auto declarations = load_manifest(path);
    std::remove(path.c_str());

    ASSERT_EQ(declarations.size(), 1u);
    EXPECT_EQ(declarations[0].outgoing->channel, "ticks");
}

TEST(Manifest, LoadMissingFile)
{
    EXPECT_THROW(load_manifest("/nonexistent/mediate/manifest.json"), ManifestParseError);
}
