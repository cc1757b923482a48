#include "manifest_parser.hpp"

#include <mediate/errors.hpp>

namespace mediate
{
namespace internal
{

std::vector<MediatorDeclaration> ManifestParser::parse(const std::string& json_str)
{
    json document;
    try
    {
        document = json::parse(json_str);
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }

    if (!document.is_object() || !document.contains("mediators"))
        throw ManifestParseError("Manifest must be an object with a 'mediators' array", document);

    const json& mediators = document["mediators"];
    if (!mediators.is_array())
        throw ManifestParseError("'mediators' must be an array", document);

    std::vector<MediatorDeclaration> declarations;
    declarations.reserve(mediators.size());
    for (const auto& entry : mediators)
        declarations.push_back(parse_declaration(entry));
    return declarations;
}

MediatorDeclaration ManifestParser::parse_declaration(const json& j)
{
    if (!j.is_object())
        throw ManifestParseError("Mediator entry must be an object", j);

    try
    {
        MediatorDeclaration declaration;
        declaration.signature.identity = j.at("identity").get<std::string>();
        if (declaration.signature.identity.empty())
            throw ManifestParseError("Mediator identity must not be empty", j);

        if (!j.contains("returns"))
        {
            throw ManifestParseError(
                "Mediator " + declaration.signature.identity + " has no 'returns' type", j);
        }
        declaration.signature.return_type = parse_type(j["returns"]);

        if (j.contains("parameters"))
        {
            const json& params = j["parameters"];
            if (!params.is_array())
            {
                throw ManifestParseError(
                    "'parameters' of " + declaration.signature.identity + " must be an array", j);
            }
            for (const auto& param : params)
                declaration.signature.parameter_types.push_back(parse_type(param));
        }

        declaration.incoming = parse_binding(j, "incoming", declaration.signature.identity);
        declaration.outgoing = parse_binding(j, "outgoing", declaration.signature.identity);
        return declaration;
    }
    catch (const json::exception& e)
    {
        throw ManifestParseError(std::string("Invalid mediator entry: ") + e.what(), j);
    }
}

TypeDescriptor ManifestParser::parse_type(const json& j)
{
    if (j.is_string())
    {
        std::string name = j.get<std::string>();
        if (name == "void")
            return TypeDescriptor{TypeKind::Void, name};
        return TypeDescriptor{TypeKind::Payload, name};
    }

    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string())
        throw ManifestParseError("Type must be a name or an object with a 'kind'", j);

    std::string kind_name = j["kind"].get<std::string>();
    std::optional<TypeKind> kind = kind_from_string(kind_name);
    if (!kind.has_value())
        throw ManifestParseError("Unknown type kind: " + kind_name, j);

    TypeDescriptor type;
    type.kind = *kind;
    if (j.contains("name"))
        type.name = j["name"].get<std::string>();

    if (j.contains("arguments"))
    {
        const json& args = j["arguments"];
        if (!args.is_array())
            throw ManifestParseError("'arguments' must be an array", j);
        for (const auto& arg : args)
            type.arguments.push_back(parse_type(arg));
    }
    return type;
}

std::optional<ChannelBinding> ManifestParser::parse_binding(const json& j, const char* key,
                                                            const std::string& identity)
{
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;

    const json& binding = j[key];

    // Shorthand: "incoming": "prices"
    if (binding.is_string())
        return ChannelBinding{binding.get<std::string>()};

    if (!binding.is_object())
    {
        throw ManifestParseError(std::string("'") + key + "' of " + identity +
                                     " must be a channel name or an object",
                                 j);
    }
    return ChannelBinding::from_json(binding);
}

} // namespace internal
} // namespace mediate
