#include <mediate/signature.hpp>
#include <sstream>

namespace mediate
{

namespace
{

struct KindName
{
    TypeKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {TypeKind::Void, "void"},
    {TypeKind::Payload, "payload"},
    {TypeKind::Message, "message"},
    {TypeKind::Publisher, "publisher"},
    {TypeKind::PublisherBuilder, "publisher_builder"},
    {TypeKind::Processor, "processor"},
    {TypeKind::ProcessorBuilder, "processor_builder"},
    {TypeKind::Subscriber, "subscriber"},
    {TypeKind::CompletionStage, "completion_stage"},
};

} // namespace

const char* to_string(TypeKind kind)
{
    for (const auto& entry : kKindNames)
    {
        if (entry.kind == kind)
            return entry.name;
    }
    return "unknown";
}

std::optional<TypeKind> kind_from_string(const std::string& name)
{
    for (const auto& entry : kKindNames)
    {
        if (name == entry.name)
            return entry.kind;
    }
    return std::nullopt;
}

std::string TypeDescriptor::to_string() const
{
    std::string result = name.empty() ? std::string(mediate::to_string(kind)) : name;
    if (arguments.empty())
        return result;

    result += "<";
    for (size_t i = 0; i < arguments.size(); ++i)
    {
        if (i > 0)
            result += ", ";
        result += arguments[i].to_string();
    }
    result += ">";
    return result;
}

json TypeDescriptor::to_json() const
{
    json result = {{"kind", mediate::to_string(kind)}, {"name", name}};
    if (!arguments.empty())
    {
        json args = json::array();
        for (const auto& arg : arguments)
            args.push_back(arg.to_json());
        result["arguments"] = args;
    }
    return result;
}

bool is_envelope(const TypeDescriptor& type)
{
    return type.kind == TypeKind::Message;
}

bool is_publisher(const TypeDescriptor& type)
{
    return type.kind == TypeKind::Publisher || type.kind == TypeKind::Processor;
}

bool is_publisher_builder(const TypeDescriptor& type)
{
    return type.kind == TypeKind::PublisherBuilder;
}

bool is_stream(const TypeDescriptor& type)
{
    return is_publisher(type) || is_publisher_builder(type);
}

bool is_processor(const TypeDescriptor& type)
{
    return type.kind == TypeKind::Processor || type.kind == TypeKind::ProcessorBuilder;
}

bool is_subscriber(const TypeDescriptor& type)
{
    return type.kind == TypeKind::Subscriber || type.kind == TypeKind::Processor;
}

bool is_completion_stage(const TypeDescriptor& type)
{
    return type.kind == TypeKind::CompletionStage;
}

bool is_void(const TypeDescriptor& type)
{
    return type.kind == TypeKind::Void;
}

bool is_builder_type(const TypeDescriptor& type)
{
    return type.kind == TypeKind::PublisherBuilder || type.kind == TypeKind::ProcessorBuilder;
}

std::string Signature::to_string() const
{
    std::ostringstream oss;
    oss << return_type.to_string() << " " << identity << "(";
    for (size_t i = 0; i < parameter_types.size(); ++i)
    {
        if (i > 0)
            oss << ", ";
        oss << parameter_types[i].to_string();
    }
    oss << ")";
    return oss.str();
}

json Signature::to_json() const
{
    json params = json::array();
    for (const auto& param : parameter_types)
        params.push_back(param.to_json());

    return json{{"identity", identity}, {"returns", return_type.to_json()}, {"parameters", params}};
}

} // namespace mediate
