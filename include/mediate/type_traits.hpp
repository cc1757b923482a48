#ifndef MEDIATE_TYPE_TRAITS_HPP
#define MEDIATE_TYPE_TRAITS_HPP

#include <mediate/signature.hpp>
#include <mediate/streams.hpp>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#if defined(__GNUG__)
#include <cstdlib>
#include <cxxabi.h>
#endif

namespace mediate
{

// ============================================================================
// Helper Utilities
// ============================================================================

/// Helper to remove cv-ref qualifiers
template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

// ============================================================================
// Type Names (diagnostics only)
// ============================================================================

/// Display name of a payload type. Specialize for custom names.
template <typename T>
struct TypeName
{
    static std::string get()
    {
        if constexpr (std::is_same_v<T, bool>)
            return "bool";
        else if constexpr (std::is_same_v<T, int>)
            return "int";
        else if constexpr (std::is_same_v<T, long>)
            return "long";
        else if constexpr (std::is_same_v<T, int64_t>)
            return "int64_t";
        else if constexpr (std::is_same_v<T, uint64_t>)
            return "uint64_t";
        else if constexpr (std::is_same_v<T, float>)
            return "float";
        else if constexpr (std::is_same_v<T, double>)
            return "double";
        else if constexpr (std::is_same_v<T, std::string>)
            return "std::string";
        else
            return demangle(typeid(T).name());
    }

  private:
    static std::string demangle(const char* mangled)
    {
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, void (*)(void*)> readable(
            abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
        if (status == 0 && readable)
            return readable.get();
#endif
        return mangled;
    }
};

// ============================================================================
// C++ Type to Type Descriptor Mapping
// ============================================================================

/// Maps a declared C++ type to its TypeDescriptor.
/// Stream vocabulary types, std::future and std::shared_future are recognized;
/// std::shared_ptr / std::unique_ptr holders are looked through; everything
/// else is a payload. Specialize for custom stream or envelope types.
template <typename T>
struct TypeToDescriptor
{
    static TypeDescriptor get()
    {
        using BaseType = remove_cvref_t<T>;

        if constexpr (!std::is_same_v<BaseType, T>)
            return TypeToDescriptor<BaseType>::get();
        else
            return TypeDescriptor{TypeKind::Payload, TypeName<T>::get()};
    }
};

template <>
struct TypeToDescriptor<void>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::Void, "void"};
    }
};

template <typename T>
struct TypeToDescriptor<std::shared_ptr<T>> : TypeToDescriptor<T>
{
};

template <typename T, typename Deleter>
struct TypeToDescriptor<std::unique_ptr<T, Deleter>> : TypeToDescriptor<T>
{
};

template <typename T>
struct TypeToDescriptor<Message<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::Message, "Message", {TypeToDescriptor<T>::get()}};
    }
};

template <typename T>
struct TypeToDescriptor<Publisher<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::Publisher, "Publisher", {TypeToDescriptor<T>::get()}};
    }
};

template <typename T>
struct TypeToDescriptor<Subscriber<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::Subscriber, "Subscriber", {TypeToDescriptor<T>::get()}};
    }
};

template <typename I, typename O>
struct TypeToDescriptor<Processor<I, O>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::Processor,
                              "Processor",
                              {TypeToDescriptor<I>::get(), TypeToDescriptor<O>::get()}};
    }
};

template <typename T>
struct TypeToDescriptor<PublisherBuilder<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::PublisherBuilder,
                              "PublisherBuilder",
                              {TypeToDescriptor<T>::get()}};
    }
};

template <typename I, typename O>
struct TypeToDescriptor<ProcessorBuilder<I, O>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::ProcessorBuilder,
                              "ProcessorBuilder",
                              {TypeToDescriptor<I>::get(), TypeToDescriptor<O>::get()}};
    }
};

template <typename T>
struct TypeToDescriptor<std::future<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::CompletionStage, "std::future",
                              {TypeToDescriptor<T>::get()}};
    }
};

template <typename T>
struct TypeToDescriptor<std::shared_future<T>>
{
    static TypeDescriptor get()
    {
        return TypeDescriptor{TypeKind::CompletionStage, "std::shared_future",
                              {TypeToDescriptor<T>::get()}};
    }
};

// ============================================================================
// Function Signature Traits
// ============================================================================

/// Extract traits from function pointers
template <typename Func>
struct FunctionTraits;

// Function pointer: Ret(*)(Args...)
template <typename Ret, typename... Args>
struct FunctionTraits<Ret (*)(Args...)>
{
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template <size_t N>
    using ArgType = std::tuple_element_t<N, ArgsTuple>;
};

// Member function and lambda operator() const
template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...) const>
{
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template <size_t N>
    using ArgType = std::tuple_element_t<N, ArgsTuple>;
};

// Member function and mutable lambda operator()
template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...)>
{
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template <size_t N>
    using ArgType = std::tuple_element_t<N, ArgsTuple>;
};

// Regular function: Ret(Args...)
template <typename Ret, typename... Args>
struct FunctionTraits<Ret(Args...)>
{
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template <size_t N>
    using ArgType = std::tuple_element_t<N, ArgsTuple>;
};

// Auto-decay to operator() for lambdas and functors
template <typename Func>
struct FunctionTraits : FunctionTraits<decltype(&remove_cvref_t<Func>::operator())>
{
};

// ============================================================================
// Signature Description
// ============================================================================

namespace detail
{

template <typename Traits, size_t... Indices>
std::vector<TypeDescriptor> describe_parameters(std::index_sequence<Indices...>)
{
    return {TypeToDescriptor<typename Traits::template ArgType<Indices>>::get()...};
}

} // namespace detail

/// Build the Signature of a callable type without invoking it
template <typename Func>
Signature describe(std::string identity)
{
    using Traits = FunctionTraits<remove_cvref_t<Func>>;

    Signature signature;
    signature.identity = std::move(identity);
    signature.return_type = TypeToDescriptor<typename Traits::ReturnType>::get();
    signature.parameter_types =
        detail::describe_parameters<Traits>(std::make_index_sequence<Traits::arity>{});
    return signature;
}

/// Build the Signature of @p func (automatic type deduction)
template <typename Func>
Signature describe(std::string identity, const Func&)
{
    return describe<Func>(std::move(identity));
}

} // namespace mediate

#endif // MEDIATE_TYPE_TRAITS_HPP
