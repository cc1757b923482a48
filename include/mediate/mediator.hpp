#ifndef MEDIATE_MEDIATOR_HPP
#define MEDIATE_MEDIATOR_HPP

#include <mediate/classifier.hpp>
#include <mediate/type_traits.hpp>
#include <optional>
#include <string>
#include <utility>

namespace mediate
{

// ============================================================================
// Mediator Wrapper - a callable bound to channels and classified up front
// ============================================================================

/// Wraps a C++ callable as a mediator. The signature is derived from the
/// callable's type and classified on construction, so a mis-shaped callable
/// fails here rather than once messages flow.
template <typename Func>
class MediatorWrapper
{
  public:
    using Traits = FunctionTraits<remove_cvref_t<Func>>;
    using ReturnType = typename Traits::ReturnType;
    static constexpr size_t Arity = Traits::arity;

    /// Throws ConfigurationError when the callable matches no supported pattern
    MediatorWrapper(std::string identity, Func&& func, std::optional<ChannelBinding> incoming,
                    std::optional<ChannelBinding> outgoing)
        : func_(std::forward<Func>(func)),
          configuration_(
              classify(describe<Func>(std::move(identity)), incoming, outgoing))
    {
    }

    const std::string& identity() const
    {
        return configuration_.method_as_string();
    }

    const Signature& signature() const
    {
        return configuration_.signature();
    }

    const MediatorConfiguration& configuration() const
    {
        return configuration_;
    }

    /// The wrapped callable, for the stream wiring runtime
    const Func& callable() const
    {
        return func_;
    }

    /// Invoke the wrapped callable directly
    template <typename... Args>
    ReturnType operator()(Args&&... args) const
    {
        return func_(std::forward<Args>(args)...);
    }

  private:
    Func func_;
    MediatorConfiguration configuration_;
};

// ============================================================================
// Mediator Factory Functions
// ============================================================================

/// Consume from @p incoming and produce to @p outgoing
template <typename Func>
auto make_mediator(std::string identity, Func&& func, std::optional<ChannelBinding> incoming,
                   std::optional<ChannelBinding> outgoing)
{
    return MediatorWrapper<Func>(std::move(identity), std::forward<Func>(func),
                                 std::move(incoming), std::move(outgoing));
}

/// Consume from @p incoming only
template <typename Func>
auto make_subscriber(std::string identity, Func&& func, ChannelBinding incoming)
{
    return make_mediator(std::move(identity), std::forward<Func>(func), std::move(incoming),
                         std::nullopt);
}

/// Produce to @p outgoing only
template <typename Func>
auto make_publisher(std::string identity, Func&& func, ChannelBinding outgoing)
{
    return make_mediator(std::move(identity), std::forward<Func>(func), std::nullopt,
                         std::move(outgoing));
}

} // namespace mediate

#endif // MEDIATE_MEDIATOR_HPP
