#ifndef MEDIATE_REGISTRY_HPP
#define MEDIATE_REGISTRY_HPP

#include <mediate/classifier.hpp>
#include <mediate/type_traits.hpp>
#include <mediate/types.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mediate
{

// ============================================================================
// Mediator Registry - startup classification pass
// ============================================================================

/// Collects the mediators an application declares and classifies all of them
/// in one pass before any message flows. Any failure aborts startup.
///
/// Not thread-safe; populate and classify from the startup thread.
class MediatorRegistry
{
  public:
    explicit MediatorRegistry(RegistryOptions options = {});

    /// Register a described signature.
    /// Throws std::invalid_argument on a duplicate identity and
    /// ConfigurationError when neither binding is given.
    void add(Signature signature, std::optional<ChannelBinding> incoming,
             std::optional<ChannelBinding> outgoing);

    /// Register a callable; its signature is derived from its type
    template <typename Func>
    void add(std::string identity, const Func& func, std::optional<ChannelBinding> incoming,
             std::optional<ChannelBinding> outgoing)
    {
        add(describe(std::move(identity), func), std::move(incoming), std::move(outgoing));
    }

    /// Register an already classified mediator wrapper
    template <typename Wrapper>
    void add_mediator(const Wrapper& mediator)
    {
        const MediatorConfiguration& config = mediator.configuration();
        add(config.signature(), config.incoming_binding(), config.outgoing_binding());
    }

    /// Classify every registered mediator, in registration order.
    /// Throws StartupError carrying every failure (or only the first one
    /// when RegistryOptions::fail_fast is set).
    const std::vector<MediatorConfiguration>& classify_all();

    /// Configuration of @p identity after a successful classify_all(), or nullptr
    const MediatorConfiguration* find(const std::string& identity) const;

    bool contains(const std::string& identity) const;

    size_t size() const
    {
        return entries_.size();
    }

    bool classified() const
    {
        return classified_;
    }

  private:
    struct Entry
    {
        Signature signature;
        std::optional<ChannelBinding> incoming;
        std::optional<ChannelBinding> outgoing;
    };

    void log(const std::string& line) const;

    RegistryOptions options_;
    std::vector<Entry> entries_;
    std::vector<MediatorConfiguration> configurations_;
    bool classified_ = false;
};

} // namespace mediate

#endif // MEDIATE_REGISTRY_HPP
