#ifndef MEDIATE_HPP
#define MEDIATE_HPP

// Main header that includes everything

#include <mediate/classifier.hpp>
#include <mediate/errors.hpp>
#include <mediate/manifest.hpp>
#include <mediate/mediator.hpp>
#include <mediate/mediator_configuration.hpp>
#include <mediate/registry.hpp>
#include <mediate/signature.hpp>
#include <mediate/streams.hpp>
#include <mediate/type_traits.hpp>
#include <mediate/types.hpp>
#include <mediate/version.hpp>

#endif // MEDIATE_HPP
