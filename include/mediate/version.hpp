#ifndef MEDIATE_VERSION_HPP
#define MEDIATE_VERSION_HPP

#include <string>

namespace mediate
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace mediate

#endif // MEDIATE_VERSION_HPP
