#ifndef MCPCLI_VERSION_HPP
#define MCPCLI_VERSION_HPP

#include <string>

namespace mcpcli
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// "MAJOR.MINOR.PATCH", also sent as clientInfo.version during initialize
std::string version_string();

} // namespace mcpcli

#endif // MCPCLI_VERSION_HPP
