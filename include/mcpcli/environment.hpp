#ifndef MCPCLI_ENVIRONMENT_HPP
#define MCPCLI_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpcli
{

/// Variables forwarded from the controlling process to every server by default
const std::vector<std::string>& default_inherited_env_vars();

/// Allow-listed subset of the current environment. Values that start with "()"
/// (exported shell functions) are skipped.
std::map<std::string, std::string> default_environment();

/// base overlaid with overrides; overrides win
std::map<std::string, std::string>
merge_environment(const std::map<std::string, std::string>& base,
                  const std::optional<std::map<std::string, std::string>>& overrides);

} // namespace mcpcli

#endif // MCPCLI_ENVIRONMENT_HPP
