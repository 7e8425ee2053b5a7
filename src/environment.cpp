#include <cstdlib>
#include <mcpcli/environment.hpp>

namespace mcpcli
{

const std::vector<std::string>& default_inherited_env_vars()
{
    static const std::vector<std::string> vars = {
        "HOME",    // Required for home directory access
        "LOGNAME", // Login name
        "PATH",    // Required to resolve server commands
        "SHELL",   // Unix shell
        "TERM",    // Terminal type
        "USER",    // User name
        "LANG",    // Locale settings
        "LC_ALL",  // Locale settings
        "TMPDIR",  // Temporary directory
    };
    return vars;
}

std::map<std::string, std::string> default_environment()
{
    std::map<std::string, std::string> env;
    for (const auto& name : default_inherited_env_vars())
    {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr)
            continue;

        std::string str(value);
        if (str.rfind("()", 0) == 0)
            continue; // Skip exported shell functions

        env[name] = str;
    }
    return env;
}

std::map<std::string, std::string>
merge_environment(const std::map<std::string, std::string>& base,
                  const std::optional<std::map<std::string, std::string>>& overrides)
{
    std::map<std::string, std::string> merged = base;
    if (overrides)
    {
        for (const auto& [key, value] : *overrides)
            merged[key] = value;
    }
    return merged;
}

} // namespace mcpcli
