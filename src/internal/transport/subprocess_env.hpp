#ifndef MCPCLI_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
#define MCPCLI_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP

#include "../subprocess/process.hpp"

#include <mcpcli/environment.hpp>
#include <mcpcli/types.hpp>

namespace mcpcli::internal
{

inline void apply_server_environment(subprocess::ProcessOptions& proc_opts,
                                     const ServerParameters& params,
                                     const SessionOptions& options)
{
    const auto base = options.base_environment ? *options.base_environment : default_environment();
    proc_opts.environment = merge_environment(base, params.env);
    proc_opts.inherit_environment = options.inherit_environment;
    if (options.working_directory)
        proc_opts.working_directory = *options.working_directory;
}

} // namespace mcpcli::internal

#endif // MCPCLI_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
