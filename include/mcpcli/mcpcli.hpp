#ifndef MCPCLI_HPP
#define MCPCLI_HPP

// Main header that includes everything

#include <mcpcli/channel.hpp>
#include <mcpcli/codec.hpp>
#include <mcpcli/config.hpp>
#include <mcpcli/environment.hpp>
#include <mcpcli/errors.hpp>
#include <mcpcli/messages.hpp>
#include <mcpcli/session.hpp>
#include <mcpcli/transport.hpp>
#include <mcpcli/types.hpp>
#include <mcpcli/version.hpp>

#endif // MCPCLI_HPP
