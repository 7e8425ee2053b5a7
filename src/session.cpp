#include <mcpcli/errors.hpp>
#include <mcpcli/session.hpp>

namespace mcpcli
{

// ============================================================================
// StdioSession::Impl
// ============================================================================

class StdioSession::Impl
{
  public:
    explicit Impl(std::unique_ptr<Transport> transport) : transport_(std::move(transport))
    {
        if (!transport_)
            throw InvalidParametersError("Session requires a transport");
        transport_->open();
    }

    ~Impl()
    {
        transport_->close();
    }

    Transport& transport()
    {
        return *transport_;
    }

    const Transport& transport() const
    {
        return *transport_;
    }

  private:
    std::unique_ptr<Transport> transport_;
};

// ============================================================================
// StdioSession
// ============================================================================

StdioSession::StdioSession(const ServerParameters& params, const SessionOptions& options)
    : impl_(std::make_unique<Impl>(create_stdio_transport(params, options)))
{
}

StdioSession::StdioSession(std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(std::move(transport)))
{
}

StdioSession::~StdioSession() = default;

StdioSession::StdioSession(StdioSession&&) noexcept = default;
StdioSession& StdioSession::operator=(StdioSession&&) noexcept = default;

MessageReceiver& StdioSession::inbound()
{
    if (!impl_)
        throw McpError("Session has been moved from");
    return impl_->transport().inbound();
}

MessageSender& StdioSession::outbound()
{
    if (!impl_)
        throw McpError("Session has been moved from");
    return impl_->transport().outbound();
}

bool StdioSession::send(Message message)
{
    return outbound().send(std::move(message));
}

std::optional<Message> StdioSession::receive()
{
    return inbound().receive();
}

std::optional<Message> StdioSession::receive_for(std::chrono::milliseconds timeout)
{
    return inbound().receive_for(timeout);
}

void StdioSession::close()
{
    if (impl_)
        impl_->transport().close();
}

SessionState StdioSession::state() const
{
    return impl_ ? impl_->transport().state() : SessionState::Closed;
}

bool StdioSession::is_running() const
{
    return impl_ && impl_->transport().is_running();
}

long StdioSession::get_pid() const
{
    return impl_ ? impl_->transport().get_pid() : 0;
}

std::optional<int> StdioSession::exit_code() const
{
    return impl_ ? impl_->transport().exit_code() : std::nullopt;
}

std::optional<std::string> StdioSession::failure() const
{
    return impl_ ? impl_->transport().failure() : std::nullopt;
}

std::optional<std::string> StdioSession::termination_error() const
{
    return impl_ ? impl_->transport().termination_error() : std::nullopt;
}

} // namespace mcpcli
