#include "app/chat_session.hpp"
#include "proto/validate.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

const char *state_name(State s)
{
    switch (s)
    {
        case State::Init:
            return "init";
        case State::Authenticating:
            return "authenticating";
        case State::Open:
            return "open";
        case State::JoinPending:
            return "join-pending";
        case State::Terminated:
            return "terminated";
    }
    return "?";
}

const char *end_reason_name(EndReason r)
{
    switch (r)
    {
        case EndReason::None:
            return "none";
        case EndReason::LocalRequest:
            return "local request";
        case EndReason::PeerFarewell:
            return "peer farewell";
        case EndReason::PeerError:
            return "peer error";
        case EndReason::ProtocolFault:
            return "protocol fault";
        case EndReason::ConnectionFault:
            return "connection fault";
    }
    return "?";
}

ChatSession::ChatSession(transport::ProtocolTransport &t, OnOutput out)
    : tx_(t), out_(std::move(out))
{
}

void ChatSession::emit(Output kind, const std::string &line)
{
    if (out_)
        out_(kind, line);
}

void ChatSession::reject(const std::string &why)
{
    LOG_DEBUG("rejected in %s: %s", state_name(state_), why.c_str());
    emit(Output::LocalError, "ERROR: " + why);
}

std::string ChatSession::err_sender() const
{
    return display_name_.empty() ? std::string(constants::FALLBACK_DISPLAY_NAME) : display_name_;
}

void ChatSession::end(EndReason why)
{
    if (state_ == State::Terminated)
        return;
    LOG_INFO("%s -> terminated (%s)", state_name(state_), end_reason_name(why));
    state_      = State::Terminated;
    end_reason_ = why;
    pending_    = PendingRequest::None;
    deadline_.reset();
}

void ChatSession::await_reply(PendingRequest what)
{
    pending_  = what;
    deadline_ = Clock::now() + (what == PendingRequest::Auth ? constants::AUTH_REPLY_TIMEOUT
                                                             : constants::JOIN_REPLY_TIMEOUT);
    tx_.set_request_pending(true);
}

void ChatSession::clear_pending()
{
    pending_ = PendingRequest::None;
    pending_channel_.clear();
    deadline_.reset();
    tx_.set_request_pending(false);
}

void ChatSession::connection_fault(const std::string &why)
{
    emit(Output::LocalError, "ERROR: " + why);
    end(EndReason::ConnectionFault);
}

void ChatSession::protocol_fault(const std::string &why)
{
    LOG_WARN("protocol fault: %s", why.c_str());
    emit(Output::LocalError, "ERROR: " + why);
    // the reason may quote raw inbound bytes
    if (!tx_.send_err(err_sender(), validate::to_content(why)))
        LOG_WARN("could not report the fault to the server");
    end(EndReason::ProtocolFault);
}

bool ChatSession::authenticate(std::string_view username,
                               std::string_view secret,
                               std::string_view display_name)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Terminated)
    {
        reject("session has ended");
        return false;
    }
    if (authenticated_)
    {
        reject("already authenticated");
        return false;
    }
    if (state_ == State::Authenticating)
    {
        reject("authentication already in progress");
        return false;
    }

    const std::pair<validate::Field, std::string_view> fields[] = {
        {validate::Field::Username, username},
        {validate::Field::Secret, secret},
        {validate::Field::DisplayName, display_name},
    };
    for (const auto &f : fields)
    {
        if (!validate::check(f.first, f.second))
        {
            reject(std::string("invalid ") + validate::field_name(f.first) + ", " +
                   validate::field_rule(f.first));
            return false;
        }
    }

    display_name_ = std::string(display_name);
    state_        = State::Authenticating;
    await_reply(PendingRequest::Auth);
    if (!tx_.send_auth(username, display_name, secret))
    {
        connection_fault("failed to send authentication request");
        return false;
    }
    return true;
}

bool ChatSession::join(std::string_view channel)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Terminated)
    {
        reject("session has ended");
        return false;
    }
    if (!authenticated_)
    {
        reject("authenticate with /auth first");
        return false;
    }
    if (state_ == State::JoinPending)
    {
        reject("join already in progress");
        return false;
    }
    if (!validate::is_channel(channel))
    {
        reject(std::string("invalid channel, ") + validate::field_rule(validate::Field::Channel));
        return false;
    }

    state_           = State::JoinPending;
    pending_channel_ = std::string(channel);
    await_reply(PendingRequest::Join);
    if (!tx_.send_join(channel, display_name_))
    {
        connection_fault("failed to send join request");
        return false;
    }
    return true;
}

bool ChatSession::send_chat(std::string_view content)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Terminated)
    {
        reject("session has ended");
        return false;
    }
    if (state_ != State::Open && state_ != State::JoinPending)
    {
        reject("authenticate with /auth before sending messages");
        return false;
    }
    if (!validate::is_content(content))
    {
        reject(std::string("invalid message, ") + validate::field_rule(validate::Field::Content));
        return false;
    }
    if (!tx_.send_msg(display_name_, content))
    {
        connection_fault("failed to send message");
        return false;
    }
    return true;
}

bool ChatSession::rename(std::string_view display_name)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Terminated)
    {
        reject("session has ended");
        return false;
    }
    if (!validate::is_display_name(display_name))
    {
        reject(std::string("invalid display name, ") +
               validate::field_rule(validate::Field::DisplayName));
        return false;
    }
    display_name_ = std::string(display_name);
    LOG_DEBUG("display name is now %s", display_name_.c_str());
    return true;
}

void ChatSession::on_event(const transport::Event &ev)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Terminated)
    {
        LOG_DEBUG("event after termination dropped");
        return;
    }
    switch (ev.type)
    {
        case transport::Event::Type::Message:
            handle_message(ev.msg);
            break;
        case transport::Event::Type::Malformed:
            protocol_fault(ev.detail);
            break;
        case transport::Event::Type::Fault:
            connection_fault(ev.detail);
            break;
        default:
            break;
    }
}

void ChatSession::handle_message(const proto::Message &m)
{
    switch (m.kind)
    {
        case proto::Kind::Reply:
            handle_reply(m);
            break;
        case proto::Kind::Chat:
            if (state_ == State::Open || state_ == State::JoinPending)
                emit(Output::Chat, m.sender.value_or("") + ": " + m.content);
            else
                LOG_DEBUG("chat message in %s discarded", state_name(state_));
            break;
        case proto::Kind::Error:
            emit(Output::PeerError, "ERROR FROM " + m.sender.value_or("") + ": " + m.content);
            end(EndReason::PeerError);
            break;
        case proto::Kind::Farewell:
            LOG_INFO("server said goodbye (%s)", m.sender.value_or("").c_str());
            end(EndReason::PeerFarewell);
            break;
    }
}

void ChatSession::handle_reply(const proto::Message &m)
{
    const PendingRequest what = pending_;
    if (what == PendingRequest::None)
    {
        protocol_fault("unexpected REPLY with no request outstanding");
        return;
    }

    emit(Output::Info, std::string(m.ok ? "Action Success: " : "Action Failure: ") + m.content);

    if (what == PendingRequest::Auth)
    {
        if (m.ok)
        {
            authenticated_ = true;
            channel_       = std::string(constants::DEFAULT_CHANNEL);
            state_         = State::Open;
            tx_.mark_authenticated();
        }
        else
        {
            state_ = State::Init;
        }
    }
    else
    {
        if (m.ok)
            channel_ = pending_channel_;
        state_ = State::Open;
    }
    LOG_DEBUG("reply %s -> %s", m.ok ? "OK" : "NOK", state_name(state_));
    clear_pending();
}

void ChatSession::check_timeouts(Clock::time_point now)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (pending_ == PendingRequest::None || !deadline_ || now < *deadline_)
        return;

    if (pending_ == PendingRequest::Auth)
    {
        state_ = State::Init;
        emit(Output::LocalError, "ERROR: no reply to authentication request");
    }
    else
    {
        state_ = State::Open;
        emit(Output::LocalError, "ERROR: no reply to join request");
    }
    clear_pending();
}

void ChatSession::terminate(EndReason why)
{
    std::lock_guard<std::mutex> lk(mu_);
    end(why);
}

void ChatSession::report(Output kind, const std::string &line)
{
    std::lock_guard<std::mutex> lk(mu_);
    emit(kind, line);
}

State ChatSession::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

PendingRequest ChatSession::pending_request() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_;
}

EndReason ChatSession::end_reason() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return end_reason_;
}

bool ChatSession::authenticated() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return authenticated_;
}

std::string ChatSession::display_name() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return display_name_;
}

std::string ChatSession::channel() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return channel_;
}

std::string ChatSession::pending_channel() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_channel_;
}

std::optional<Clock::time_point> ChatSession::reply_deadline() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return deadline_;
}

}  // namespace app
