#include "transport/loopback_transport.hpp"
#include "proto/textwire.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake server link to drive the session without sockets.
bool LoopbackTransport::start(EventQueue &events)
{
    events_  = &events;
    started_ = true;
    return true;
}

bool LoopbackTransport::record(std::string line)
{
    if (!started_ || disconnected_ || fail_sends_)
        return false;
    if (line.size() >= textwire::CRLF.size())
        line.resize(line.size() - textwire::CRLF.size());
    LOG_DEBUG("tx: %s", line.c_str());
    std::lock_guard<std::mutex> lk(mu_);
    sent_.push_back(std::move(line));
    return true;
}

bool LoopbackTransport::send_auth(std::string_view username,
                                  std::string_view display_name,
                                  std::string_view secret)
{
    return record(textwire::encode_auth(username, display_name, secret));
}

bool LoopbackTransport::send_join(std::string_view channel, std::string_view display_name)
{
    return record(textwire::encode_join(channel, display_name));
}

bool LoopbackTransport::send_msg(std::string_view display_name, std::string_view content)
{
    return record(textwire::encode_msg(display_name, content));
}

bool LoopbackTransport::send_bye(std::string_view display_name)
{
    return record(textwire::encode_bye(display_name));
}

bool LoopbackTransport::send_err(std::string_view display_name, std::string_view content)
{
    return record(textwire::encode_err(display_name, content));
}

void LoopbackTransport::disconnect()
{
    ++disconnect_calls_;
    disconnected_ = true;
}

void LoopbackTransport::inject(Event ev)
{
    if (events_)
        events_->put(std::move(ev));
}

std::vector<std::string> LoopbackTransport::sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

std::string LoopbackTransport::last_sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_.empty() ? std::string() : sent_.back();
}

void LoopbackTransport::clear_sent()
{
    std::lock_guard<std::mutex> lk(mu_);
    sent_.clear();
}

}  // namespace transport
