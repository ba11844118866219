#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// In-process transport: records every outbound frame in its stream text form
// and lets a test play the server by injecting events.
class LoopbackTransport final : public ProtocolTransport
{
  public:
    bool start(EventQueue &events) override;

    bool send_auth(std::string_view username,
                   std::string_view display_name,
                   std::string_view secret) override;
    bool send_join(std::string_view channel, std::string_view display_name) override;
    bool send_msg(std::string_view display_name, std::string_view content) override;
    bool send_bye(std::string_view display_name) override;
    bool send_err(std::string_view display_name, std::string_view content) override;

    void disconnect() override;

    void set_request_pending(bool pending) override { request_pending_ = pending; }
    void mark_authenticated() override { authenticated_ = true; }

    std::string name() const override { return "loopback"; }

    // server side
    void inject(Event ev);
    void inject(proto::Message m) { inject(Event::message(std::move(m))); }

    std::vector<std::string> sent() const;  // lines without CRLF
    std::string              last_sent() const;
    void                     clear_sent();

    // every later send fails as if the socket died
    void fail_sends(bool on) { fail_sends_ = on; }

    bool started() const { return started_; }
    bool disconnected() const { return disconnected_; }
    int  disconnect_calls() const { return disconnect_calls_; }
    bool request_pending() const { return request_pending_; }
    bool authenticated() const { return authenticated_; }

  private:
    bool record(std::string line);

    mutable std::mutex       mu_;
    std::vector<std::string> sent_;
    EventQueue              *events_{nullptr};
    std::atomic_bool         started_{false};
    std::atomic_bool         disconnected_{false};
    std::atomic_bool         fail_sends_{false};
    std::atomic_bool         request_pending_{false};
    std::atomic_bool         authenticated_{false};
    std::atomic_int          disconnect_calls_{0};
};

}  // namespace transport
