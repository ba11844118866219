#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "proto/message.hpp"
#include "transport/itransport.hpp"

namespace app
{

enum class State
{
    Init,
    Authenticating,
    Open,
    JoinPending,
    Terminated
};

// which request an inbound REPLY answers
enum class PendingRequest
{
    None,
    Auth,
    Join
};

enum class EndReason
{
    None,
    LocalRequest,    // EOF, signal
    PeerFarewell,    // server sent BYE
    PeerError,       // server sent ERR
    ProtocolFault,   // we sent ERR
    ConnectionFault  // socket died
};

enum class Output
{
    Info,        // Action Success / Action Failure
    Chat,        // "{sender}: {content}"
    PeerError,   // "ERROR FROM {sender}: {content}"
    LocalError   // "ERROR: {detail}"
};

const char *state_name(State s);
const char *end_reason_name(EndReason r);

using OnOutput = std::function<void(Output, const std::string &)>;
using Clock    = std::chrono::steady_clock;

// Client side of the chat protocol. User commands and transport events are
// both serialized through one mutex; the output callback runs under it and
// must not call back into the session.
class ChatSession
{
  public:
    ChatSession(transport::ProtocolTransport &t, OnOutput out);

    // User commands. false means rejected locally (nothing was sent) or the
    // connection died while sending; either way a line went to the output.
    bool authenticate(std::string_view username,
                      std::string_view secret,
                      std::string_view display_name);
    bool join(std::string_view channel);
    bool send_chat(std::string_view content);
    bool rename(std::string_view display_name);

    // Message, Malformed and Fault events; others are ignored
    void on_event(const transport::Event &ev);

    // reply deadlines
    void check_timeouts(Clock::time_point now = Clock::now());

    // local end of session; idempotent
    void terminate(EndReason why = EndReason::LocalRequest);

    // message for the user, e.g. usage errors from the command layer
    void report(Output kind, const std::string &line);

    State          state() const;
    PendingRequest pending_request() const;
    EndReason      end_reason() const;
    bool           authenticated() const;
    bool           terminated() const { return state() == State::Terminated; }
    std::string    display_name() const;
    std::string    channel() const;          // last confirmed
    std::string    pending_channel() const;  // JOIN awaiting reply
    std::optional<Clock::time_point> reply_deadline() const;

  private:
    void handle_message(const proto::Message &m);
    void handle_reply(const proto::Message &m);
    void await_reply(PendingRequest what);
    void clear_pending();
    void protocol_fault(const std::string &why);
    void connection_fault(const std::string &why);
    void reject(const std::string &why);
    void end(EndReason why);
    void emit(Output kind, const std::string &line);
    std::string err_sender() const;

    transport::ProtocolTransport &tx_;
    OnOutput                      out_;

    mutable std::mutex               mu_;
    State                            state_{State::Init};
    PendingRequest                   pending_{PendingRequest::None};
    EndReason                        end_reason_{EndReason::None};
    bool                             authenticated_{false};
    std::string                      display_name_;
    std::string                      channel_;
    std::string                      pending_channel_;
    std::optional<Clock::time_point> deadline_;
};

}  // namespace app
