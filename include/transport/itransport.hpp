#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "proto/message.hpp"
#include "util/queue.hpp"

namespace transport
{

// Everything the driver loop consumes: inbound traffic from the transport's
// receive task, plus user input and signals funnelled in by the client.
struct Event
{
    enum class Type
    {
        Message,      // msg is valid
        Malformed,    // protocol fault, detail says why
        Fault,        // connection fault, detail says why
        Input,        // detail is one line of user input
        InputClosed,  // EOF on stdin
        Interrupt     // SIGINT / SIGTERM
    };

    Type           type = Type::Message;
    proto::Message msg;
    std::string    detail;

    static Event message(proto::Message m)
    {
        Event e;
        e.type = Type::Message;
        e.msg  = std::move(m);
        return e;
    }
    static Event of(Type t, std::string detail = {})
    {
        Event e;
        e.type   = t;
        e.detail = std::move(detail);
        return e;
    }
};

using EventQueue = util::UnboundedBlockingQueue<Event>;

// One binding of the chat protocol to a network transport. The send_* calls
// return false only on a connection fault; a datagram that could not be
// confirmed is still a successful send.
struct ProtocolTransport
{
    virtual bool start(EventQueue &events) = 0;

    virtual bool send_auth(std::string_view username,
                           std::string_view display_name,
                           std::string_view secret)                                  = 0;
    virtual bool send_join(std::string_view channel, std::string_view display_name)  = 0;
    virtual bool send_msg(std::string_view display_name, std::string_view content)   = 0;
    virtual bool send_bye(std::string_view display_name)                             = 0;
    virtual bool send_err(std::string_view display_name, std::string_view content)   = 0;

    // Push out anything still in flight, waiting at most budget.
    virtual bool flush(std::chrono::milliseconds /*budget*/) { return true; }
    // Idempotent; stops the receive task and releases the socket.
    virtual void disconnect() = 0;
    // Safe from any thread. A send blocked on an acknowledgment returns at once
    // as a successful send; later sends are unaffected.
    virtual void abort_waits() {}

    // Session hooks
    virtual void set_request_pending(bool /*pending*/) {}
    virtual void mark_authenticated() {}

    virtual std::string name() const { return ""; }
    virtual ~ProtocolTransport() = default;
};

}  // namespace transport
