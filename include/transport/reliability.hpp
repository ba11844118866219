#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "proto/dgram.hpp"
#include "transport/endpoint.hpp"
#include "util/constants.hpp"

namespace transport
{

struct ReliabilitySettings
{
    std::chrono::milliseconds timeout{constants::DEFAULT_TIMEOUT_MS};
    std::uint8_t              max_retries{constants::DEFAULT_RETRIES};
};

enum class Delivery
{
    Confirmed,    // CONFIRM arrived within the retry budget
    Unconfirmed,  // budget exhausted; one extra unacknowledged copy was sent
    Cancelled,    // cancel() ended the wait
    Failed        // the socket refused the datagram
};

const char *delivery_name(Delivery d);

struct Inbound
{
    enum class Action
    {
        Acked,      // a CONFIRM, consumed by the engine
        Deliver,    // new application frame, hand it to the session
        Duplicate,  // already processed, confirmed again and dropped
        Ignore,     // PING
        Malformed   // error says why
    };

    Action      action = Action::Ignore;
    dgram::Frame frame;
    std::string error;
};

// Confirm/retransmit/dedup state for one datagram peer.
//
// send_reliable() blocks the calling thread until the frame is confirmed or
// the retry budget runs out. on_datagram() is fed from the receive thread and
// may be called from inside the send callback; no socket I/O happens while
// the internal lock is held.
class ReliabilityEngine
{
  public:
    using SendFn = std::function<bool(const dgram::Bytes &, const Endpoint &)>;

    struct Stats
    {
        std::uint64_t sent{0};
        std::uint64_t retransmissions{0};
        std::uint64_t unconfirmed{0};
        std::uint64_t acks_sent{0};
        std::uint64_t acks_received{0};
        std::uint64_t duplicates{0};
    };

    ReliabilityEngine(ReliabilitySettings settings, Endpoint peer, SendFn send);

    ReliabilityEngine(const ReliabilityEngine &)            = delete;
    ReliabilityEngine &operator=(const ReliabilityEngine &) = delete;

    // wraps at 65535
    std::uint16_t next_id();

    // frame must already carry its id in the header
    Delivery send_reliable(const dgram::Bytes &frame);
    Inbound  on_datagram(const std::uint8_t *buf, std::size_t len, const Endpoint &from);

    // REPLY frames are never deduplicated while a request is outstanding
    void set_request_pending(bool pending);
    // stop following the source address of inbound datagrams
    void lock_peer();
    // wake every sender; later sends return Cancelled at once
    void cancel();
    // end the acknowledgment waits in progress with Cancelled; later sends wait as usual
    void abort_waits();
    // wait until nothing awaits a CONFIRM, at most budget
    bool wait_idle(std::chrono::milliseconds budget);

    Endpoint    peer() const;
    bool        peer_locked() const;
    std::size_t pending() const;
    Stats       stats() const;

  private:
    struct PendingAck
    {
        dgram::Bytes  payload;
        std::uint8_t  retries_used{0};
    };

    bool transmit(const dgram::Bytes &frame, const Endpoint &to);

    ReliabilitySettings settings_;
    SendFn              send_;

    mutable std::mutex                           mu_;
    std::condition_variable                      cv_;
    std::unordered_map<std::uint16_t, PendingAck> pending_;
    std::unordered_set<std::uint16_t>            seen_;
    Endpoint                                     peer_;
    std::uint16_t                                next_id_{0};
    bool                                         peer_locked_{false};
    bool                                         request_pending_{false};
    bool                                         cancelled_{false};
    std::uint32_t                                abort_gen_{0};
    Stats                                        stats_;
};

}  // namespace transport
