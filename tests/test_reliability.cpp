#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "proto/dgram.hpp"
#include "transport/reliability.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{

// Records every datagram the engine puts on the wire. on_send, if set, runs
// after recording and may feed datagrams straight back into the engine.
struct FakeWire
{
    struct Sent
    {
        dgram::Bytes bytes;
        Endpoint     to;
    };

    std::mutex                                              mu;
    std::vector<Sent>                                       sent;
    std::function<void(const dgram::Bytes &, std::size_t)> on_send;
    bool                                                    fail = false;

    ReliabilityEngine::SendFn fn()
    {
        return [this](const dgram::Bytes &b, const Endpoint &to) {
            if (fail)
                return false;
            std::size_t n;
            {
                std::lock_guard<std::mutex> lk(mu);
                sent.push_back({b, to});
                n = sent.size();
            }
            if (on_send)
                on_send(b, n);
            return true;
        };
    }

    std::size_t count_type(std::uint8_t type)
    {
        std::lock_guard<std::mutex> lk(mu);
        std::size_t                 n = 0;
        for (const auto &s : sent)
            n += (!s.bytes.empty() && s.bytes[0] == type);
        return n;
    }

    Sent last()
    {
        std::lock_guard<std::mutex> lk(mu);
        return sent.back();
    }
};

const Endpoint kServer   = Endpoint::from_ip("127.0.0.1", 4567);
const Endpoint kDynamic  = Endpoint::from_ip("127.0.0.1", 50123);
const Endpoint kOtherOne = Endpoint::from_ip("127.0.0.1", 50999);

ReliabilitySettings fast(std::uint8_t retries = 3)
{
    ReliabilitySettings s;
    s.timeout     = 20ms;
    s.max_retries = retries;
    return s;
}

Inbound feed(ReliabilityEngine &e, const dgram::Bytes &b, const Endpoint &from = kServer)
{
    return e.on_datagram(b.data(), b.size(), from);
}

}  // namespace

TEST(Reliability, ConfirmedWithoutLoss)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    wire.on_send = [&](const dgram::Bytes &b, std::size_t) {
        if (b[0] != dgram::T_CONFIRM)
            feed(eng, dgram::make_confirm(static_cast<std::uint16_t>((b[1] << 8) | b[2])));
    };

    const auto id = eng.next_id();
    EXPECT_EQ(eng.send_reliable(dgram::make_msg(id, "Bob", "hi")), Delivery::Confirmed);
    EXPECT_EQ(wire.count_type(dgram::T_MSG), 1u);
    EXPECT_EQ(eng.stats().retransmissions, 0u);
    EXPECT_EQ(eng.stats().acks_received, 1u);
    EXPECT_EQ(eng.pending(), 0u);
}

TEST(Reliability, RetransmitsAfterFirstLoss)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    // drop the first copy, confirm the second
    wire.on_send = [&](const dgram::Bytes &b, std::size_t n) {
        if (b[0] == dgram::T_MSG && n == 2)
            feed(eng, dgram::make_confirm(static_cast<std::uint16_t>((b[1] << 8) | b[2])));
    };

    auto frame = dgram::make_msg(eng.next_id(), "Bob", "hi");
    EXPECT_EQ(eng.send_reliable(frame), Delivery::Confirmed);
    EXPECT_EQ(wire.count_type(dgram::T_MSG), 2u);
    EXPECT_EQ(eng.stats().retransmissions, 1u);
}

TEST(Reliability, ExhaustionSendsOneExtraCopyAndReportsUnconfirmed)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(3), kServer, wire.fn());

    auto frame = dgram::make_msg(eng.next_id(), "Bob", "hi");
    EXPECT_EQ(eng.send_reliable(frame), Delivery::Unconfirmed);
    // first transmission + 3 retries + 1 unacknowledged
    EXPECT_EQ(wire.count_type(dgram::T_MSG), 5u);
    EXPECT_EQ(eng.stats().retransmissions, 3u);
    EXPECT_EQ(eng.stats().unconfirmed, 1u);
    EXPECT_EQ(eng.pending(), 0u);
    // retransmissions are byte-identical
    std::lock_guard<std::mutex> lk(wire.mu);
    for (const auto &s : wire.sent)
        EXPECT_EQ(s.bytes, frame);
}

TEST(Reliability, ZeroRetriesStillSendsTwice)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(0), kServer, wire.fn());
    EXPECT_EQ(eng.send_reliable(dgram::make_bye(eng.next_id(), "Bob")), Delivery::Unconfirmed);
    EXPECT_EQ(wire.count_type(dgram::T_BYE), 2u);
}

TEST(Reliability, SocketFailureIsReported)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    wire.fail = true;
    EXPECT_EQ(eng.send_reliable(dgram::make_msg(0, "Bob", "hi")), Delivery::Failed);
    EXPECT_EQ(eng.pending(), 0u);
}

TEST(Reliability, InboundFramesAreConfirmedAndDeduplicated)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());

    auto msg   = dgram::make_msg(42, "Alice", "hello");
    auto first = feed(eng, msg);
    EXPECT_EQ(first.action, Inbound::Action::Deliver);
    EXPECT_EQ(first.frame.fields.at(1), "hello");
    EXPECT_EQ(wire.last().bytes, dgram::make_confirm(42));

    auto again = feed(eng, msg);
    EXPECT_EQ(again.action, Inbound::Action::Duplicate);
    // confirmed a second time all the same
    EXPECT_EQ(wire.count_type(dgram::T_CONFIRM), 2u);
    EXPECT_EQ(eng.stats().duplicates, 1u);
}

TEST(Reliability, ReplyIsReprocessedWhileRequestOutstanding)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    auto              reply = dgram::make_reply(7, true, 0, "ok");

    eng.set_request_pending(true);
    EXPECT_EQ(feed(eng, reply).action, Inbound::Action::Deliver);
    EXPECT_EQ(feed(eng, reply).action, Inbound::Action::Deliver);

    eng.set_request_pending(false);
    EXPECT_EQ(feed(eng, reply).action, Inbound::Action::Duplicate);
}

TEST(Reliability, ConfirmIsNeverAcknowledged)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    auto              in = feed(eng, dgram::make_confirm(99));
    EXPECT_EQ(in.action, Inbound::Action::Acked);
    EXPECT_TRUE(wire.sent.empty());
}

TEST(Reliability, PingIsConfirmedButNotDelivered)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    EXPECT_EQ(feed(eng, dgram::make_ping(5)).action, Inbound::Action::Ignore);
    EXPECT_EQ(wire.last().bytes, dgram::make_confirm(5));
}

TEST(Reliability, MalformedBodyIsStillConfirmed)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    dgram::Bytes      bad = {dgram::T_MSG, 0x00, 0x08, 'A', 0x00, 'x'};
    auto              in  = feed(eng, bad);
    EXPECT_EQ(in.action, Inbound::Action::Malformed);
    EXPECT_FALSE(in.error.empty());
    EXPECT_EQ(wire.last().bytes, dgram::make_confirm(8));

    dgram::Bytes tiny = {dgram::T_MSG};
    EXPECT_EQ(feed(eng, tiny).action, Inbound::Action::Malformed);
}

TEST(Reliability, LearnsPeerAddressUntilLocked)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());

    feed(eng, dgram::make_reply(0, true, 0, "ok"), kDynamic);
    EXPECT_EQ(eng.peer(), kDynamic);
    // the confirm goes back to where the frame came from
    EXPECT_EQ(wire.last().to, kDynamic);

    // subsequent sends target the learned address
    wire.on_send = [&](const dgram::Bytes &b, std::size_t) {
        if (b[0] == dgram::T_JOIN)
            feed(eng, dgram::make_confirm(static_cast<std::uint16_t>((b[1] << 8) | b[2])),
                 kDynamic);
    };
    EXPECT_EQ(eng.send_reliable(dgram::make_join(eng.next_id(), "general", "Bob")),
              Delivery::Confirmed);
    EXPECT_EQ(wire.last().to, kDynamic);

    eng.lock_peer();
    feed(eng, dgram::make_msg(1, "Eve", "moved"), kOtherOne);
    EXPECT_EQ(eng.peer(), kDynamic);
}

TEST(Reliability, CancelAbortsWaitingSender)
{
    FakeWire wire;
    ReliabilitySettings s;
    s.timeout     = 2000ms;
    s.max_retries = 3;
    ReliabilityEngine eng(s, kServer, wire.fn());

    std::atomic<int> result{-1};
    auto             start = std::chrono::steady_clock::now();
    std::thread      t([&] {
        result = static_cast<int>(eng.send_reliable(dgram::make_bye(eng.next_id(), "Bob")));
    });
    std::this_thread::sleep_for(50ms);
    eng.cancel();
    t.join();

    EXPECT_EQ(result.load(), static_cast<int>(Delivery::Cancelled));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
    EXPECT_EQ(eng.send_reliable(dgram::make_bye(eng.next_id(), "Bob")), Delivery::Cancelled);
}

TEST(Reliability, AbortWaitsEndsOnlyTheCurrentWait)
{
    FakeWire            wire;
    ReliabilitySettings s;
    s.timeout     = 5000ms;
    s.max_retries = 255;
    ReliabilityEngine eng(s, kServer, wire.fn());

    std::atomic<int> result{-1};
    auto             start = std::chrono::steady_clock::now();
    std::thread      t([&] {
        result = static_cast<int>(eng.send_reliable(dgram::make_auth(eng.next_id(), "bob", "Bob", "s")));
    });
    std::this_thread::sleep_for(50ms);
    eng.abort_waits();
    t.join();

    EXPECT_EQ(result.load(), static_cast<int>(Delivery::Cancelled));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(wire.count_type(dgram::T_AUTH), 1u);
    EXPECT_EQ(eng.pending(), 0u);

    // the next frame still waits for its CONFIRM
    wire.on_send = [&](const dgram::Bytes &b, std::size_t) {
        if (b[0] == dgram::T_BYE)
            feed(eng, dgram::make_confirm(static_cast<std::uint16_t>((b[1] << 8) | b[2])));
    };
    EXPECT_EQ(eng.send_reliable(dgram::make_bye(eng.next_id(), "Bob")), Delivery::Confirmed);
}

TEST(Reliability, IdentifiersWrapAround)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    for (int i = 0; i < 65535; ++i)
        eng.next_id();
    EXPECT_EQ(eng.next_id(), 65535);
    EXPECT_EQ(eng.next_id(), 0);
    EXPECT_EQ(eng.next_id(), 1);
}

TEST(Reliability, WaitIdleReturnsOnceNothingPending)
{
    FakeWire          wire;
    ReliabilityEngine eng(fast(), kServer, wire.fn());
    EXPECT_TRUE(eng.wait_idle(10ms));
}
