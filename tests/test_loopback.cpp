#include <gtest/gtest.h>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;

TEST(Loopback, RecordsOutboundLines)
{
    EventQueue        events;
    LoopbackTransport t;
    ASSERT_TRUE(t.start(events));

    EXPECT_TRUE(t.send_auth("bob", "Bob", "secret"));
    EXPECT_TRUE(t.send_msg("Bob", "hi"));
    auto sent = t.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0], "AUTH bob AS Bob USING secret");
    EXPECT_EQ(sent[1], "MSG FROM Bob IS hi");

    t.disconnect();
}

TEST(Loopback, SendFailsWhenNotStarted)
{
    LoopbackTransport t;
    EXPECT_FALSE(t.send_bye("Bob"));
}

TEST(Loopback, SendFailsAfterDisconnect)
{
    EventQueue        events;
    LoopbackTransport t;
    ASSERT_TRUE(t.start(events));
    t.disconnect();
    t.disconnect();
    EXPECT_FALSE(t.send_msg("Bob", "hi"));
    EXPECT_EQ(t.disconnect_calls(), 2);
}

TEST(Loopback, InjectedEventsReachTheQueue)
{
    EventQueue        events;
    LoopbackTransport t;
    ASSERT_TRUE(t.start(events));

    proto::Message m;
    m.kind    = proto::Kind::Chat;
    m.sender  = "Alice";
    m.content = "hi";
    t.inject(m);
    t.inject(Event::of(Event::Type::Fault, "gone"));

    auto first = events.take_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, Event::Type::Message);
    EXPECT_EQ(first->msg, m);

    auto second = events.take_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->type, Event::Type::Fault);
    EXPECT_EQ(second->detail, "gone");
}
