#include <gtest/gtest.h>
#include <string>

#include "proto/textwire.hpp"
#include "proto/validate.hpp"

using namespace textwire;

TEST(TextWire, EncodeAuthenticate)
{
    EXPECT_EQ(encode_auth("bob", "Bob", "secret"), "AUTH bob AS Bob USING secret\r\n");
}

TEST(TextWire, EncodeOutboundForms)
{
    EXPECT_EQ(encode_join("general", "Bob"), "JOIN general AS Bob\r\n");
    EXPECT_EQ(encode_msg("Bob", "hi there"), "MSG FROM Bob IS hi there\r\n");
    EXPECT_EQ(encode_bye("Bob"), "BYE FROM Bob\r\n");
    EXPECT_EQ(encode_err("Bob", "bad frame"), "ERROR FROM Bob IS bad frame\r\n");
    EXPECT_EQ(encode_reply(false, "nope"), "REPLY NOK IS nope\r\n");
}

TEST(TextWire, DecodeReply)
{
    auto ok = decode("REPLY OK IS Auth success\r\n");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->kind, proto::Kind::Reply);
    EXPECT_TRUE(ok->ok);
    EXPECT_EQ(ok->content, "Auth success");
    EXPECT_FALSE(ok->sender.has_value());

    auto nok = decode("REPLY NOK IS Wrong secret");
    ASSERT_TRUE(nok.has_value());
    EXPECT_FALSE(nok->ok);
    EXPECT_EQ(nok->content, "Wrong secret");
}

TEST(TextWire, DecodeChatKeepsSpacesInContent)
{
    auto m = decode("MSG FROM Alice IS hello  world, how are you?\r\n");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, proto::Kind::Chat);
    ASSERT_TRUE(m->sender.has_value());
    EXPECT_EQ(*m->sender, "Alice");
    EXPECT_EQ(m->content, "hello  world, how are you?");
}

TEST(TextWire, DecodeErrorAcceptsBothKeywords)
{
    auto a = decode("ERR FROM Server IS boom");
    auto b = decode("ERROR FROM Server IS boom");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->kind, proto::Kind::Error);
    EXPECT_EQ(*a, *b);
}

TEST(TextWire, DecodeFarewell)
{
    auto m = decode("BYE FROM Server\r\n");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, proto::Kind::Farewell);
    EXPECT_EQ(m->sender.value_or(""), "Server");
}

TEST(TextWire, KeywordsAreCaseInsensitive)
{
    auto m = decode("msg from Alice is hi");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, proto::Kind::Chat);
    EXPECT_EQ(m->content, "hi");

    auto r = decode("reply ok is fine");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->ok);
}

TEST(TextWire, UnknownLeadingTokenIsMalformed)
{
    std::string err;
    auto        m = decode("HELLO FROM Server IS hi\r\n", &err);
    EXPECT_FALSE(m.has_value());
    EXPECT_NE(err.find("unknown message type"), std::string::npos);
    EXPECT_NE(err.find("HELLO"), std::string::npos);
}

TEST(TextWire, MalformedShapes)
{
    std::string err;
    EXPECT_FALSE(decode("", &err).has_value());
    EXPECT_FALSE(decode("\r\n", &err).has_value());
    EXPECT_FALSE(decode("REPLY MAYBE IS x", &err).has_value());
    EXPECT_FALSE(decode("REPLY OK x", &err).has_value());
    EXPECT_FALSE(decode("MSG Alice IS hi", &err).has_value());
    EXPECT_FALSE(decode("MSG FROM Alice hi", &err).has_value());
    EXPECT_FALSE(decode("BYE Server", &err).has_value());
    EXPECT_FALSE(decode("BYE FROM Server extra", &err).has_value());
}

TEST(TextWire, FieldValidationFailuresAreMalformed)
{
    std::string err;
    // display name over 20 characters
    EXPECT_FALSE(decode("MSG FROM " + std::string(21, 'a') + " IS hi", &err).has_value());
    EXPECT_NE(err.find("display name"), std::string::npos);

    // control character in content
    EXPECT_FALSE(decode(std::string("MSG FROM Alice IS bad\x01"), &err).has_value());
    EXPECT_NE(err.find("message content"), std::string::npos);

    // empty content
    EXPECT_FALSE(decode("MSG FROM Alice IS ", &err).has_value());
}

TEST(TextWire, ContentLengthBoundary)
{
    const std::string max(60000, 'x');
    EXPECT_TRUE(decode("MSG FROM Alice IS " + max).has_value());
    EXPECT_FALSE(decode("MSG FROM Alice IS " + max + "x").has_value());
}

TEST(TextWire, ParseRequestRoundTripsAuthenticate)
{
    auto r = parse_request(encode_auth("bob", "Bob", "secret"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, RequestKind::Auth);
    ASSERT_EQ(r->fields.size(), 3u);
    EXPECT_EQ(r->fields[0], "bob");
    EXPECT_EQ(r->fields[1], "Bob");
    EXPECT_EQ(r->fields[2], "secret");
}

TEST(TextWire, ParseRequestRejectsBadFields)
{
    std::string err;
    EXPECT_FALSE(parse_request("AUTH bo!b AS Bob USING secret", &err).has_value());
    EXPECT_NE(err.find("username"), std::string::npos);
    EXPECT_FALSE(parse_request("JOIN gen eral AS Bob", &err).has_value());
    EXPECT_FALSE(parse_request("PING", &err).has_value());

    auto bye = parse_request("BYE FROM Bob\r\n");
    ASSERT_TRUE(bye.has_value());
    EXPECT_EQ(bye->kind, RequestKind::Bye);
}

TEST(Validate, FieldRules)
{
    EXPECT_TRUE(validate::is_username("user_name-1"));
    EXPECT_FALSE(validate::is_username("user.name"));
    EXPECT_FALSE(validate::is_username(""));
    EXPECT_TRUE(validate::is_channel("discord.general"));
    EXPECT_FALSE(validate::is_channel(std::string(21, 'c')));
    EXPECT_TRUE(validate::is_secret(std::string(128, 's')));
    EXPECT_FALSE(validate::is_secret(std::string(129, 's')));
    EXPECT_TRUE(validate::is_display_name("Bob!~"));
    EXPECT_FALSE(validate::is_display_name("Bob Smith"));
    EXPECT_TRUE(validate::is_content("line one\nline two"));
    EXPECT_FALSE(validate::is_content("tab\there"));
}

TEST(Validate, ToContentReplacesAndTruncates)
{
    EXPECT_EQ(validate::to_content("ok\nfine"), "ok\nfine");
    EXPECT_EQ(validate::to_content("tab\there\x01"), "tab?here?");
    EXPECT_EQ(validate::to_content(""), "?");
    auto long_text = validate::to_content(std::string(60001, 'x'));
    EXPECT_EQ(long_text.size(), 60000u);
    EXPECT_TRUE(validate::is_content(long_text));
}
