#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/message.hpp"

/*
Stream transport framing, one frame per CRLF-terminated line:

  AUTH {username} AS {displayName} USING {secret}
  JOIN {channel} AS {displayName}
  MSG FROM {displayName} IS {content}
  BYE FROM {displayName}
  ERROR FROM {displayName} IS {content}      (ERR FROM ... accepted inbound)
  REPLY {OK|NOK} IS {content}

Keywords are case-insensitive. The datagram codec re-renders its frames through
the encode_* functions below and calls decode(), so the two transports share
one interpretation of inbound traffic.
*/

namespace textwire
{

inline constexpr std::string_view CRLF = "\r\n";

// Outbound, each returns one line including CRLF
std::string encode_auth(std::string_view username,
                        std::string_view display_name,
                        std::string_view secret);
std::string encode_join(std::string_view channel, std::string_view display_name);
std::string encode_msg(std::string_view display_name, std::string_view content);
std::string encode_bye(std::string_view display_name);
std::string encode_err(std::string_view display_name, std::string_view content);
// server-side form, used when re-rendering datagram replies
std::string encode_reply(bool ok, std::string_view content);

// Inbound: REPLY, MSG, ERR and BYE. nullopt means malformed, reason in *err.
// A trailing CRLF is optional.
std::optional<proto::Message> decode(std::string_view line, std::string *err = nullptr);

enum class RequestKind
{
    Auth,
    Join,
    Msg,
    Bye,
    Err
};

// Client-originated frame with its fields in wire order
struct Request
{
    RequestKind              kind = RequestKind::Msg;
    std::vector<std::string> fields;
};

// Parses the outbound forms (what a server would read from us).
std::optional<Request> parse_request(std::string_view line, std::string *err = nullptr);

}  // namespace textwire
