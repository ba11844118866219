#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/message.hpp"

/*
Datagram framing:

  [1B type][2B id, network order][field 0x00][field 0x00]...

  REPLY:  [0x01][id][1B result][2B ref id][content 0x00]
  CONFIRM and PING carry the header only.

TX: make_*(id, fields) -> bytes -> ReliabilityEngine::send_reliable
RX: bytes -> parse() -> Frame -> to_message() -> textwire::decode(render_text(Frame))
*/

namespace dgram
{

using Bytes = std::vector<std::uint8_t>;

// --- Frame types ---
inline constexpr std::uint8_t T_CONFIRM = 0x00;
inline constexpr std::uint8_t T_REPLY   = 0x01;
inline constexpr std::uint8_t T_AUTH    = 0x02;
inline constexpr std::uint8_t T_JOIN    = 0x03;
inline constexpr std::uint8_t T_MSG     = 0x04;
inline constexpr std::uint8_t T_PING    = 0xFD;
inline constexpr std::uint8_t T_ERR     = 0xFE;
inline constexpr std::uint8_t T_BYE     = 0xFF;

inline constexpr std::size_t HDR_SIZE       = 3;
inline constexpr std::size_t REPLY_HDR_SIZE = HDR_SIZE + 1 + 2;  // + result + ref id
inline constexpr std::size_t MIN_REPLY_SIZE = REPLY_HDR_SIZE + 1;

inline constexpr std::uint8_t RESULT_NOK = 0;
inline constexpr std::uint8_t RESULT_OK  = 1;

struct Header
{
    std::uint8_t  type{T_CONFIRM};
    std::uint16_t id{0};
};

struct Frame
{
    Header                   hdr;
    std::uint8_t             result{RESULT_NOK};  // REPLY only
    std::uint16_t            ref_id{0};           // REPLY only
    std::vector<std::string> fields;
};

bool        is_known_type(std::uint8_t type);
const char *type_name(std::uint8_t type);
// number of null-terminated text fields the type carries
std::size_t field_count(std::uint8_t type);

// TX
Bytes make_confirm(std::uint16_t ref_id);
Bytes make_ping(std::uint16_t id);
Bytes make_auth(std::uint16_t    id,
                std::string_view username,
                std::string_view display_name,
                std::string_view secret);
Bytes make_join(std::uint16_t id, std::string_view channel, std::string_view display_name);
Bytes make_msg(std::uint16_t id, std::string_view display_name, std::string_view content);
Bytes make_bye(std::uint16_t id, std::string_view display_name);
Bytes make_err(std::uint16_t id, std::string_view display_name, std::string_view content);
Bytes make_reply(std::uint16_t id, bool ok, std::uint16_t ref_id, std::string_view content);
Bytes serialize(const Frame &f);  // empty on field count mismatch
void  pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);

// RX
bool                 unpack_header(const std::uint8_t *in, std::size_t len, Header &out);
std::optional<Frame> parse(const std::uint8_t *buf, std::size_t len, std::string *err = nullptr);
std::optional<Frame> parse(const Bytes &frame, std::string *err = nullptr);

// REPLY/ERR/MSG/BYE in the stream codec's text form; nullopt for other types
std::optional<std::string> render_text(const Frame &f);

// render_text + textwire::decode; nullopt (reason in *err) if the frame is not
// a user-visible kind or its fields fail validation
std::optional<proto::Message> to_message(const Frame &f, std::string *err = nullptr);

}  // namespace dgram
