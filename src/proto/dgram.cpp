#include <arpa/inet.h>  // htons, ntohs
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include "proto/dgram.hpp"
#include "proto/textwire.hpp"
#include "util/log.hpp"

namespace dgram
{

namespace
{

bool fail(std::string *err, std::string msg)
{
    if (err)
        *err = std::move(msg);
    return false;
}

void append_field(Bytes &out, std::string_view s)
{
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0x00);
}

Bytes with_header(std::uint8_t type, std::uint16_t id, std::size_t reserve)
{
    Bytes out(HDR_SIZE);
    pack_header(Header{type, id}, out.data());
    out.reserve(HDR_SIZE + reserve);
    return out;
}

}  // namespace

bool is_known_type(std::uint8_t type)
{
    switch (type)
    {
        case T_CONFIRM:
        case T_REPLY:
        case T_AUTH:
        case T_JOIN:
        case T_MSG:
        case T_PING:
        case T_ERR:
        case T_BYE:
            return true;
        default:
            return false;
    }
}

const char *type_name(std::uint8_t type)
{
    switch (type)
    {
        case T_CONFIRM:
            return "CONFIRM";
        case T_REPLY:
            return "REPLY";
        case T_AUTH:
            return "AUTH";
        case T_JOIN:
            return "JOIN";
        case T_MSG:
            return "MSG";
        case T_PING:
            return "PING";
        case T_ERR:
            return "ERR";
        case T_BYE:
            return "BYE";
        default:
            return "UNKNOWN";
    }
}

std::size_t field_count(std::uint8_t type)
{
    switch (type)
    {
        case T_AUTH:
            return 3;
        case T_JOIN:
        case T_MSG:
        case T_ERR:
            return 2;
        case T_REPLY:
        case T_BYE:
            return 1;
        default:
            return 0;
    }
}

void pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    out[0] = in.type;
    std::uint16_t id_be = htons(in.id);
    std::memcpy(out + 1, &id_be, sizeof id_be);
}

bool unpack_header(const std::uint8_t *in, std::size_t len, Header &out)
{
    if (!in || len < HDR_SIZE)
        return false;
    out.type = in[0];
    std::uint16_t id_be;
    std::memcpy(&id_be, in + 1, sizeof id_be);
    out.id = ntohs(id_be);
    return true;
}

Bytes make_confirm(std::uint16_t ref_id)
{
    return with_header(T_CONFIRM, ref_id, 0);
}

Bytes make_ping(std::uint16_t id)
{
    return with_header(T_PING, id, 0);
}

Bytes make_auth(std::uint16_t    id,
                std::string_view username,
                std::string_view display_name,
                std::string_view secret)
{
    Bytes out = with_header(T_AUTH, id, username.size() + display_name.size() + secret.size() + 3);
    append_field(out, username);
    append_field(out, display_name);
    append_field(out, secret);
    return out;
}

Bytes make_join(std::uint16_t id, std::string_view channel, std::string_view display_name)
{
    Bytes out = with_header(T_JOIN, id, channel.size() + display_name.size() + 2);
    append_field(out, channel);
    append_field(out, display_name);
    return out;
}

Bytes make_msg(std::uint16_t id, std::string_view display_name, std::string_view content)
{
    Bytes out = with_header(T_MSG, id, display_name.size() + content.size() + 2);
    append_field(out, display_name);
    append_field(out, content);
    return out;
}

Bytes make_bye(std::uint16_t id, std::string_view display_name)
{
    Bytes out = with_header(T_BYE, id, display_name.size() + 1);
    append_field(out, display_name);
    return out;
}

Bytes make_err(std::uint16_t id, std::string_view display_name, std::string_view content)
{
    Bytes out = with_header(T_ERR, id, display_name.size() + content.size() + 2);
    append_field(out, display_name);
    append_field(out, content);
    return out;
}

Bytes make_reply(std::uint16_t id, bool ok, std::uint16_t ref_id, std::string_view content)
{
    Bytes out = with_header(T_REPLY, id, 3 + content.size() + 1);
    out.push_back(ok ? RESULT_OK : RESULT_NOK);
    std::uint16_t ref_be = htons(ref_id);
    std::uint8_t  ref_bytes[2];
    std::memcpy(ref_bytes, &ref_be, sizeof ref_be);
    out.push_back(ref_bytes[0]);
    out.push_back(ref_bytes[1]);
    append_field(out, content);
    return out;
}

Bytes serialize(const Frame &f)
{
    if (!is_known_type(f.hdr.type) || f.fields.size() != field_count(f.hdr.type))
    {
        LOG_ERROR("serialize: %s expects %zu fields, got %zu", type_name(f.hdr.type),
                  field_count(f.hdr.type), f.fields.size());
        return {};
    }
    if (f.hdr.type == T_REPLY)
        return make_reply(f.hdr.id, f.result == RESULT_OK, f.ref_id, f.fields[0]);

    Bytes out = with_header(f.hdr.type, f.hdr.id, 0);
    for (const auto &s : f.fields)
        append_field(out, s);
    return out;
}

std::optional<Frame> parse(const std::uint8_t *buf, std::size_t len, std::string *err)
{
    Frame f;
    if (!unpack_header(buf, len, f.hdr))
    {
        fail(err, "datagram too short (" + std::to_string(len) + " bytes)");
        return std::nullopt;
    }
    if (!is_known_type(f.hdr.type))
    {
        char hex[8];
        std::snprintf(hex, sizeof hex, "0x%02X", (unsigned)f.hdr.type);
        fail(err, std::string("unknown datagram type ") + hex);
        return std::nullopt;
    }

    std::size_t off = HDR_SIZE;
    if (f.hdr.type == T_REPLY)
    {
        if (len < MIN_REPLY_SIZE)
        {
            fail(err, "REPLY too short (" + std::to_string(len) + " bytes)");
            return std::nullopt;
        }
        f.result = buf[HDR_SIZE];
        if (f.result != RESULT_OK && f.result != RESULT_NOK)
        {
            fail(err, "REPLY with invalid result byte " + std::to_string(f.result));
            return std::nullopt;
        }
        std::uint16_t ref_be;
        std::memcpy(&ref_be, buf + HDR_SIZE + 1, sizeof ref_be);
        f.ref_id = ntohs(ref_be);
        off      = REPLY_HDR_SIZE;
    }

    const std::size_t want = field_count(f.hdr.type);
    f.fields.reserve(want);
    for (std::size_t i = 0; i < want; ++i)
    {
        if (off >= len)
        {
            fail(err, std::string(type_name(f.hdr.type)) + " missing field " +
                          std::to_string(i + 1) + " of " + std::to_string(want));
            return std::nullopt;
        }
        const void *nul = std::memchr(buf + off, 0x00, len - off);
        if (!nul)
        {
            fail(err, std::string(type_name(f.hdr.type)) + " field " + std::to_string(i + 1) +
                          " is not null-terminated");
            return std::nullopt;
        }
        const auto end = static_cast<const std::uint8_t *>(nul) - buf;
        f.fields.emplace_back(reinterpret_cast<const char *>(buf + off),
                              static_cast<std::size_t>(end) - off);
        off = static_cast<std::size_t>(end) + 1;
    }
    if (off < len)
        LOG_DEBUG("parse: ignoring %zu trailing bytes after %s", len - off, type_name(f.hdr.type));

    return f;
}

std::optional<Frame> parse(const Bytes &frame, std::string *err)
{
    return parse(frame.data(), frame.size(), err);
}

std::optional<std::string> render_text(const Frame &f)
{
    if (f.fields.size() != field_count(f.hdr.type))
        return std::nullopt;
    switch (f.hdr.type)
    {
        case T_REPLY:
            return textwire::encode_reply(f.result == RESULT_OK, f.fields[0]);
        case T_MSG:
            return textwire::encode_msg(f.fields[0], f.fields[1]);
        case T_ERR:
            return textwire::encode_err(f.fields[0], f.fields[1]);
        case T_BYE:
            return textwire::encode_bye(f.fields[0]);
        default:
            return std::nullopt;
    }
}

std::optional<proto::Message> to_message(const Frame &f, std::string *err)
{
    auto text = render_text(f);
    if (!text)
    {
        fail(err, std::string(type_name(f.hdr.type)) + " carries no user-visible message");
        return std::nullopt;
    }
    return textwire::decode(*text, err);
}

}  // namespace dgram
