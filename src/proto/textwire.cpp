#include <cctype>
#include <string>

#include "proto/textwire.hpp"
#include "proto/validate.hpp"
#include "util/log.hpp"

namespace textwire
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Split off the next space-delimited token; rest keeps what follows the space.
bool next_token(std::string_view &rest, std::string_view &tok)
{
    if (rest.empty())
        return false;
    const auto sp = rest.find(' ');
    if (sp == std::string_view::npos)
    {
        tok  = rest;
        rest = {};
    }
    else
    {
        tok  = rest.substr(0, sp);
        rest = rest.substr(sp + 1);
    }
    return !tok.empty();
}

bool expect_keyword(std::string_view &rest, std::string_view kw)
{
    std::string_view tok;
    return next_token(rest, tok) && iequals(tok, kw);
}

std::string_view strip_crlf(std::string_view line)
{
    if (line.size() >= CRLF.size() && line.substr(line.size() - CRLF.size()) == CRLF)
        line.remove_suffix(CRLF.size());
    return line;
}

bool fail(std::string *err, std::string msg)
{
    if (err)
        *err = std::move(msg);
    return false;
}

bool check_field(validate::Field f, std::string_view v, std::string *err)
{
    if (validate::check(f, v))
        return true;
    return fail(err, std::string("invalid ") + validate::field_name(f) + " (expected " +
                         validate::field_rule(f) + ")");
}

// "{dn} IS {content}" after the FROM keyword
bool parse_from_is(std::string_view rest, std::string &dn, std::string &content, std::string *err)
{
    std::string_view tok;
    if (!next_token(rest, tok))
        return fail(err, "missing display name");
    if (!check_field(validate::Field::DisplayName, tok, err))
        return false;
    dn = std::string(tok);
    if (!expect_keyword(rest, "IS"))
        return fail(err, "missing IS keyword");
    if (!check_field(validate::Field::Content, rest, err))
        return false;
    content = std::string(rest);
    return true;
}

}  // namespace

std::string encode_auth(std::string_view username,
                        std::string_view display_name,
                        std::string_view secret)
{
    std::string out;
    out.reserve(32 + username.size() + display_name.size() + secret.size());
    out.append("AUTH ").append(username);
    out.append(" AS ").append(display_name);
    out.append(" USING ").append(secret);
    out.append(CRLF);
    return out;
}

std::string encode_join(std::string_view channel, std::string_view display_name)
{
    std::string out = "JOIN ";
    out.append(channel).append(" AS ").append(display_name).append(CRLF);
    return out;
}

std::string encode_msg(std::string_view display_name, std::string_view content)
{
    std::string out;
    out.reserve(16 + display_name.size() + content.size());
    out.append("MSG FROM ").append(display_name).append(" IS ").append(content).append(CRLF);
    return out;
}

std::string encode_bye(std::string_view display_name)
{
    std::string out = "BYE FROM ";
    out.append(display_name).append(CRLF);
    return out;
}

std::string encode_err(std::string_view display_name, std::string_view content)
{
    std::string out;
    out.reserve(16 + display_name.size() + content.size());
    out.append("ERROR FROM ").append(display_name).append(" IS ").append(content).append(CRLF);
    return out;
}

std::string encode_reply(bool ok, std::string_view content)
{
    std::string out = ok ? "REPLY OK IS " : "REPLY NOK IS ";
    out.append(content).append(CRLF);
    return out;
}

std::optional<proto::Message> decode(std::string_view line, std::string *err)
{
    std::string_view rest = strip_crlf(line);
    std::string_view kw;
    if (!next_token(rest, kw))
    {
        fail(err, "empty frame");
        return std::nullopt;
    }

    proto::Message m;
    if (iequals(kw, "REPLY"))
    {
        std::string_view res;
        if (!next_token(rest, res) || !(iequals(res, "OK") || iequals(res, "NOK")))
        {
            fail(err, "REPLY without OK/NOK");
            return std::nullopt;
        }
        if (!expect_keyword(rest, "IS"))
        {
            fail(err, "REPLY missing IS keyword");
            return std::nullopt;
        }
        if (!check_field(validate::Field::Content, rest, err))
            return std::nullopt;
        m.kind    = proto::Kind::Reply;
        m.ok      = iequals(res, "OK");
        m.content = std::string(rest);
    }
    else if (iequals(kw, "MSG") || iequals(kw, "ERR") || iequals(kw, "ERROR"))
    {
        if (!expect_keyword(rest, "FROM"))
        {
            fail(err, std::string(kw) + " missing FROM keyword");
            return std::nullopt;
        }
        std::string dn;
        if (!parse_from_is(rest, dn, m.content, err))
            return std::nullopt;
        m.kind   = iequals(kw, "MSG") ? proto::Kind::Chat : proto::Kind::Error;
        m.sender = std::move(dn);
    }
    else if (iequals(kw, "BYE"))
    {
        std::string_view dn;
        if (!expect_keyword(rest, "FROM") || !next_token(rest, dn))
        {
            fail(err, "BYE missing FROM {displayName}");
            return std::nullopt;
        }
        if (!check_field(validate::Field::DisplayName, dn, err))
            return std::nullopt;
        if (!rest.empty())
        {
            fail(err, "trailing data after BYE");
            return std::nullopt;
        }
        m.kind   = proto::Kind::Farewell;
        m.sender = std::string(dn);
    }
    else
    {
        fail(err, "unknown message type '" + std::string(kw) + "'");
        return std::nullopt;
    }

    LOG_DEBUG("decoded %s sender=%s", proto::kind_name(m.kind),
              m.sender ? m.sender->c_str() : "-");
    return m;
}

std::optional<Request> parse_request(std::string_view line, std::string *err)
{
    std::string_view rest = strip_crlf(line);
    std::string_view kw, a, b;
    Request          r;

    if (!next_token(rest, kw))
    {
        fail(err, "empty frame");
        return std::nullopt;
    }

    if (iequals(kw, "AUTH"))
    {
        // AUTH u AS dn USING secret
        std::string_view secret;
        if (!next_token(rest, a) || !expect_keyword(rest, "AS") || !next_token(rest, b) ||
            !expect_keyword(rest, "USING") || !next_token(rest, secret) || !rest.empty())
        {
            fail(err, "malformed AUTH");
            return std::nullopt;
        }
        if (!check_field(validate::Field::Username, a, err) ||
            !check_field(validate::Field::DisplayName, b, err) ||
            !check_field(validate::Field::Secret, secret, err))
            return std::nullopt;
        r.kind   = RequestKind::Auth;
        r.fields = {std::string(a), std::string(b), std::string(secret)};
    }
    else if (iequals(kw, "JOIN"))
    {
        if (!next_token(rest, a) || !expect_keyword(rest, "AS") || !next_token(rest, b) ||
            !rest.empty())
        {
            fail(err, "malformed JOIN");
            return std::nullopt;
        }
        if (!check_field(validate::Field::Channel, a, err) ||
            !check_field(validate::Field::DisplayName, b, err))
            return std::nullopt;
        r.kind   = RequestKind::Join;
        r.fields = {std::string(a), std::string(b)};
    }
    else if (iequals(kw, "MSG") || iequals(kw, "ERR") || iequals(kw, "ERROR"))
    {
        std::string dn, content;
        if (!expect_keyword(rest, "FROM"))
        {
            fail(err, std::string(kw) + " missing FROM keyword");
            return std::nullopt;
        }
        if (!parse_from_is(rest, dn, content, err))
            return std::nullopt;
        r.kind   = iequals(kw, "MSG") ? RequestKind::Msg : RequestKind::Err;
        r.fields = {std::move(dn), std::move(content)};
    }
    else if (iequals(kw, "BYE"))
    {
        if (!expect_keyword(rest, "FROM") || !next_token(rest, a) || !rest.empty())
        {
            fail(err, "malformed BYE");
            return std::nullopt;
        }
        if (!check_field(validate::Field::DisplayName, a, err))
            return std::nullopt;
        r.kind   = RequestKind::Bye;
        r.fields = {std::string(a)};
    }
    else
    {
        fail(err, "unknown request type '" + std::string(kw) + "'");
        return std::nullopt;
    }
    return r;
}

}  // namespace textwire
