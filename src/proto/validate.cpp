#include "proto/validate.hpp"

#include "util/constants.hpp"

namespace validate
{

namespace
{

bool is_id_char(unsigned char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

template <typename Pred>
bool all_of_len(std::string_view s, std::size_t max_len, Pred ok)
{
    if (s.empty() || s.size() > max_len)
        return false;
    for (unsigned char c : s)
    {
        if (!ok(c))
            return false;
    }
    return true;
}

}  // namespace

bool is_username(std::string_view s)
{
    return all_of_len(s, constants::MAX_USERNAME, is_id_char);
}

bool is_channel(std::string_view s)
{
    return all_of_len(s, constants::MAX_CHANNEL,
                      [](unsigned char c) { return is_id_char(c) || c == '.'; });
}

bool is_secret(std::string_view s)
{
    return all_of_len(s, constants::MAX_SECRET, is_id_char);
}

bool is_display_name(std::string_view s)
{
    return all_of_len(s, constants::MAX_DISPLAY_NAME,
                      [](unsigned char c) { return c >= 0x21 && c <= 0x7E; });
}

bool is_content(std::string_view s)
{
    return all_of_len(s, constants::MAX_CONTENT,
                      [](unsigned char c) { return c == 0x0A || (c >= 0x20 && c <= 0x7E); });
}

std::string to_content(std::string_view s)
{
    if (s.empty())
        return "?";
    s = s.substr(0, constants::MAX_CONTENT);
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(c == 0x0A || (c >= 0x20 && c <= 0x7E) ? static_cast<char>(c) : '?');
    return out;
}

bool check(Field f, std::string_view s)
{
    switch (f)
    {
        case Field::Username:
            return is_username(s);
        case Field::Channel:
            return is_channel(s);
        case Field::Secret:
            return is_secret(s);
        case Field::DisplayName:
            return is_display_name(s);
        case Field::Content:
            return is_content(s);
    }
    return false;
}

const char *field_name(Field f)
{
    switch (f)
    {
        case Field::Username:
            return "username";
        case Field::Channel:
            return "channel";
        case Field::Secret:
            return "secret";
        case Field::DisplayName:
            return "display name";
        case Field::Content:
            return "message content";
    }
    return "field";
}

const char *field_rule(Field f)
{
    switch (f)
    {
        case Field::Username:
            return "1-20 characters of [A-Za-z0-9_-]";
        case Field::Channel:
            return "1-20 characters of [A-Za-z0-9_.-]";
        case Field::Secret:
            return "1-128 characters of [A-Za-z0-9_-]";
        case Field::DisplayName:
            return "1-20 printable characters without spaces";
        case Field::Content:
            return "1-60000 printable characters or newlines";
    }
    return "";
}

}  // namespace validate
