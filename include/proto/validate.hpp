#pragma once
#include <string>
#include <string_view>

namespace validate
{

enum class Field
{
    Username,
    Channel,
    Secret,
    DisplayName,
    Content
};

// Character class and length rules per field, see constants.hpp for limits.
bool is_username(std::string_view s);
bool is_channel(std::string_view s);
bool is_secret(std::string_view s);
bool is_display_name(std::string_view s);
bool is_content(std::string_view s);

bool check(Field f, std::string_view s);

// Coerce arbitrary text into valid message content: bytes outside the class
// become '?', the result is cut to the length limit, empty input yields "?".
std::string to_content(std::string_view s);

// "display name", "channel", ...
const char *field_name(Field f);

// One-line description of the rule, for user-facing and ERR frame text.
const char *field_rule(Field f);

}  // namespace validate
