#pragma once
#include <optional>
#include <string>

namespace proto
{

enum class Kind
{
    Chat,
    Reply,
    Error,
    Farewell
};

// What both codecs decode into. Nothing downstream knows which transport produced it.
struct Message
{
    Kind                       kind = Kind::Chat;
    std::string                content;
    std::optional<std::string> sender;
    bool                       ok = false;  // Reply only: OK vs NOK

    bool operator==(const Message &o) const
    {
        return kind == o.kind && content == o.content && sender == o.sender && ok == o.ok;
    }
    bool operator!=(const Message &o) const { return !(*this == o); }
};

inline const char *kind_name(Kind k)
{
    switch (k)
    {
        case Kind::Chat:
            return "MSG";
        case Kind::Reply:
            return "REPLY";
        case Kind::Error:
            return "ERR";
        case Kind::Farewell:
            return "BYE";
    }
    return "?";
}

}  // namespace proto
