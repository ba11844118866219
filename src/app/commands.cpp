#include <functional>
#include <iterator>
#include <unordered_map>

#include "app/commands.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

std::vector<std::string> split_ws(std::string_view s)
{
    std::vector<std::string> out;
    std::size_t              i = 0;
    while (i < s.size())
    {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
            ++i;
        std::size_t j = i;
        while (j < s.size() && s[j] != ' ' && s[j] != '\t')
            ++j;
        if (j > i)
            out.emplace_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

bool usage(ChatSession &session, const char *form)
{
    session.report(Output::LocalError, std::string("ERROR: usage: ") + form);
    return false;
}

}  // namespace

const char *help_text()
{
    return "Commands:\n"
           "  /auth <username> <secret> <displayName>\n"
           "  /join <channel>\n"
           "  /rename <displayName>\n"
           "  /help\n"
           "Any other line is sent to the current channel.";
}

Command parse_command(std::string_view line)
{
    Command c;
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    if (line.empty() || line.front() != '/')
    {
        c.text = std::string(line);
        return c;
    }
    auto words = split_ws(line.substr(1));
    if (words.empty())
    {
        c.name = "/";
        return c;
    }
    c.name = std::move(words.front());
    c.args.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));
    return c;
}

bool execute(std::string_view line, ChatSession &session)
{
    Command c = parse_command(line);
    if (c.name.empty())
    {
        if (c.text.empty())
            return true;  // blank line
        return session.send_chat(c.text);
    }

    const auto &args = c.args;

    std::unordered_map<std::string, std::function<bool()>> cmd_map = {
        {"auth",
         [&]() -> bool {
             if (args.size() != 3)
                 return usage(session, "/auth <username> <secret> <displayName>");
             return session.authenticate(args[0], args[1], args[2]);
         }},
        {"join",
         [&]() -> bool {
             if (args.size() != 1)
                 return usage(session, "/join <channel>");
             return session.join(args[0]);
         }},
        {"rename",
         [&]() -> bool {
             if (args.size() != 1)
                 return usage(session, "/rename <displayName>");
             return session.rename(args[0]);
         }},
        {"help",
         [&]() -> bool {
             session.report(Output::Info, help_text());
             return true;
         }},
    };

    auto it = cmd_map.find(c.name);
    if (it == cmd_map.end())
    {
        session.report(Output::LocalError, "ERROR: unknown command /" + c.name + ", try /help");
        return false;
    }
    LOG_DEBUG("Running command: /%s", c.name.c_str());
    return it->second();
}

}  // namespace app
