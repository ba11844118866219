#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "app/chat_session.hpp"

namespace app
{

// One line of user input, split into a command word and its arguments.
struct Command
{
    std::string              name;  // "auth", "join", ...; empty for a chat line
    std::vector<std::string> args;
    std::string              text;  // the whole line for chat
};

Command parse_command(std::string_view line);

// Runs one input line against the session. Usage errors go to the session
// output as "ERROR: ..." and return false.
bool execute(std::string_view line, ChatSession &session);

const char *help_text();

}  // namespace app
