#pragma once
#include "commands/CommandRegistry.hpp"
#include "session.hpp"

namespace code_query {

// Browsing, memory and history commands bound to one session.
void register_session_commands(CommandRegistry& registry, CodeSession& session);

} // namespace code_query
