#pragma once

#include "sustainbot/command/command_params.h"

#include <functional>
#include <string>
#include <string_view>

namespace sustainbot::command {

// Emits one textual response to whoever sent the message.
using OutputFn = std::function<void(std::string_view)>;

// Everything a handler gets for one invocation.
struct CommandContext {
    OutputFn      say;
    std::string   user;      // requesting user id, may be empty
    std::string   region;    // --region=... or the configured default
    std::string   command;   // dispatch key that matched
    CommandParams params;
};

// Handlers report success and failure exclusively through ctx.say and are
// expected to catch their own external-call failures.
using CommandHandler = std::function<void(const CommandContext& ctx)>;

} // namespace sustainbot::command
