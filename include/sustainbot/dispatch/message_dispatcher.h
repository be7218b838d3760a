#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/command/command_registry.h"
#include "sustainbot/config/bot_config.h"
#include "sustainbot/help/help_service.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::dispatch {

struct InboundMessage {
    std::string user;   // sender id, may be empty
    std::string text;   // raw message text
};

enum class DispatchOutcome : std::uint8_t {
    Handled = 0,        // handler ran to completion
    Help,               // answered by the help service
    Suggested,          // unknown command, suggestions sent
    NotUnderstood,      // empty or unknown with nothing to suggest
    Denied,             // sender not on the allow-list
    MissingArguments,   // required --args absent; handler not run
    HandlerFailed,      // handler threw; apology sent
};

const char* to_string(DispatchOutcome o);

struct DispatcherOptions {
    bool        lowercase_commands{true};
    std::size_t max_suggestions{command::kDefaultMaxSuggestions};
    std::size_t suggestion_distance{command::kDefaultSuggestionDistance};
    std::string default_region{"us-east-1"};

    bool                     restrict_to_allowed_users{false};
    std::vector<std::string> allowed_user_ids;
    std::string              admin_contact;

    static DispatcherOptions from_config(const config::BotConfig& cfg);
};

// "Hello <@U1>! I couldn't understand your request. ..."
std::string not_understood_reply(std::string_view user);

// Runs `handler` with `ctx`. A std::exception escaping the handler is logged
// and answered with "Sorry <@user>, an error occurred while running `<ctx.command>`."
// Returns false in that case.
bool invoke_handler(const command::CommandHandler& handler, const command::CommandContext& ctx);

/**
 * Turns one chat message into at most one handler invocation.
 *
 * Addressing tokens are stripped, "help" requests go to the HelpService,
 * registry hits run the handler synchronously on the calling thread, misses
 * get suggestions. Exactly one reply is sent on every path except a
 * successful handler run, where the handler owns the output.
 */
class MessageDispatcher {
public:
    MessageDispatcher(const command::CommandRegistry& registry,
                      const help::HelpService& help,
                      DispatcherOptions opts = {});

    DispatchOutcome dispatch(const InboundMessage& msg, const command::OutputFn& say) const;

    bool is_user_allowed(std::string_view user) const;

    const DispatcherOptions& options() const noexcept { return _opts; }

private:
    DispatchOutcome run_handler(const command::RegisteredCommand& hit,
                                const std::string& key,
                                const std::vector<std::string_view>& args,
                                const InboundMessage& msg,
                                const command::OutputFn& say) const;

    const command::CommandRegistry& _registry;
    const help::HelpService& _help;
    DispatcherOptions _opts;
};

} // namespace sustainbot::dispatch
