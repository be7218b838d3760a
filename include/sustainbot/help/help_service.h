#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/command/command_registry.h"
#include "sustainbot/command/suggest.h"
#include "sustainbot/help/general_help_cache.h"
#include "sustainbot/help/help_formatter.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::help {

// "help", "h", "-h", "--help", "-help", "--h"
bool is_help_flag(std::string_view token);

// True for "help <x...>" and for "<cmd> ... <help-flag>".
bool is_help_request(const std::vector<std::string_view>& tokens);

// Drops a leading "help" token and any trailing help flags.
std::vector<std::string_view> strip_help_tokens(std::vector<std::string_view> tokens);

// "Hello <@U1>! " or "Hello! "
std::string greeting(std::string_view user);

// "Sorry <@U1>, " or "Sorry, "
std::string apology(std::string_view user);

struct HelpOptions {
    std::size_t max_suggestions{command::kDefaultMaxSuggestions};
    std::size_t suggestion_distance{command::kDefaultSuggestionDistance};
    bool        lowercase_targets{true};
};

// Answers help requests: the general list, one command's detailed help, or
// suggestions when the target is unknown.
class HelpService {
public:
    HelpService(const command::CommandRegistry& registry,
                const HelpFormatter& formatter,
                GeneralHelpCache& cache,
                HelpOptions opts = {});

    // `tokens` is the command line after addressing, e.g. {"help", "list-aws-vms"}
    // or {"list-aws-vms", "--help"}.
    void handle(const std::vector<std::string_view>& tokens,
                std::string_view user,
                const command::OutputFn& say) const;

private:
    std::string respond(const std::vector<std::string_view>& tokens, std::string_view user) const;

    const command::CommandRegistry& _registry;
    const HelpFormatter& _formatter;
    GeneralHelpCache& _cache;
    HelpOptions _opts;
};

} // namespace sustainbot::help
