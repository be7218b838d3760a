#include "sustainbot/help/help_service.h"

#include "sustainbot/core/logging.h"

#include <exception>

namespace sustainbot::help {

using sustainbot::log::Level;
static constexpr const char* TAG = "help";

bool is_help_flag(std::string_view token)
{
    return token == "help" || token == "-help" || token == "--help"
        || token == "h" || token == "-h" || token == "--h";
}

bool is_help_request(const std::vector<std::string_view>& tokens)
{
    if (tokens.empty()) return false;
    if (tokens.front() == "help") return true;
    return tokens.size() >= 2 && is_help_flag(tokens.back());
}

std::vector<std::string_view> strip_help_tokens(std::vector<std::string_view> tokens)
{
    if (!tokens.empty() && tokens.front() == "help") {
        tokens.erase(tokens.begin());
    }
    while (!tokens.empty() && is_help_flag(tokens.back())) {
        tokens.pop_back();
    }
    return tokens;
}

std::string greeting(std::string_view user)
{
    if (user.empty()) {
        return "Hello! ";
    }
    return "Hello <@" + std::string(user) + ">! ";
}

std::string apology(std::string_view user)
{
    if (user.empty()) {
        return "Sorry, ";
    }
    return "Sorry <@" + std::string(user) + ">, ";
}

HelpService::HelpService(const command::CommandRegistry& registry,
                         const HelpFormatter& formatter,
                         GeneralHelpCache& cache,
                         HelpOptions opts)
    : _registry(registry)
    , _formatter(formatter)
    , _cache(cache)
    , _opts(opts)
{}

void HelpService::handle(const std::vector<std::string_view>& tokens,
                         std::string_view user,
                         const command::OutputFn& say) const
{
    std::string reply;
    try {
        reply = respond(tokens, user);
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "Error in help request: %s", ex.what());
        reply = apology(user);
        reply.append("I encountered an error while generating help information.");
    }
    say(reply);
}

std::string HelpService::respond(const std::vector<std::string_view>& tokens, std::string_view user) const
{
    const auto target_tokens = strip_help_tokens(tokens);

    if (target_tokens.empty()) {
        return greeting(user) + "Here's what I can help you with:\n\n" + _cache.get();
    }

    std::string target;
    for (std::size_t i = 0; i < target_tokens.size(); ++i) {
        if (i != 0) target.push_back(' ');
        target.append(target_tokens[i]);
    }
    if (_opts.lowercase_targets) {
        target = command::to_lower(target);
    }

    if (_registry.contains(target)) {
        return greeting(user) + "Here's help for `" + target + "`:\n\n"
            + _formatter.format_command_help(target, true);
    }

    const auto suggestions = command::suggest_commands(
        target, _registry.all_keys(), _opts.max_suggestions, _opts.suggestion_distance);

    if (!suggestions.empty()) {
        return greeting(user) + "Command `" + target + "` not found. Did you mean: "
            + command::join(suggestions) + "?";
    }
    return greeting(user) + "Command `" + target + "` not found. Use `help` to see all available commands.";
}

} // namespace sustainbot::help
