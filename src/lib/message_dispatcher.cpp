#include "sustainbot/dispatch/message_dispatcher.h"

#include "sustainbot/command/suggest.h"
#include "sustainbot/core/logging.h"
#include "sustainbot/dispatch/message_parse.h"

#include <algorithm>
#include <exception>

namespace sustainbot::dispatch {

using sustainbot::log::Level;
static constexpr const char* TAG = "dispatch";

const char* to_string(DispatchOutcome o)
{
    switch (o) {
    case DispatchOutcome::Handled:          return "handled";
    case DispatchOutcome::Help:             return "help";
    case DispatchOutcome::Suggested:        return "suggested";
    case DispatchOutcome::NotUnderstood:    return "not_understood";
    case DispatchOutcome::Denied:           return "denied";
    case DispatchOutcome::MissingArguments: return "missing_arguments";
    case DispatchOutcome::HandlerFailed:    return "handler_failed";
    }
    return "unknown";
}

DispatcherOptions DispatcherOptions::from_config(const config::BotConfig& cfg)
{
    DispatcherOptions o;
    o.lowercase_commands        = cfg.dispatch.lowercaseCommands;
    o.max_suggestions           = cfg.dispatch.maxSuggestions;
    o.suggestion_distance       = cfg.dispatch.suggestionDistance;
    o.default_region            = cfg.cloud.awsDefaultRegion;
    o.restrict_to_allowed_users = cfg.access.restrictToAllowedUsers;
    o.admin_contact             = cfg.bot.adminContact;
    for (const auto& [name, id] : cfg.access.allowedUsers) {
        o.allowed_user_ids.push_back(id);
    }
    return o;
}

std::string not_understood_reply(std::string_view user)
{
    return help::greeting(user)
        + "I couldn't understand your request. Please try again or type 'help' for assistance.";
}

bool invoke_handler(const command::CommandHandler& handler, const command::CommandContext& ctx)
{
    try {
        handler(ctx);
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "Handler '%s' failed: %s", ctx.command.c_str(), ex.what());
        ctx.say(help::apology(ctx.user) + "an error occurred while running `" + ctx.command + "`.");
        return false;
    }
    return true;
}

MessageDispatcher::MessageDispatcher(const command::CommandRegistry& registry,
                                     const help::HelpService& help,
                                     DispatcherOptions opts)
    : _registry(registry)
    , _help(help)
    , _opts(std::move(opts))
{}

bool MessageDispatcher::is_user_allowed(std::string_view user) const
{
    if (!_opts.restrict_to_allowed_users) {
        return true;
    }
    return std::find(_opts.allowed_user_ids.begin(), _opts.allowed_user_ids.end(), user)
        != _opts.allowed_user_ids.end();
}

DispatchOutcome MessageDispatcher::dispatch(const InboundMessage& msg, const command::OutputFn& say) const
{
    if (!is_user_allowed(msg.user)) {
        SB_LOGW(TAG, "Rejected message from unauthorized user '%s'", msg.user.c_str());
        say(help::apology(msg.user) + "you're not authorized to use this bot. Contact "
            + _opts.admin_contact + " for assistance.");
        return DispatchOutcome::Denied;
    }

    const auto tokens = strip_mention(split_ws(msg.text));
    if (tokens.empty()) {
        say(not_understood_reply(msg.user));
        return DispatchOutcome::NotUnderstood;
    }

    std::string key(tokens.front());
    if (_opts.lowercase_commands) {
        key = command::to_lower(key);
    }

    if (key == "help" || help::is_help_request(tokens)) {
        std::vector<std::string_view> help_tokens = tokens;
        if (key == "help") {
            help_tokens.front() = "help";
        }
        _help.handle(help_tokens, msg.user, say);
        return DispatchOutcome::Help;
    }

    if (auto hit = _registry.lookup(key)) {
        const std::vector<std::string_view> args(tokens.begin() + 1, tokens.end());
        return run_handler(*hit, key, args, msg, say);
    }

    const auto suggestions = command::suggest_commands(
        key, _registry.all_keys(), _opts.max_suggestions, _opts.suggestion_distance);
    if (!suggestions.empty()) {
        SB_LOGD(TAG, "Unknown command '%s'; %u suggestions",
                key.c_str(), static_cast<unsigned>(suggestions.size()));
        say(help::greeting(msg.user) + "Command `" + key + "` not found. Did you mean: "
            + command::join(suggestions) + "?");
        return DispatchOutcome::Suggested;
    }

    // Nothing close: the generic reply rather than "not found", as the bot always answered.
    SB_LOGD(TAG, "Unknown command '%s'", key.c_str());
    say(not_understood_reply(msg.user));
    return DispatchOutcome::NotUnderstood;
}

DispatchOutcome MessageDispatcher::run_handler(const command::RegisteredCommand& hit,
                                               const std::string& key,
                                               const std::vector<std::string_view>& args,
                                               const InboundMessage& msg,
                                               const command::OutputFn& say) const
{
    command::CommandContext ctx;
    ctx.say     = say;
    ctx.user    = msg.user;
    ctx.command = key;
    ctx.params  = command::CommandParams::parse(args);
    ctx.region  = ctx.params.get_or("region", _opts.default_region);

    const auto missing = ctx.params.missing_required(*hit.meta);
    if (!missing.empty()) {
        std::vector<std::string> flags;
        flags.reserve(missing.size());
        for (const auto& m : missing) flags.push_back("--" + m);
        say(help::greeting(msg.user) + "Missing required argument(s) for `" + key + "`: "
            + command::join(flags) + ". Use `" + key + " --help` for usage.");
        return DispatchOutcome::MissingArguments;
    }

    SB_LOGI(TAG, "Running '%s' for user '%s'", key.c_str(), msg.user.c_str());

    return invoke_handler(hit.handler, ctx) ? DispatchOutcome::Handled : DispatchOutcome::HandlerFailed;
}

} // namespace sustainbot::dispatch
