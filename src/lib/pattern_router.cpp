#include "sustainbot/dispatch/pattern_router.h"

#include "sustainbot/command/suggest.h"
#include "sustainbot/core/logging.h"
#include "sustainbot/dispatch/message_parse.h"

namespace sustainbot::dispatch {

using sustainbot::log::Level;
static constexpr const char* TAG = "router";

bool PatternRule::matches(std::string_view text, std::string_view first_token) const
{
    const std::string needle = command::to_lower(pattern);
    if (needle.empty()) {
        return false;
    }

    switch (kind) {
    case PatternKind::Exact:
        return command::to_lower(first_token) == needle;
    case PatternKind::Prefix:
        return command::to_lower(text).rfind(needle, 0) == 0;
    case PatternKind::Substring:
        return command::to_lower(text).find(needle) != std::string::npos;
    }
    return false;
}

void PatternRouter::add(PatternRule rule, command::CommandHandler handler)
{
    _routes.push_back(Route{std::move(rule), std::move(handler)});
}

void PatternRouter::add_help_route(const help::HelpService& service)
{
    add(PatternRule{PatternKind::Exact, "help"}, [&service](const command::CommandContext& ctx) {
        std::vector<std::string_view> tokens{"help"};
        for (const auto& t : ctx.params.tokens()) {
            tokens.push_back(t);
        }
        service.handle(tokens, ctx.user, ctx.say);
    });
}

bool PatternRouter::route(const InboundMessage& msg, const command::OutputFn& say) const
{
    const auto tokens = strip_mention(split_ws(msg.text));
    if (tokens.empty()) {
        say(not_understood_reply(msg.user));
        return false;
    }

    // Re-join so prefix/substring rules see single-spaced, unaddressed text.
    std::string text;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i != 0) text.push_back(' ');
        text.append(tokens[i]);
    }

    for (const auto& r : _routes) {
        if (!r.rule.matches(text, tokens.front())) {
            continue;
        }

        SB_LOGD(TAG, "'%s' matched pattern '%s'", text.c_str(), r.rule.pattern.c_str());

        command::CommandContext ctx;
        ctx.say     = say;
        ctx.user    = msg.user;
        ctx.command = r.rule.pattern;
        ctx.params  = command::CommandParams::parse(
            std::vector<std::string_view>(tokens.begin() + 1, tokens.end()));
        ctx.region  = ctx.params.get_or("region", _default_region);

        (void)invoke_handler(r.handler, ctx);
        return true;
    }

    say(not_understood_reply(msg.user));
    return false;
}

} // namespace sustainbot::dispatch
