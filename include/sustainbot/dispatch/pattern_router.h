#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/dispatch/message_dispatcher.h"
#include "sustainbot/help/help_service.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::dispatch {

enum class PatternKind : std::uint8_t {
    Exact,      // first token (after addressing) equals the pattern
    Prefix,     // addressed text starts with the pattern
    Substring,  // addressed text contains the pattern
};

// All comparisons are case-insensitive.
struct PatternRule {
    PatternKind kind{PatternKind::Exact};
    std::string pattern;

    bool matches(std::string_view text, std::string_view first_token) const;
};

/**
 * Ordered (rule, handler) table; the first matching rule wins.
 *
 * Order is precedence: put specific rules (exact, long prefixes) before
 * general ones (substrings), otherwise the general rule shadows them.
 * The handler receives the tokens after the first one as its parameters; a
 * handler that throws gets the same apology as in registry mode.
 */
class PatternRouter {
public:
    explicit PatternRouter(std::string default_region = "us-east-1")
        : _default_region(std::move(default_region))
    {}

    void add(PatternRule rule, command::CommandHandler handler);

    // Exact "help" rule answered by `service` with every token after "help".
    // Add it first so "help hello" is not taken by a "hello" substring rule.
    // `service` must outlive the router.
    void add_help_route(const help::HelpService& service);

    // Returns true if a rule matched (the handler ran). On no match, or empty
    // text, sends the "couldn't understand" reply and returns false.
    bool route(const InboundMessage& msg, const command::OutputFn& say) const;

    std::size_t size() const noexcept { return _routes.size(); }

private:
    struct Route {
        PatternRule rule;
        command::CommandHandler handler;
    };

    std::string _default_region;
    std::vector<Route> _routes;
};

} // namespace sustainbot::dispatch
