#pragma once

#include "sustainbot/command/command_meta.h"
#include "sustainbot/command/command_registry.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace sustainbot::help {

// Options lists longer than this are cut and end with ", ...".
inline constexpr std::size_t kMaxRenderedChoices = 10;

// Renders registry metadata as chat-formatted (Slack mrkdwn) help text.
class HelpFormatter {
public:
    explicit HelpFormatter(const command::CommandRegistry& registry)
        : _registry(registry)
    {}

    // Unknown names yield "Command '<name>' not found." rather than an error.
    //   detailed=false: "`name` - description"
    //   detailed=true : title, description, Usage, Arguments, Examples, Aliases
    std::string format_command_help(std::string_view name, bool detailed) const;

    // Builds the full command list (uncached; see GeneralHelpCache).
    std::string build_general_help() const;

    // "name --a=<a> [--b=<b>]"
    static std::string detailed_usage(std::string_view key, const command::CommandMeta& meta);

    // "name <a> [b]"
    static std::string compact_usage(std::string_view key, const command::CommandMeta& meta);

    static std::string render_detailed(std::string_view key, const command::CommandMeta& meta);

private:
    const command::CommandRegistry& _registry;
};

} // namespace sustainbot::help
