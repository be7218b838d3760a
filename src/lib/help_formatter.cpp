#include "sustainbot/help/help_formatter.h"

#include "sustainbot/command/dynamic_value.h"
#include "sustainbot/command/suggest.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace sustainbot::help {

using command::ArgumentSpec;
using command::CommandMeta;

namespace {

static std::string rtrim(std::string s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

static std::string render_choices(const ArgumentSpec& arg)
{
    auto resolved = command::try_resolve(*arg.choices);
    if (!resolved) {
        std::string out = " (Options: ";
        out.append(command::kResolveErrorText);
        out.push_back(')');
        return out;
    }

    const auto& list = *resolved;
    if (list.empty()) {
        return {};
    }

    std::string out = " (Options: ";
    const std::size_t shown = std::min(list.size(), kMaxRenderedChoices);
    for (std::size_t i = 0; i < shown; ++i) {
        if (i != 0) out.append(", ");
        out.append(list[i]);
    }
    if (list.size() > kMaxRenderedChoices) {
        out.append(", ...");
    }
    out.push_back(')');
    return out;
}

static std::string render_argument(const ArgumentSpec& arg)
{
    std::string line = "  `--";
    line.append(arg.name);
    line.push_back('`');
    if (arg.required) {
        line.append(" *(required)*");
    }
    line.append(" - ");
    if (arg.description.empty()) {
        line.append(command::kNoArgumentDescription);
    } else {
        line.append(arg.description);
    }

    if (arg.choices) {
        line.append(render_choices(arg));
    }

    if (arg.default_value) {
        line.append(" (Default: ");
        line.append(command::resolve(*arg.default_value));
        line.push_back(')');
    }
    return line;
}

} // namespace

std::string HelpFormatter::detailed_usage(std::string_view key, const CommandMeta& meta)
{
    std::string out(key);
    for (const auto& a : meta.arguments) {
        out.push_back(' ');
        if (a.required) {
            out.append("--" + a.name + "=<" + a.name + ">");
        } else {
            out.append("[--" + a.name + "=<" + a.name + ">]");
        }
    }
    return out;
}

std::string HelpFormatter::compact_usage(std::string_view key, const CommandMeta& meta)
{
    std::string out(key);
    for (const auto& a : meta.arguments) {
        out.push_back(' ');
        if (a.required) {
            out.append("<" + a.name + ">");
        } else {
            out.append("[" + a.name + "]");
        }
    }
    return out;
}

std::string HelpFormatter::render_detailed(std::string_view key, const CommandMeta& meta)
{
    std::vector<std::string> lines;
    lines.push_back("*" + std::string(key) + "*");
    lines.push_back("_" + meta.description + "_");
    lines.emplace_back();

    if (!meta.arguments.empty()) {
        lines.push_back("*Usage:* `" + detailed_usage(key, meta) + "`");
        lines.emplace_back();

        lines.emplace_back("*Arguments:*");
        for (const auto& a : meta.arguments) {
            lines.push_back(render_argument(a));
        }
        lines.emplace_back();
    }

    if (!meta.examples.empty()) {
        lines.emplace_back("*Examples:*");
        for (const auto& ex : meta.examples) {
            lines.push_back("  `" + ex + "`");
        }
        lines.emplace_back();
    }

    if (!meta.aliases.empty()) {
        lines.push_back("*Aliases:* " + command::join(meta.aliases));
        lines.emplace_back();
    }

    return rtrim(command::join(lines, "\n"));
}

std::string HelpFormatter::format_command_help(std::string_view name, bool detailed) const
{
    auto hit = _registry.lookup(name);
    if (!hit || !hit->meta) {
        return "Command '" + std::string(name) + "' not found.";
    }

    if (!detailed) {
        return "`" + std::string(name) + "` - " + hit->meta->description;
    }
    return render_detailed(name, *hit->meta);
}

std::string HelpFormatter::build_general_help() const
{
    std::vector<std::string> lines;
    lines.emplace_back("*Available Commands:*");

    // std::map keeps these sorted by dispatch key.
    for (const auto& [key, meta] : _registry.unique_commands()) {
        lines.push_back("`" + compact_usage(key, *meta) + "` - " + meta->description);
    }

    lines.emplace_back();
    lines.emplace_back("For detailed help on any command, use: `help <command-name>` or `<command-name> --help`");
    lines.emplace_back();
    lines.emplace_back("Example: `help list-aws-vms` or `list-aws-vms --help`");

    return command::join(lines, "\n");
}

} // namespace sustainbot::help
