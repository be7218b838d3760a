#pragma once

#include "sustainbot/command/command_meta.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::command {

// Parameters of one invocation, parsed from the tokens after the command key:
// - "--key=value" -> named["key"] = "value"
// - "--flag"      -> named["flag"] = "true"
// - anything else -> positional, in order
//
// A repeated key keeps the last value.
class CommandParams {
public:
    CommandParams() = default;

    static CommandParams parse(const std::vector<std::string_view>& tokens);

    bool has(std::string_view key) const;

    // Empty string when absent.
    std::string get(std::string_view key) const;
    std::string get_or(std::string_view key, std::string_view fallback) const;

    const std::map<std::string, std::string, std::less<>>& named() const noexcept { return _named; }
    const std::vector<std::string>& positional() const noexcept { return _positional; }

    // Every token as given, in order.
    const std::vector<std::string>& tokens() const noexcept { return _tokens; }

    void set(std::string key, std::string value);

    // Required arguments of `meta` that were not supplied, in declaration order.
    std::vector<std::string> missing_required(const CommandMeta& meta) const;

private:
    std::map<std::string, std::string, std::less<>> _named;
    std::vector<std::string> _positional;
    std::vector<std::string> _tokens;
};

} // namespace sustainbot::command
