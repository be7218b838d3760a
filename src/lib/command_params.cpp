#include "sustainbot/command/command_params.h"

namespace sustainbot::command {

CommandParams CommandParams::parse(const std::vector<std::string_view>& tokens)
{
    CommandParams p;
    for (std::string_view tok : tokens) {
        p._tokens.emplace_back(tok);
        if (tok.size() > 2 && tok.substr(0, 2) == "--") {
            std::string_view body = tok.substr(2);
            const std::size_t eq = body.find('=');
            if (eq == std::string_view::npos) {
                p.set(std::string(body), "true");
            } else if (eq > 0) {
                p.set(std::string(body.substr(0, eq)), std::string(body.substr(eq + 1)));
            } else {
                // "--=x" has no key
                p._positional.emplace_back(tok);
            }
            continue;
        }
        p._positional.emplace_back(tok);
    }
    return p;
}

bool CommandParams::has(std::string_view key) const
{
    return _named.find(key) != _named.end();
}

std::string CommandParams::get(std::string_view key) const
{
    return get_or(key, {});
}

std::string CommandParams::get_or(std::string_view key, std::string_view fallback) const
{
    auto it = _named.find(key);
    if (it == _named.end()) {
        return std::string(fallback);
    }
    return it->second;
}

void CommandParams::set(std::string key, std::string value)
{
    _named[std::move(key)] = std::move(value);
}

std::vector<std::string> CommandParams::missing_required(const CommandMeta& meta) const
{
    std::vector<std::string> out;
    for (const auto& a : meta.arguments) {
        if (a.required && !has(a.name)) {
            out.push_back(a.name);
        }
    }
    return out;
}

} // namespace sustainbot::command
