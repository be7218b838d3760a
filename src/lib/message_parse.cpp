#include "sustainbot/dispatch/message_parse.h"

#include <cctype>

namespace sustainbot::dispatch {

std::string_view trim_ws(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_ws(std::string_view s)
{
    std::vector<std::string_view> out;
    s = trim_ws(s);
    while (!s.empty()) {
        std::size_t i = 0;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        out.push_back(s.substr(0, i));
        s.remove_prefix(i);
        s = trim_ws(s);
    }
    return out;
}

bool is_mention_token(std::string_view token)
{
    return token.size() > 3 && token.substr(0, 2) == "<@" && token.back() == '>';
}

std::vector<std::string_view> strip_mention(std::vector<std::string_view> tokens)
{
    if (tokens.size() > 1 && is_mention_token(tokens.front())) {
        tokens.erase(tokens.begin());
    }
    return tokens;
}

} // namespace sustainbot::dispatch
