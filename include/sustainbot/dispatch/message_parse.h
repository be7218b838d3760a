#pragma once

#include <string_view>
#include <vector>

namespace sustainbot::dispatch {

std::string_view trim_ws(std::string_view s);

// Split on ASCII whitespace, after trimming ends. Runs of separators
// never produce empty tokens.
std::vector<std::string_view> split_ws(std::string_view s);

// "<@U024BE7LH>" and friends: the chat's way of addressing the bot.
bool is_mention_token(std::string_view token);

// Drops a leading mention token when at least one more token follows it.
std::vector<std::string_view> strip_mention(std::vector<std::string_view> tokens);

} // namespace sustainbot::dispatch
