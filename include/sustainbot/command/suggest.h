#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::command {

inline constexpr std::size_t kDefaultMaxSuggestions = 5;
inline constexpr std::size_t kDefaultSuggestionDistance = 2;

std::string to_lower(std::string_view s);

std::size_t levenshtein_distance(std::string_view a, std::string_view b);

// Keys that contain `attempt` (case-insensitive) score 0, otherwise the
// case-insensitive edit distance is the score and only keys within
// `max_distance` qualify. Ordered by score, then key; at most `max_results`.
std::vector<std::string> suggest_commands(std::string_view attempt,
                                          const std::vector<std::string>& keys,
                                          std::size_t max_results = kDefaultMaxSuggestions,
                                          std::size_t max_distance = kDefaultSuggestionDistance);

// "a, b, c"
std::string join(const std::vector<std::string>& items, std::string_view sep = ", ");

} // namespace sustainbot::command
