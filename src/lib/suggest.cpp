#include "sustainbot/command/suggest.h"

#include <algorithm>
#include <cctype>

namespace sustainbot::command {

std::string to_lower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::size_t levenshtein_distance(std::string_view a, std::string_view b)
{
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

std::vector<std::string> suggest_commands(std::string_view attempt,
                                          const std::vector<std::string>& keys,
                                          std::size_t max_results,
                                          std::size_t max_distance)
{
    struct Scored {
        std::string value;
        std::size_t score;
    };

    std::vector<std::string> out;
    if (attempt.empty() || max_results == 0) {
        return out;
    }

    const std::string needle = to_lower(attempt);

    std::vector<Scored> scored;
    scored.reserve(keys.size());
    for (const auto& k : keys) {
        const std::string key = to_lower(k);
        if (key.find(needle) != std::string::npos) {
            scored.push_back({k, 0});
            continue;
        }
        const std::size_t d = levenshtein_distance(needle, key);
        if (d <= max_distance) {
            scored.push_back({k, d});
        }
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.value < b.value;
    });

    for (const auto& s : scored) {
        if (out.size() >= max_results) break;
        out.push_back(s.value);
    }
    return out;
}

std::string join(const std::vector<std::string>& items, std::string_view sep)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out.append(sep);
        out.append(items[i]);
    }
    return out;
}

} // namespace sustainbot::command
