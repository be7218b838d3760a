#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/command/command_meta.h"
#include "sustainbot/command/command_registry.h"
#include "sustainbot/help/general_help_cache.h"
#include "sustainbot/help/help_formatter.h"
#include "sustainbot/help/help_service.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::tests {

inline bool contains(std::string_view hay, std::string_view needle)
{
    return hay.find(needle) != std::string_view::npos;
}

// Collects everything a handler or the dispatcher says. Safe to call from
// worker threads.
class Transcript {
public:
    command::OutputFn sink()
    {
        return [this](std::string_view s) {
            std::lock_guard<std::mutex> g(_mx);
            _lines.emplace_back(s);
        };
    }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _lines;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _lines.size();
    }

    std::string last() const
    {
        std::lock_guard<std::mutex> g(_mx);
        return _lines.empty() ? std::string() : _lines.back();
    }

    std::string all() const
    {
        std::lock_guard<std::mutex> g(_mx);
        std::string out;
        for (const auto& l : _lines) {
            out.append(l);
            out.push_back('\n');
        }
        return out;
    }

private:
    mutable std::mutex _mx;
    std::vector<std::string> _lines;
};

// Registry + formatter + cache + help service wired the way the app wires them.
struct HelpFixture {
    command::CommandRegistry registry;
    help::HelpFormatter formatter{registry};
    help::GeneralHelpCache cache{formatter};
    help::HelpService service{registry, formatter, cache};
};

inline command::CommandHandler noop_handler()
{
    return [](const command::CommandContext&) {};
}

} // namespace sustainbot::tests
