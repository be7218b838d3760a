#pragma once

#include "sustainbot/help/help_formatter.h"

#include <mutex>
#include <optional>
#include <string>

namespace sustainbot::help {

/**
 * Lazily built, never invalidated rendering of the full command list.
 *
 * The first get() renders whatever the registry holds at that moment; later
 * calls return the same string even if commands were registered since, so
 * build it only after startup registration has finished.
 */
class GeneralHelpCache {
public:
    explicit GeneralHelpCache(const HelpFormatter& formatter)
        : _formatter(formatter)
    {}

    const std::string& get();

    bool built() const;

private:
    const HelpFormatter& _formatter;

    mutable std::mutex _mx;
    std::optional<std::string> _text;
};

} // namespace sustainbot::help
