#include "sustainbot/help/general_help_cache.h"

#include "sustainbot/core/logging.h"

namespace sustainbot::help {

using sustainbot::log::Level;
static constexpr const char* TAG = "help";

const std::string& GeneralHelpCache::get()
{
    std::lock_guard<std::mutex> lock(_mx);
    if (!_text) {
        _text = _formatter.build_general_help();
        SB_LOGD(TAG, "General help built (%u bytes)", static_cast<unsigned>(_text->size()));
    }
    return *_text;
}

bool GeneralHelpCache::built() const
{
    std::lock_guard<std::mutex> lock(_mx);
    return _text.has_value();
}

} // namespace sustainbot::help
