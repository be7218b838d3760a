#include "sustainbot/command/dynamic_value.h"

#include "sustainbot/core/logging.h"

namespace sustainbot::command {

using sustainbot::log::Level;
static constexpr const char* TAG = "help";

namespace detail {

void report_resolve_failure(const char* what)
{
    SB_LOGE(TAG, "Error getting dynamic value: %s", what ? what : "unknown");
}

} // namespace detail

std::string resolve(const TextValue& dv)
{
    auto v = try_resolve(dv);
    if (!v) {
        return std::string(kResolveErrorText);
    }
    return std::move(*v);
}

} // namespace sustainbot::command
