#include "sustainbot/bot/choice_providers.h"

#include <algorithm>
#include <stdexcept>

namespace sustainbot::bot {

std::vector<std::string> aws_instance_states()
{
    return {"pending", "running", "shutting-down", "terminated", "stopping", "stopped"};
}

std::vector<std::string> aws_instance_types()
{
    return {
        "t2.micro",
        "t2.small",
        "t2.medium",
        "t3.micro",
        "t3.small",
        "t3.medium",
    };
}

std::vector<std::string> openstack_statuses()
{
    return {"ACTIVE", "SHUTOFF", "ERROR"};
}

std::vector<std::string> openstack_flavors()
{
    return {
        // Standard m1.* flavors
        "m1.tiny",
        "m1.small",
        "m1.medium",
        "m1.large",
        "m1.xlarge",
        // CI flavors
        "ci.cpu.small",
        "ci.cpu.medium",
        "ci.cpu.large",
        // General purpose
        "t2.micro",
        "t2.small",
        "t2.medium",
        "t3.micro",
        "t3.small",
        "t3.medium",
        // Compute optimized
        "c5.large",
        "c5.xlarge",
        "c5.2xlarge",
        // Memory optimized
        "r5.large",
        "r5.xlarge",
        // Storage optimized
        "i3.large",
        "i3.xlarge",
    };
}

std::vector<std::string> os_names(const config::BotConfig& cfg)
{
    if (cfg.cloud.osImageMap.empty()) {
        throw std::runtime_error("no OS images configured (cloud.os_image_map)");
    }

    std::vector<std::string> out;
    out.reserve(cfg.cloud.osImageMap.size());
    for (const auto& kv : cfg.cloud.osImageMap) {
        out.push_back(kv.first);
    }
    return out; // std::map iteration is already sorted
}

bool contains(const std::vector<std::string>& options, const std::string& value)
{
    return std::find(options.begin(), options.end(), value) != options.end();
}

} // namespace sustainbot::bot
