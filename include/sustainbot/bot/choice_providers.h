#pragma once

#include "sustainbot/config/bot_config.h"

#include <string>
#include <vector>

namespace sustainbot::bot {

std::vector<std::string> aws_instance_states();
std::vector<std::string> aws_instance_types();
std::vector<std::string> openstack_statuses();
std::vector<std::string> openstack_flavors();

// Keys of cloud.os_image_map, sorted. Throws std::runtime_error when none are
// configured, so help renders the error placeholder instead of an empty list.
std::vector<std::string> os_names(const config::BotConfig& cfg);

bool contains(const std::vector<std::string>& options, const std::string& value);

} // namespace sustainbot::bot
