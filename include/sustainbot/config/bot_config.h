#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sustainbot::config {

struct BotSection {
    std::string name{"sustainbot"};
    std::string adminContact{"ocp-sustaining-admin@redhat.com"};
    std::string logLevel{"info"};
};

enum class DispatchMode {
    Registry,
    Pattern,
};

struct DispatchConfig {
    DispatchMode  mode{DispatchMode::Registry};
    bool          lowercaseCommands{true};
    std::uint32_t maxSuggestions{5};
    std::uint32_t suggestionDistance{2};
    std::uint32_t handlerTimeoutMs{30000};   // 0 = no timeout
};

struct AccessConfig {
    bool restrictToAllowedUsers{false};
    std::map<std::string, std::string> allowedUsers;   // display name -> user id
};

struct CloudConfig {
    std::string awsDefaultRegion{"us-east-1"};
    std::map<std::string, std::string> osImageMap;     // os name -> image id
};

struct TeamLink {
    std::string name;
    std::string url;
};

struct ConsoleConfig {
    std::string user{"console"};
};

// Unified config for the whole bot.
struct BotConfig {
    BotSection            bot;
    DispatchConfig        dispatch;
    AccessConfig          access;
    CloudConfig           cloud;
    std::vector<TeamLink> teamLinks;
    ConsoleConfig         console;
};

// Thrown when a configuration file exists but cannot be understood.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Abstract storage interface.
class BotConfigStore {
public:
    virtual ~BotConfigStore() = default;

    virtual BotConfig load() = 0;
    virtual void      save(const BotConfig& cfg) = 0;
};

} // namespace sustainbot::config
