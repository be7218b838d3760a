#pragma once

#include <string>
#include <string_view>

#include "sustainbot/config/bot_config.h"

namespace sustainbot::config {

// File-backed YAML implementation of BotConfigStore.
//
// load(): a missing file yields defaults (and writes them back), an empty file
// yields defaults, an unparsable file throws ConfigError.
class YamlBotConfigStore : public BotConfigStore {
public:
    explicit YamlBotConfigStore(std::string path);

    BotConfig load() override;
    void      save(const BotConfig& cfg) override;

    const std::string& path() const noexcept { return _path; }

private:
    std::string _path;
};

// Parses YAML text into a config, starting from defaults. Throws ConfigError.
BotConfig parse_bot_config(std::string_view yamlText);

std::string emit_bot_config(const BotConfig& cfg);

} // namespace sustainbot::config
