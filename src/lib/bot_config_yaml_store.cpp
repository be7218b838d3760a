#include "sustainbot/config/bot_config_yaml_store.h"
#include "sustainbot/core/logging.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace sustainbot::config {

using sustainbot::log::Level;
static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static DispatchMode parse_dispatch_mode(const std::string& s)
{
    if (s == "registry") return DispatchMode::Registry;
    if (s == "pattern")  return DispatchMode::Pattern;
    throw ConfigError("dispatch.mode must be 'registry' or 'pattern', got '" + s + "'");
}

static std::string dispatch_mode_to_string(DispatchMode m)
{
    switch (m) {
    case DispatchMode::Registry: return "registry";
    case DispatchMode::Pattern:  return "pattern";
    }
    return "registry";
}

static std::map<std::string, std::string> string_map(const YAML::Node& node, const char* what)
{
    std::map<std::string, std::string> out;
    if (!node) {
        return out;
    }
    if (!node.IsMap()) {
        throw ConfigError(std::string(what) + " must be a mapping");
    }
    for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    return out;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, BotSection& out)
{
    out.name         = get_or<std::string>(node, "name", out.name);
    out.adminContact = get_or<std::string>(node, "admin_contact", out.adminContact);
    out.logLevel     = get_or<std::string>(node, "log_level", out.logLevel);
}

static void from_yaml(const YAML::Node& node, DispatchConfig& out)
{
    if (auto n = node["mode"]) {
        out.mode = parse_dispatch_mode(n.as<std::string>());
    }
    out.lowercaseCommands  = get_or<bool>(node, "lowercase_commands", out.lowercaseCommands);
    out.maxSuggestions     = get_or<std::uint32_t>(node, "max_suggestions", out.maxSuggestions);
    out.suggestionDistance = get_or<std::uint32_t>(node, "suggestion_distance", out.suggestionDistance);
    out.handlerTimeoutMs   = get_or<std::uint32_t>(node, "handler_timeout_ms", out.handlerTimeoutMs);
}

static void from_yaml(const YAML::Node& node, AccessConfig& out)
{
    out.restrictToAllowedUsers = get_or<bool>(node, "restrict_to_allowed_users", out.restrictToAllowedUsers);
    out.allowedUsers           = string_map(node["allowed_users"], "access.allowed_users");
}

static void from_yaml(const YAML::Node& node, CloudConfig& out)
{
    out.awsDefaultRegion = get_or<std::string>(node, "aws_default_region", out.awsDefaultRegion);
    out.osImageMap       = string_map(node["os_image_map"], "cloud.os_image_map");
}

static void from_yaml(const YAML::Node& node, TeamLink& out)
{
    out.name = get_or<std::string>(node, "name", "");
    out.url  = get_or<std::string>(node, "url", "");
}

// Top-level BotConfig mapper.
static void from_yaml(const YAML::Node& root, BotConfig& cfg)
{
    if (!root.IsMap()) {
        throw ConfigError("top level of the configuration must be a mapping");
    }

    if (auto n = root["bot"]) {
        from_yaml(n, cfg.bot);
    }

    if (auto n = root["dispatch"]) {
        from_yaml(n, cfg.dispatch);
    }

    if (auto n = root["access"]) {
        from_yaml(n, cfg.access);
    }

    if (auto n = root["cloud"]) {
        from_yaml(n, cfg.cloud);
    }

    if (auto links = root["team_links"]; links && links.IsSequence()) {
        cfg.teamLinks.clear();
        for (const auto& ln : links) {
            TeamLink tl{};
            from_yaml(ln, tl);
            cfg.teamLinks.push_back(std::move(tl));
        }
    }

    if (auto n = root["console"]) {
        cfg.console.user = get_or<std::string>(n, "user", cfg.console.user);
    }
}

// ---------- to_yaml helpers ----------

static void emit_string_map(YAML::Emitter& out, const std::map<std::string, std::string>& m)
{
    out << YAML::BeginMap;
    for (const auto& [k, v] : m) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;
}

static void to_yaml(YAML::Emitter& out, const BotConfig& cfg)
{
    out << YAML::BeginMap;

    // bot:
    out << YAML::Key << "bot" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name"          << YAML::Value << cfg.bot.name;
    out << YAML::Key << "admin_contact" << YAML::Value << cfg.bot.adminContact;
    out << YAML::Key << "log_level"     << YAML::Value << cfg.bot.logLevel;
    out << YAML::EndMap;

    // dispatch:
    out << YAML::Key << "dispatch" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "mode"                << YAML::Value << dispatch_mode_to_string(cfg.dispatch.mode);
    out << YAML::Key << "lowercase_commands"  << YAML::Value << cfg.dispatch.lowercaseCommands;
    out << YAML::Key << "max_suggestions"     << YAML::Value << cfg.dispatch.maxSuggestions;
    out << YAML::Key << "suggestion_distance" << YAML::Value << cfg.dispatch.suggestionDistance;
    out << YAML::Key << "handler_timeout_ms"  << YAML::Value << cfg.dispatch.handlerTimeoutMs;
    out << YAML::EndMap;

    // access:
    out << YAML::Key << "access" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "restrict_to_allowed_users" << YAML::Value << cfg.access.restrictToAllowedUsers;
    out << YAML::Key << "allowed_users" << YAML::Value;
    emit_string_map(out, cfg.access.allowedUsers);
    out << YAML::EndMap;

    // cloud:
    out << YAML::Key << "cloud" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "aws_default_region" << YAML::Value << cfg.cloud.awsDefaultRegion;
    out << YAML::Key << "os_image_map" << YAML::Value;
    emit_string_map(out, cfg.cloud.osImageMap);
    out << YAML::EndMap;

    // team_links:
    out << YAML::Key << "team_links" << YAML::Value << YAML::BeginSeq;
    for (const auto& tl : cfg.teamLinks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << tl.name;
        out << YAML::Key << "url"  << YAML::Value << tl.url;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // console:
    out << YAML::Key << "console" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "user" << YAML::Value << cfg.console.user;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

BotConfig parse_bot_config(std::string_view yamlText)
{
    BotConfig cfg{}; // defaults

    try {
        YAML::Node root = YAML::Load(std::string(yamlText));
        if (root.IsNull()) {
            return cfg;
        }
        from_yaml(root, cfg);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("invalid configuration: ") + ex.what());
    }

    return cfg;
}

std::string emit_bot_config(const BotConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

// ---------- YamlBotConfigStore methods ----------

YamlBotConfigStore::YamlBotConfigStore(std::string path)
    : _path(std::move(path))
{
}

BotConfig YamlBotConfigStore::load()
{
    std::ifstream in(_path, std::ios::binary);
    if (!in) {
        // Nothing found: write defaults so the file exists for next start.
        SB_LOGW(TAG, "Config '%s' not found; writing defaults", _path.c_str());

        BotConfig cfg{};
        try {
            save(cfg);
        } catch (const std::exception& ex) {
            SB_LOGE(TAG, "Failed to write default config '%s': %s", _path.c_str(), ex.what());
        }
        return cfg;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string yamlText = ss.str();

    if (yamlText.empty()) {
        SB_LOGW(TAG, "Config '%s' is empty; using defaults", _path.c_str());
        return BotConfig{};
    }

    BotConfig cfg = parse_bot_config(yamlText);
    SB_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
    return cfg;
}

void YamlBotConfigStore::save(const BotConfig& cfg)
{
    const std::string text = emit_bot_config(cfg);

    std::ofstream out(_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed: " + _path);
    }
    out << text << '\n';
    if (!out) {
        throw std::runtime_error("short write while saving config: " + _path);
    }

    SB_LOGI(TAG, "Saved config to '%s'", _path.c_str());
}

} // namespace sustainbot::config
