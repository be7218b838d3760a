#include "sustainbot/command/command_registry.h"

#include "sustainbot/core/logging.h"

#include <mutex>
#include <unordered_set>

namespace sustainbot::command {

using sustainbot::log::Level;
static constexpr const char* TAG = "registry";

void CommandRegistry::insert_locked(std::string_view key,
                                    const CommandHandler& handler,
                                    const CommandMetaPtr& meta)
{
    std::string k(key);
    auto it = _entries.find(k);
    if (it != _entries.end()) {
        if (it->second.meta != meta) {
            SB_LOGW(TAG, "Dispatch key '%s' re-registered; previous command '%s' replaced by '%s'",
                    k.c_str(),
                    it->second.meta ? it->second.meta->name.c_str() : "?",
                    meta ? meta->name.c_str() : "?");
        }
        it->second = RegisteredCommand{handler, meta};
        return;
    }

    _order.push_back(k);
    _entries.emplace(std::move(k), RegisteredCommand{handler, meta});
}

void CommandRegistry::declare(CommandMetaPtr meta, CommandHandler handler)
{
    if (!meta || meta->name.empty() || !handler) {
        SB_LOGE(TAG, "Refusing to declare a command without name or handler");
        return;
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    if (meta->name != "help") {
        insert_locked(meta->name, handler, meta);
    }
    for (const auto& a : meta->aliases) {
        insert_locked(a, handler, meta);
    }
    SB_LOGD(TAG, "Declared '%s' (%u aliases)",
            meta->name.c_str(), static_cast<unsigned>(meta->aliases.size()));
}

void CommandRegistry::register_command(std::string_view name, CommandHandler handler, CommandMetaPtr meta)
{
    if (name.empty() || !meta || !handler) {
        SB_LOGE(TAG, "Refusing to register a command without name, metadata or handler");
        return;
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    insert_locked(name, handler, meta);
    for (const auto& a : meta->aliases) {
        insert_locked(a, handler, meta);
    }
}

std::optional<RegisteredCommand> CommandRegistry::lookup(std::string_view key) const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _entries.find(std::string(key));
    if (it == _entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CommandRegistry::contains(std::string_view key) const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _entries.find(std::string(key)) != _entries.end();
}

std::vector<std::string> CommandRegistry::all_keys() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _order;
}

std::map<std::string, CommandMetaPtr> CommandRegistry::unique_commands() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);

    std::map<std::string, CommandMetaPtr> out;
    std::unordered_set<const CommandMeta*> seen;
    for (const auto& key : _order) {
        const auto& meta = _entries.at(key).meta;
        if (seen.insert(meta.get()).second) {
            out.emplace(key, meta);
        }
    }
    return out;
}

std::size_t CommandRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _entries.size();
}

} // namespace sustainbot::command
