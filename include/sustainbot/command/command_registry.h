#pragma once

#include "sustainbot/command/command_handler.h"
#include "sustainbot/command/command_meta.h"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sustainbot::command {

struct RegisteredCommand {
    CommandHandler handler;
    CommandMetaPtr meta;
};

// Maps every dispatch key (canonical name or alias) to a handler and its metadata.
//
// Keys are exact and case-sensitive. Registering an existing key replaces it
// (last write wins) and keeps the key's original enumeration position.
// There is no removal.
//
// Thread-safety: registration takes a writer lock, queries a reader lock, so
// late registration may race with lookups.
class CommandRegistry {
public:
    // Declaration path: inserts under meta->name, except for "help" which is
    // answered by the help service and must never shadow it, plus every alias.
    void declare(CommandMetaPtr meta, CommandHandler handler);

    // Manual path: inserts under `name` unconditionally, plus every alias.
    void register_command(std::string_view name, CommandHandler handler, CommandMetaPtr meta);

    std::optional<RegisteredCommand> lookup(std::string_view key) const;

    bool contains(std::string_view key) const;

    // Every key in first-registration order.
    std::vector<std::string> all_keys() const;

    // One entry per distinct metadata object, keyed by the first key that
    // references it in enumeration order.
    std::map<std::string, CommandMetaPtr> unique_commands() const;

    std::size_t size() const;

private:
    void insert_locked(std::string_view key, const CommandHandler& handler, const CommandMetaPtr& meta);

    mutable std::shared_mutex _mutex;
    std::unordered_map<std::string, RegisteredCommand> _entries;
    std::vector<std::string> _order;
};

} // namespace sustainbot::command
