#pragma once

#include "sustainbot/cloud/cloud_gateway.h"
#include "sustainbot/command/command_handler.h"
#include "sustainbot/config/bot_config.h"

namespace sustainbot::command {
class CommandRegistry;
}

namespace sustainbot::dispatch {
class PatternRouter;
}

namespace sustainbot::bot {

// The bot's chat commands, registered into the command registry (or the
// pattern router). Cloud work goes through ICloudGateway; every handler
// reports gateway failures itself through ctx.say.
class BotCommands {
public:
    BotCommands(cloud::ICloudGateway& gateway, const config::BotConfig& cfg)
        : _gateway(gateway)
        , _cfg(cfg)
    {}

    void register_commands(command::CommandRegistry& reg);

    // Pattern-mode table. Exact names first, then prefixes, then the
    // greeting substring, so "list-aws-vms" is never shadowed by "hello".
    void register_routes(dispatch::PatternRouter& router);

private:
    void cmd_hello(const command::CommandContext& ctx);
    void cmd_list_team_links(const command::CommandContext& ctx);
    void cmd_list_aws_vms(const command::CommandContext& ctx);
    void cmd_create_aws_vm(const command::CommandContext& ctx);
    void cmd_aws_modify_vm(const command::CommandContext& ctx);
    void cmd_list_openstack_vms(const command::CommandContext& ctx);
    void cmd_create_openstack_vm(const command::CommandContext& ctx);

    command::CommandHandler bind(void (BotCommands::*fn)(const command::CommandContext&));

    cloud::ICloudGateway& _gateway;
    const config::BotConfig& _cfg;
};

} // namespace sustainbot::bot
