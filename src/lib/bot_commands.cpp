#include "sustainbot/bot/bot_commands.h"

#include "sustainbot/bot/choice_providers.h"
#include "sustainbot/command/command_meta.h"
#include "sustainbot/command/command_registry.h"
#include "sustainbot/command/suggest.h"
#include "sustainbot/core/logging.h"
#include "sustainbot/dispatch/pattern_router.h"

#include <exception>
#include <string>

namespace sustainbot::bot {

using command::ArgumentSpec;
using command::CommandContext;
using command::CommandMetaBuilder;
using sustainbot::log::Level;

static constexpr const char* TAG = "bot";

namespace {

static std::string user_ref(const CommandContext& ctx)
{
    return ctx.user.empty() ? std::string("there") : "<@" + ctx.user + ">";
}

static std::string format_aws_instance(const cloud::InstanceInfo& inst)
{
    std::string s;
    s.append("Instance Name: ").append(inst.name).append("\n");
    s.append("Architecture: ").append(inst.architecture).append("\n");
    s.append("ID: ").append(inst.id).append("\n");
    s.append("Image ID: ").append(inst.image).append("\n");
    s.append("Instance type: ").append(inst.type).append("\n");
    s.append("Private IP: ").append(inst.address.empty() ? "N/A" : inst.address).append("\n");
    s.append("State: ").append(inst.state);
    return s;
}

static std::string format_openstack_server(const cloud::InstanceInfo& s)
{
    std::string out;
    out.append("• `").append(s.name).append("` (").append(s.id).append(")");
    out.append(" flavor=").append(s.type.empty() ? "?" : s.type);
    out.append(" status=").append(s.state);
    if (!s.address.empty()) {
        out.append(" network=").append(s.address);
    }
    return out;
}

} // namespace

command::CommandHandler BotCommands::bind(void (BotCommands::*fn)(const CommandContext&))
{
    return [this, fn](const CommandContext& ctx) { (this->*fn)(ctx); };
}

void BotCommands::register_commands(command::CommandRegistry& reg)
{
    const config::BotConfig& cfg = _cfg;

    reg.declare(
        CommandMetaBuilder("hello")
            .description("Greet the bot")
            .example("hello")
            .alias("hi")
            .build(),
        bind(&BotCommands::cmd_hello));

    reg.declare(
        CommandMetaBuilder("list-team-links")
            .description("List useful team links")
            .example("list-team-links")
            .build(),
        bind(&BotCommands::cmd_list_team_links));

    reg.declare(
        CommandMetaBuilder("list-aws-vms")
            .description("List AWS EC2 instances in the current region")
            .argument(ArgumentSpec::optional_arg("state", "Only show instances in this state")
                          .with_choices(aws_instance_states)
                          .with_default("running"))
            .argument(ArgumentSpec::optional_arg("type", "Only show instances of this type")
                          .with_choices(aws_instance_types))
            .argument(ArgumentSpec::optional_arg("region", "AWS region to query")
                          .with_default([&cfg] { return cfg.cloud.awsDefaultRegion; }))
            .example("list-aws-vms")
            .example("list-aws-vms --state=stopped --type=t3.micro")
            .alias("aws-vms")
            .build(),
        bind(&BotCommands::cmd_list_aws_vms));

    reg.declare(
        CommandMetaBuilder("create-aws-vm")
            .description("Create an AWS EC2 instance")
            .argument(ArgumentSpec::required_arg("os_name", "Operating system image to boot")
                          .with_choices([&cfg] { return os_names(cfg); }))
            .argument(ArgumentSpec::optional_arg("instance_type", "EC2 instance type")
                          .with_choices(aws_instance_types)
                          .with_default("t3.micro"))
            .argument(ArgumentSpec::optional_arg("name", "Name tag for the instance"))
            .example("create-aws-vm --os_name=rhel-9 --instance_type=t3.small --name=my-test")
            .build(),
        bind(&BotCommands::cmd_create_aws_vm));

    reg.declare(
        CommandMetaBuilder("aws-modify-vm")
            .description("Start, stop or reboot an AWS EC2 instance")
            .argument(ArgumentSpec::required_arg("vm_id", "Instance id, e.g. i-0001"))
            .argument(ArgumentSpec::required_arg("action", "What to do with the instance")
                          .with_choices({"start", "stop", "reboot"}))
            .example("aws-modify-vm --vm_id=i-0001 --action=stop")
            .build(),
        bind(&BotCommands::cmd_aws_modify_vm));

    reg.declare(
        CommandMetaBuilder("list-openstack-vms")
            .description("List OpenStack servers")
            .argument(ArgumentSpec::optional_arg("status", "Only show servers with this status")
                          .with_choices(openstack_statuses)
                          .with_default("ACTIVE"))
            .argument(ArgumentSpec::optional_arg("flavor", "Only show servers of this flavor")
                          .with_choices(openstack_flavors))
            .example("list-openstack-vms")
            .example("list-openstack-vms --status=SHUTOFF")
            .alias("os-vms")
            .build(),
        bind(&BotCommands::cmd_list_openstack_vms));

    reg.declare(
        CommandMetaBuilder("create-openstack-vm")
            .description("Create an OpenStack server")
            .argument(ArgumentSpec::required_arg("name", "Server name"))
            .argument(ArgumentSpec::required_arg("os_name", "Operating system image to boot")
                          .with_choices([&cfg] { return os_names(cfg); }))
            .argument(ArgumentSpec::required_arg("flavor", "Server flavor")
                          .with_choices(openstack_flavors))
            .argument(ArgumentSpec::required_arg("network", "Network to attach"))
            .example("create-openstack-vm --name=ci-runner --os_name=fedora-40 --flavor=ci.cpu.small --network=provider_net")
            .build(),
        bind(&BotCommands::cmd_create_openstack_vm));

    SB_LOGI(TAG, "Registered bot commands");
}

void BotCommands::register_routes(dispatch::PatternRouter& router)
{
    using dispatch::PatternKind;
    using dispatch::PatternRule;

    router.add(PatternRule{PatternKind::Exact, "list-team-links"},    bind(&BotCommands::cmd_list_team_links));
    router.add(PatternRule{PatternKind::Exact, "list-aws-vms"},       bind(&BotCommands::cmd_list_aws_vms));
    router.add(PatternRule{PatternKind::Exact, "aws-modify-vm"},      bind(&BotCommands::cmd_aws_modify_vm));
    router.add(PatternRule{PatternKind::Prefix, "create-openstack-vm"}, bind(&BotCommands::cmd_create_openstack_vm));
    router.add(PatternRule{PatternKind::Prefix, "create-aws-vm"},     bind(&BotCommands::cmd_create_aws_vm));
    router.add(PatternRule{PatternKind::Prefix, "list-openstack-vms"}, bind(&BotCommands::cmd_list_openstack_vms));
    router.add(PatternRule{PatternKind::Substring, "hello"},          bind(&BotCommands::cmd_hello));
}

void BotCommands::cmd_hello(const CommandContext& ctx)
{
    ctx.say("Hello " + user_ref(ctx) + "! How can I assist you today?");
}

void BotCommands::cmd_list_team_links(const CommandContext& ctx)
{
    if (_cfg.teamLinks.empty()) {
        ctx.say("No team links are configured.");
        return;
    }

    std::string out = "*Team links:*";
    for (const auto& tl : _cfg.teamLinks) {
        out.append("\n• <").append(tl.url).append("|").append(tl.name).append(">");
    }
    ctx.say(out);
}

void BotCommands::cmd_list_aws_vms(const CommandContext& ctx)
{
    const std::string state = ctx.params.get_or("state", "running");
    const std::string type = ctx.params.get("type");

    if (!contains(aws_instance_states(), state)) {
        ctx.say("Invalid state `" + state + "`. Options: " + command::join(aws_instance_states()));
        return;
    }

    try {
        const auto instances = _gateway.list_aws_instances(ctx.region, state, type);
        if (instances.empty()) {
            ctx.say("There are currently no " + state + " EC2 instances to retrieve");
            return;
        }
        for (const auto& inst : instances) {
            ctx.say("\n*** AWS EC2 VM Details ***\n" + format_aws_instance(inst) + "\n");
        }
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "list-aws-vms failed: %s", ex.what());
        ctx.say(std::string("An error occurred listing the EC2 instances : ") + ex.what());
    }
}

void BotCommands::cmd_create_aws_vm(const CommandContext& ctx)
{
    const std::string os = ctx.params.get("os_name");
    auto img = _cfg.cloud.osImageMap.find(os);
    if (img == _cfg.cloud.osImageMap.end()) {
        ctx.say("Unknown OS `" + os + "`. Use `create-aws-vm --help` to see the available images.");
        return;
    }

    cloud::AwsCreateRequest req;
    req.region       = ctx.region;
    req.name         = ctx.params.get("name");
    req.imageId      = img->second;
    req.instanceType = ctx.params.get_or("instance_type", "t3.micro");
    req.requestedBy  = ctx.user;

    if (!contains(aws_instance_types(), req.instanceType)) {
        ctx.say("Invalid instance type `" + req.instanceType + "`. Options: " + command::join(aws_instance_types()));
        return;
    }

    try {
        const auto inst = _gateway.create_aws_instance(req);
        ctx.say("Successfully created EC2 instance: " + inst.name + " (" + inst.id + ")");
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "create-aws-vm failed: %s", ex.what());
        ctx.say(std::string("An error occurred creating the EC2 instance : ") + ex.what());
    }
}

void BotCommands::cmd_aws_modify_vm(const CommandContext& ctx)
{
    const std::string id = ctx.params.get("vm_id");
    const std::string action_s = ctx.params.get("action");

    cloud::AwsAction action{};
    if (!cloud::parse_aws_action(action_s, action)) {
        ctx.say("Invalid action `" + action_s + "`. Options: start, stop, reboot");
        return;
    }

    try {
        const std::string state = _gateway.modify_aws_instance(ctx.region, id, action);
        ctx.say("Instance `" + id + "`: " + cloud::to_string(action) + " requested, state is now *" + state + "*");
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "aws-modify-vm failed: %s", ex.what());
        ctx.say(std::string("An error occurred modifying the EC2 instance : ") + ex.what());
    }
}

void BotCommands::cmd_list_openstack_vms(const CommandContext& ctx)
{
    const std::string status = ctx.params.get_or("status", "ACTIVE");
    const std::string flavor = ctx.params.get("flavor");

    try {
        auto servers = _gateway.list_openstack_servers(status);
        if (!flavor.empty()) {
            std::erase_if(servers, [&](const cloud::InstanceInfo& s) { return s.type != flavor; });
        }

        if (servers.empty()) {
            ctx.say(":no_entry_sign: There are currently *no " + status + " VMs* in OpenStack.");
            return;
        }

        std::string out = "*OpenStack " + status + " VMs:* (count=" + std::to_string(servers.size()) + ")";
        for (const auto& s : servers) {
            out.append("\n").append(format_openstack_server(s));
        }
        ctx.say(out);
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "Failed to list OpenStack VMs: %s", ex.what());
        ctx.say(":x: An error occurred while fetching the list of VMs.");
    }
}

void BotCommands::cmd_create_openstack_vm(const CommandContext& ctx)
{
    const std::string os = ctx.params.get("os_name");
    auto img = _cfg.cloud.osImageMap.find(os);
    if (img == _cfg.cloud.osImageMap.end()) {
        ctx.say("Unknown OS `" + os + "`. Use `create-openstack-vm --help` to see the available images.");
        return;
    }

    cloud::OpenStackCreateRequest req;
    req.name        = ctx.params.get("name");
    req.imageId     = img->second;
    req.flavor      = ctx.params.get("flavor");
    req.network     = ctx.params.get("network");
    req.requestedBy = ctx.user;

    if (!contains(openstack_flavors(), req.flavor)) {
        ctx.say("Invalid flavor `" + req.flavor + "`. Use `create-openstack-vm --help` to see the options.");
        return;
    }

    try {
        const auto s = _gateway.create_openstack_server(req);
        ctx.say("Successfully created OpenStack VM: " + s.name + " (" + s.id + ")");
    } catch (const std::exception& ex) {
        SB_LOGE(TAG, "create-openstack-vm failed: %s", ex.what());
        ctx.say(std::string("An error occurred creating the openstack VM : ") + ex.what());
    }
}

} // namespace sustainbot::bot
