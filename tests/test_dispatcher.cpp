#include "doctest.h"

#include "sustainbot/command/command_meta.h"
#include "sustainbot/dispatch/message_dispatcher.h"
#include "sustainbot/dispatch/message_parse.h"

#include "test_support.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace sustainbot::tests {
namespace {

using command::ArgumentSpec;
using command::CommandContext;
using command::CommandMetaBuilder;
using dispatch::DispatchOutcome;
using dispatch::InboundMessage;
using dispatch::MessageDispatcher;

// Records the last context a handler saw.
struct Recorder {
    int calls{0};
    CommandContext last;

    command::CommandHandler handler(std::string reply = "done")
    {
        return [this, reply](const CommandContext& ctx) {
            ++calls;
            last = ctx;
            ctx.say(reply);
        };
    }
};

struct DispatchFixture : HelpFixture {
    Recorder vms;
    Recorder hello;

    DispatchFixture()
    {
        registry.declare(
            CommandMetaBuilder("list-aws-vms")
                .description("List AWS EC2 instances")
                .argument(ArgumentSpec::optional_arg("state", "State").with_default("running"))
                .alias("aws-vms")
                .build(),
            vms.handler("vm list"));
        registry.declare(
            CommandMetaBuilder("hello").description("Greet the bot").alias("hi").build(),
            hello.handler("hi there"));
        registry.declare(
            CommandMetaBuilder("create-openstack-vm")
                .description("Create a server")
                .argument(ArgumentSpec::required_arg("name", "Name"))
                .argument(ArgumentSpec::required_arg("flavor", "Flavor"))
                .build(),
            noop_handler());
        registry.declare(
            CommandMetaBuilder("boom").description("Always fails").build(),
            [](const CommandContext&) { throw std::runtime_error("kaput"); });
    }

    DispatchOutcome send(const MessageDispatcher& d, std::string user, std::string text)
    {
        return d.dispatch(InboundMessage{std::move(user), std::move(text)}, out.sink());
    }

    Transcript out;
};

} // namespace

TEST_CASE("MessageDispatcher answers a bare 'help' with the greeting and the command list")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "help") == DispatchOutcome::Help);
    REQUIRE(fx.out.size() == 1);

    const std::string reply = fx.out.last();
    CHECK(reply.rfind("Hello <@U1>! Here's what I can help you with:\n\n*Available Commands:*", 0) == 0);
    CHECK(contains(reply, "`list-aws-vms [state]` - List AWS EC2 instances"));
    CHECK(reply.size() > 200);
}

TEST_CASE("MessageDispatcher help variants")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    SUBCASE("help <command>")
    {
        CHECK(fx.send(d, "U1", "help list-aws-vms") == DispatchOutcome::Help);
        CHECK(fx.out.last().rfind("Hello <@U1>! Here's help for `list-aws-vms`:\n\n*list-aws-vms*", 0) == 0);
    }

    SUBCASE("<command> --help")
    {
        CHECK(fx.send(d, "U1", "aws-vms --help") == DispatchOutcome::Help);
        CHECK(contains(fx.out.last(), "Here's help for `aws-vms`"));
        CHECK(fx.vms.calls == 0);
    }

    SUBCASE("uppercase HELP")
    {
        CHECK(fx.send(d, "U1", "HELP hello") == DispatchOutcome::Help);
        CHECK(contains(fx.out.last(), "Here's help for `hello`"));
    }

    SUBCASE("help for an unknown command suggests close matches")
    {
        CHECK(fx.send(d, "U1", "help helo") == DispatchOutcome::Help);
        CHECK(fx.out.last() == "Hello <@U1>! Command `helo` not found. Did you mean: hello?");
    }

    SUBCASE("help for an unknown command with nothing close")
    {
        CHECK(fx.send(d, "", "help qqqqqqq") == DispatchOutcome::Help);
        CHECK(fx.out.last() == "Hello! Command `qqqqqqq` not found. Use `help` to see all available commands.");
    }

    CHECK(fx.out.size() == 1);
}

TEST_CASE("MessageDispatcher suggests commands for a typo")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "list-asw-vms") == DispatchOutcome::Suggested);
    REQUIRE(fx.out.size() == 1);
    CHECK(contains(fx.out.last(), "list-aws-vms"));
    CHECK(fx.out.last().rfind("Hello <@U1>! Command `list-asw-vms` not found. Did you mean: ", 0) == 0);
    CHECK(fx.vms.calls == 0);
}

TEST_CASE("MessageDispatcher replies 'couldn't understand' when nothing is close")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "qwertyuiop") == DispatchOutcome::NotUnderstood);
    CHECK(fx.out.last()
          == "Hello <@U1>! I couldn't understand your request. Please try again or type 'help' for assistance.");

    CHECK(fx.send(d, "U1", "   ") == DispatchOutcome::NotUnderstood);
    CHECK(fx.out.size() == 2);
}

TEST_CASE("MessageDispatcher strips the bot mention and passes parameters")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "<@UBOT> list-aws-vms --state=stopped") == DispatchOutcome::Handled);
    REQUIRE(fx.vms.calls == 1);
    CHECK(fx.vms.last.command == "list-aws-vms");
    CHECK(fx.vms.last.user == "U1");
    CHECK(fx.vms.last.params.get("state") == "stopped");
    CHECK(fx.vms.last.region == "us-east-1");
    CHECK(fx.out.lines() == std::vector<std::string>{"vm list"});
}

TEST_CASE("MessageDispatcher resolves aliases, lowercases keys and honours --region")
{
    DispatchFixture fx;
    dispatch::DispatcherOptions opts;
    opts.default_region = "eu-west-1";
    MessageDispatcher d(fx.registry, fx.service, opts);

    CHECK(fx.send(d, "U1", "AWS-VMS") == DispatchOutcome::Handled);
    CHECK(fx.vms.last.command == "aws-vms");
    CHECK(fx.vms.last.region == "eu-west-1");

    CHECK(fx.send(d, "U1", "aws-vms --region=ap-south-1") == DispatchOutcome::Handled);
    CHECK(fx.vms.last.region == "ap-south-1");
    CHECK(fx.vms.calls == 2);

    SUBCASE("case-sensitive lookup when lowercasing is off")
    {
        dispatch::DispatcherOptions strict;
        strict.lowercase_commands = false;
        MessageDispatcher sd(fx.registry, fx.service, strict);
        CHECK(fx.send(sd, "U1", "HELLO") != DispatchOutcome::Handled);
        CHECK(fx.hello.calls == 0);
    }
}

TEST_CASE("MessageDispatcher validates required arguments before running the handler")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "create-openstack-vm --flavor=m1.small") == DispatchOutcome::MissingArguments);
    CHECK(fx.out.last()
          == "Hello <@U1>! Missing required argument(s) for `create-openstack-vm`: --name. "
             "Use `create-openstack-vm --help` for usage.");

    CHECK(fx.send(d, "U1", "create-openstack-vm") == DispatchOutcome::MissingArguments);
    CHECK(contains(fx.out.last(), "--name, --flavor."));

    CHECK(fx.send(d, "U1", "create-openstack-vm --name=a --flavor=b") == DispatchOutcome::Handled);
}

TEST_CASE("MessageDispatcher apologises when a handler throws")
{
    DispatchFixture fx;
    MessageDispatcher d(fx.registry, fx.service);

    CHECK(fx.send(d, "U1", "boom") == DispatchOutcome::HandlerFailed);
    CHECK(fx.out.lines() == std::vector<std::string>{"Sorry <@U1>, an error occurred while running `boom`."});
}

TEST_CASE("MessageDispatcher enforces the allow-list when restricted")
{
    DispatchFixture fx;
    dispatch::DispatcherOptions opts;
    opts.restrict_to_allowed_users = true;
    opts.allowed_user_ids = {"UOK"};
    opts.admin_contact = "admins@example.com";
    MessageDispatcher d(fx.registry, fx.service, opts);

    CHECK(d.is_user_allowed("UOK"));
    CHECK(!d.is_user_allowed("UBAD"));

    CHECK(fx.send(d, "UBAD", "hello") == DispatchOutcome::Denied);
    CHECK(fx.out.last()
          == "Sorry <@UBAD>, you're not authorized to use this bot. Contact admins@example.com for assistance.");
    CHECK(fx.hello.calls == 0);

    CHECK(fx.send(d, "UOK", "hello") == DispatchOutcome::Handled);
    CHECK(fx.hello.calls == 1);
}

TEST_CASE("DispatcherOptions::from_config")
{
    config::BotConfig cfg;
    cfg.dispatch.maxSuggestions = 3;
    cfg.cloud.awsDefaultRegion = "us-west-2";
    cfg.access.restrictToAllowedUsers = true;
    cfg.access.allowedUsers = {{"alice", "U1"}, {"bob", "U2"}};

    auto o = dispatch::DispatcherOptions::from_config(cfg);
    CHECK(o.max_suggestions == 3);
    CHECK(o.default_region == "us-west-2");
    CHECK(o.restrict_to_allowed_users);
    CHECK(o.allowed_user_ids == std::vector<std::string>{"U1", "U2"});
    CHECK(o.admin_contact == "ocp-sustaining-admin@redhat.com");
}

TEST_CASE("message parsing helpers")
{
    using dispatch::split_ws;
    using dispatch::strip_mention;

    CHECK(split_ws("  a \t b\n c  ") == std::vector<std::string_view>{"a", "b", "c"});
    CHECK(split_ws("   ").empty());

    CHECK(dispatch::is_mention_token("<@U024BE7LH>"));
    CHECK(!dispatch::is_mention_token("<@>"));
    CHECK(!dispatch::is_mention_token("hello"));

    CHECK(strip_mention({"<@UBOT>", "hello"}) == std::vector<std::string_view>{"hello"});
    CHECK(strip_mention({"<@UBOT>"}) == std::vector<std::string_view>{"<@UBOT>"});
    CHECK(strip_mention({"hello", "<@UBOT>"}) == std::vector<std::string_view>{"hello", "<@UBOT>"});
}

} // namespace sustainbot::tests
