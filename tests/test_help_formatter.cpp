#include "doctest.h"

#include "sustainbot/command/command_meta.h"
#include "sustainbot/help/general_help_cache.h"
#include "sustainbot/help/help_formatter.h"

#include "test_support.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace sustainbot::tests {
namespace {

using command::ArgumentSpec;
using command::CommandMetaBuilder;

static command::CommandMetaPtr deploy_meta()
{
    return CommandMetaBuilder("deploy")
        .description("Deploy things")
        .argument(ArgumentSpec::required_arg("env", "Target env").with_choices({"dev", "prod"}))
        .argument(ArgumentSpec::optional_arg("tag", "").with_default("latest"))
        .example("deploy --env=dev")
        .alias("ship")
        .build();
}

} // namespace

TEST_CASE("HelpFormatter reports unknown commands without throwing")
{
    HelpFixture fx;
    CHECK(fx.formatter.format_command_help("nope", false) == "Command 'nope' not found.");
    CHECK(fx.formatter.format_command_help("nope", true) == "Command 'nope' not found.");
}

TEST_CASE("HelpFormatter summary line")
{
    HelpFixture fx;
    fx.registry.declare(deploy_meta(), noop_handler());
    CHECK(fx.formatter.format_command_help("deploy", false) == "`deploy` - Deploy things");
    CHECK(fx.formatter.format_command_help("ship", false) == "`ship` - Deploy things");
}

TEST_CASE("HelpFormatter detailed help lists every section in order")
{
    HelpFixture fx;
    fx.registry.declare(deploy_meta(), noop_handler());

    const std::string expected =
        "*deploy*\n"
        "_Deploy things_\n"
        "\n"
        "*Usage:* `deploy --env=<env> [--tag=<tag>]`\n"
        "\n"
        "*Arguments:*\n"
        "  `--env` *(required)* - Target env (Options: dev, prod)\n"
        "  `--tag` - No description (Default: latest)\n"
        "\n"
        "*Examples:*\n"
        "  `deploy --env=dev`\n"
        "\n"
        "*Aliases:* ship";

    CHECK(fx.formatter.format_command_help("deploy", true) == expected);
}

TEST_CASE("HelpFormatter omits sections that have no content")
{
    HelpFixture fx;
    fx.registry.declare(CommandMetaBuilder("ping").build(), noop_handler());

    CHECK(fx.formatter.format_command_help("ping", true) == "*ping*\n_No description available_");
}

TEST_CASE("HelpFormatter renders a placeholder when a choices producer fails")
{
    HelpFixture fx;
    fx.registry.declare(
        CommandMetaBuilder("boot")
            .description("Boot an image")
            .argument(ArgumentSpec::required_arg("os_name", "Image")
                          .with_choices([]() -> std::vector<std::string> {
                              throw std::runtime_error("no images");
                          }))
            .argument(ArgumentSpec::optional_arg("zone", "Zone")
                          .with_default([]() -> std::string { throw std::runtime_error("no zone"); }))
            .build(),
        noop_handler());

    std::string text;
    REQUIRE_NOTHROW(text = fx.formatter.format_command_help("boot", true));
    CHECK(contains(text, "`--os_name` *(required)* - Image (Options: <error getting value>)"));
    CHECK(contains(text, "`--zone` - Zone (Default: <error getting value>)"));
}

TEST_CASE("HelpFormatter truncates long option lists to ten entries")
{
    std::vector<std::string> twelve;
    for (int i = 1; i <= 12; ++i) twelve.push_back("c" + std::to_string(i));
    std::vector<std::string> ten(twelve.begin(), twelve.begin() + 10);

    HelpFixture fx;
    fx.registry.declare(
        CommandMetaBuilder("many")
            .argument(ArgumentSpec::optional_arg("pick", "Pick one").with_choices(twelve))
            .build(),
        noop_handler());
    fx.registry.declare(
        CommandMetaBuilder("few")
            .argument(ArgumentSpec::optional_arg("pick", "Pick one").with_choices(ten))
            .argument(ArgumentSpec::optional_arg("none", "Empty").with_choices(std::vector<std::string>{}))
            .build(),
        noop_handler());

    const std::string many = fx.formatter.format_command_help("many", true);
    CHECK(contains(many, "(Options: c1, c2, c3, c4, c5, c6, c7, c8, c9, c10, ...)"));
    CHECK(!contains(many, "c11"));

    const std::string few = fx.formatter.format_command_help("few", true);
    CHECK(contains(few, "(Options: c1, c2, c3, c4, c5, c6, c7, c8, c9, c10)"));
    CHECK(contains(few, "`--none` - Empty"));
    CHECK(!contains(few, "`--none` - Empty (Options"));
}

TEST_CASE("HelpFormatter usage strings")
{
    auto meta = deploy_meta();
    CHECK(help::HelpFormatter::detailed_usage("deploy", *meta) == "deploy --env=<env> [--tag=<tag>]");
    CHECK(help::HelpFormatter::compact_usage("deploy", *meta) == "deploy <env> [tag]");
}

TEST_CASE("HelpFormatter general help lists each command once, sorted")
{
    HelpFixture fx;
    fx.registry.declare(CommandMetaBuilder("hello").description("Greets").alias("hi").build(), noop_handler());
    fx.registry.declare(deploy_meta(), noop_handler());

    const std::string expected =
        "*Available Commands:*\n"
        "`deploy <env> [tag]` - Deploy things\n"
        "`hello` - Greets\n"
        "\n"
        "For detailed help on any command, use: `help <command-name>` or `<command-name> --help`\n"
        "\n"
        "Example: `help list-aws-vms` or `list-aws-vms --help`";

    CHECK(fx.formatter.build_general_help() == expected);
}

TEST_CASE("GeneralHelpCache is built once and never invalidated")
{
    HelpFixture fx;
    fx.registry.declare(CommandMetaBuilder("hello").description("Greets").build(), noop_handler());

    CHECK(!fx.cache.built());
    const std::string first = fx.cache.get();
    CHECK(fx.cache.built());
    CHECK(contains(first, "`hello` - Greets"));

    fx.registry.declare(CommandMetaBuilder("late").description("Registered late").build(), noop_handler());

    CHECK(fx.cache.get() == first);
    CHECK(!contains(fx.cache.get(), "late"));
    // Detailed help is rendered live.
    CHECK(fx.formatter.format_command_help("late", false) == "`late` - Registered late");
}

} // namespace sustainbot::tests
