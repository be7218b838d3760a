#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "sustainbot/bot/bot_commands.h"
#include "sustainbot/cloud/cloud_gateway.h"
#include "sustainbot/command/command_registry.h"
#include "sustainbot/config/bot_config_yaml_store.h"
#include "sustainbot/console/console_engine.h"
#include "sustainbot/core/logging.h"
#include "sustainbot/dispatch/message_dispatcher.h"
#include "sustainbot/dispatch/pattern_router.h"
#include "sustainbot/dispatch/request_runner.h"
#include "sustainbot/help/general_help_cache.h"
#include "sustainbot/help/help_formatter.h"
#include "sustainbot/help/help_service.h"

using namespace sustainbot;

static const char* TAG = "main";

// Selector:
//   argv[1]                -> explicit config path
//   SB_CONFIG=<path>       -> environment override
//   ./sustainbot.yaml      -> default
static std::string config_path(int argc, char** argv)
{
    if (argc > 1 && argv[1] && argv[1][0] != '\0') {
        return argv[1];
    }
    if (const char* env = std::getenv("SB_CONFIG"); env && env[0] != '\0') {
        return env;
    }
    return "sustainbot.yaml";
}

int main(int argc, char** argv)
{
    SB_LOGI(TAG, "sustainbot starting (POSIX console)");

    // 1. Configuration. A broken file is fatal; a missing one is created.
    const std::string path = config_path(argc, argv);
    config::YamlBotConfigStore store(path);

    config::BotConfig cfg;
    try {
        cfg = store.load();
    } catch (const config::ConfigError& ex) {
        SB_ELOG("sustainbot: cannot start, %s (%s)", ex.what(), path.c_str());
        return 1;
    }

    log::Level lvl = log::Level::Info;
    if (log::parse_level(cfg.bot.logLevel, lvl)) {
        log::set_level(lvl);
    } else {
        SB_LOGW(TAG, "Unknown log level '%s'; keeping info", cfg.bot.logLevel.c_str());
    }

    // 2. Commands. All registration happens here, before any message is handled.
    command::CommandRegistry registry;
    cloud::StubCloudGateway gateway;
    bot::BotCommands commands(gateway, cfg);
    commands.register_commands(registry);

    help::HelpFormatter formatter(registry);
    help::GeneralHelpCache helpCache(formatter);

    help::HelpOptions helpOpts;
    helpOpts.max_suggestions     = cfg.dispatch.maxSuggestions;
    helpOpts.suggestion_distance = cfg.dispatch.suggestionDistance;
    helpOpts.lowercase_targets   = cfg.dispatch.lowercaseCommands;
    help::HelpService helpService(registry, formatter, helpCache, helpOpts);

    // Registration is complete; build the command list once now.
    (void)helpCache.get();

    // 3. Dispatch front: registry lookup or the ordered pattern table.
    dispatch::MessageDispatcher dispatcher(registry, helpService,
                                           dispatch::DispatcherOptions::from_config(cfg));
    dispatch::PatternRouter router(cfg.cloud.awsDefaultRegion);

    dispatch::MessageSink sink;
    if (cfg.dispatch.mode == config::DispatchMode::Pattern) {
        router.add_help_route(helpService);
        commands.register_routes(router);
        sink = [&router](const dispatch::InboundMessage& msg, const command::OutputFn& say) {
            (void)router.route(msg, say);
        };
        SB_LOGI(TAG, "Dispatch mode: pattern (%u routes)", static_cast<unsigned>(router.size()));
    } else {
        sink = [&dispatcher](const dispatch::InboundMessage& msg, const command::OutputFn& say) {
            const auto outcome = dispatcher.dispatch(msg, say);
            SB_LOGD(TAG, "Message from '%s': %s", msg.user.c_str(), dispatch::to_string(outcome));
            (void)outcome;
        };
        SB_LOGI(TAG, "Dispatch mode: registry (%u keys)", static_cast<unsigned>(registry.size()));
    }

    dispatch::RequestRunner runner(sink, std::chrono::milliseconds(cfg.dispatch.handlerTimeoutMs));

    // 4. Console loop until exit/quit or end of input.
    auto io = console::create_default_console_transport();
    if (!io) {
        SB_LOGE(TAG, "Failed to create console transport");
        return 1;
    }

    console::ConsoleEngine engine(runner, *io, cfg.console.user);
    engine.run_loop();

    SB_LOGI(TAG, "sustainbot exiting.");
    return 0;
}
