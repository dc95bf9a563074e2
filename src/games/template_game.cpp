#include "games/template_game.hpp"
#include "bot.hpp"

namespace tapdeck::games {

namespace {

// Runs between loop iterations when fix is enabled: get back to a known
// screen. Closes a popup when the needle set has one.
void doRecover(Bot& bot, const ActionContext&) {
    bot.log("Fix/Recover: Checking game state...");
    if (bot.hasNeedle("close_popup") && bot.findAndClick("close_popup")) {
        bot.sleep(0.5);
    }
    bot.sleep(0.5);
}

ActionResult doHelloWorld(Bot& bot, const ActionContext&) {
    bot.log("Hello World!");
    bot.sleep(1.0);
    return ActionResult::Done;
}

ActionResult doExampleTask(Bot& bot, const ActionContext&) {
    bot.log("Starting example task...");

    if (bot.hasNeedle("required_screen")) {
        FindOptions detect;
        detect.tap = false;
        if (!bot.findAndClick("required_screen", detect)) {
            bot.log("ERROR: Not on required screen - aborting");
            return ActionResult::NotRun;
        }
    }
    if (bot.hasNeedle("button_image")) {
        FindOptions opts;
        opts.accuracy = 0.95f;
        if (bot.findAndClick("button_image", opts)) bot.sleep(0.5);
    }

    bot.log("Example task completed");
    bot.sleep(1.0);
    return ActionResult::Completed;
}

ActionResult doCollectRewards(Bot& bot, const ActionContext& ctx) {
    bot.log("Collecting rewards...");

    int loops = 0;
    while (loops < ctx.stop_limit) {
        ++loops;
        if (!bot.hasNeedle("reward_icon") || !bot.findAndClick("reward_icon")) {
            break;
        }
        bot.log("Collected reward " + std::to_string(loops));
        bot.sleep(0.5);
    }

    bot.log("Reward collection finished after " + std::to_string(loops) + " iterations");
    return ActionResult::Done;
}

void handleExampleCommand(Bot& bot, const ActionContext&) {
    bot.log("Example command triggered!");
    bot.sleep(0.5);
}

} // anonymous namespace

ActionRegistry templateGame() {
    return ActionRegistry(
        {
            {"doHelloWorld", doHelloWorld},
            {"doExampleTask", doExampleTask},
            {"doCollectRewards", doCollectRewards},
        },
        {
            {"example_command", handleExampleCommand},
        },
        doRecover);
}

} // namespace tapdeck::games
