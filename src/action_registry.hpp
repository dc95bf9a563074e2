// =============================================================================
// Tapdeck - Action Registry
// =============================================================================
// Static {identifier: handler} tables for one game: loop actions, triggered
// commands and the optional recover routine. Built at startup and validated
// against the configured identifiers before the loop starts.
// =============================================================================
#pragma once

#include "result.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tapdeck {

class Bot;

enum class ActionResult {
    Done,       // ran; cooldown starts
    NotRun,     // did not really run; cooldown not started
    Completed,  // ran and finished for good; cooldown starts, action disabled
};

inline const char* actionResultStr(ActionResult r) {
    switch (r) {
        case ActionResult::Done:      return "done";
        case ActionResult::NotRun:    return "not run";
        case ActionResult::Completed: return "completed";
    }
    return "?";
}

struct ActionContext {
    std::string device;   // configured device name
    int stop_limit = 6;   // bot_settings.stop
};

using ActionHandler = std::function<ActionResult(Bot&, const ActionContext&)>;
using CommandHandler = std::function<void(Bot&, const ActionContext&)>;

class ActionRegistry {
public:
    ActionRegistry() = default;
    ActionRegistry(std::map<std::string, ActionHandler> actions,
                   std::map<std::string, CommandHandler> commands,
                   CommandHandler recover = nullptr);

    void addAction(const std::string& id, ActionHandler handler);
    void addCommand(const std::string& id, CommandHandler handler);
    void setRecover(CommandHandler handler) { recover_ = std::move(handler); }

    // Fails naming every configured identifier that has no handler.
    Result<void> validate(const std::vector<std::string>& functions,
                          const std::vector<std::string>& commands) const;

    const ActionHandler* action(const std::string& id) const;
    const CommandHandler* command(const std::string& id) const;
    const CommandHandler& recover() const { return recover_; }

    std::vector<std::string> actionIds() const;
    std::vector<std::string> commandIds() const;

private:
    std::map<std::string, ActionHandler> actions_;
    std::map<std::string, CommandHandler> commands_;
    CommandHandler recover_;
};

} // namespace tapdeck
