#include "action_registry.hpp"

namespace tapdeck {

ActionRegistry::ActionRegistry(std::map<std::string, ActionHandler> actions,
                               std::map<std::string, CommandHandler> commands,
                               CommandHandler recover)
    : actions_(std::move(actions)), commands_(std::move(commands)), recover_(std::move(recover)) {}

void ActionRegistry::addAction(const std::string& id, ActionHandler handler) {
    actions_[id] = std::move(handler);
}

void ActionRegistry::addCommand(const std::string& id, CommandHandler handler) {
    commands_[id] = std::move(handler);
}

Result<void> ActionRegistry::validate(const std::vector<std::string>& functions,
                                      const std::vector<std::string>& commands) const {
    std::string missing;
    auto note = [&missing](const std::string& kind, const std::string& id) {
        if (!missing.empty()) missing += ", ";
        missing += kind + " '" + id + "'";
    };

    for (const auto& id : functions) {
        auto it = actions_.find(id);
        if (it == actions_.end() || !it->second) note("function", id);
    }
    for (const auto& id : commands) {
        auto it = commands_.find(id);
        if (it == commands_.end() || !it->second) note("command", id);
    }

    if (!missing.empty()) {
        return Error("No handler registered for " + missing, kErrValidation);
    }
    return Ok();
}

const ActionHandler* ActionRegistry::action(const std::string& id) const {
    auto it = actions_.find(id);
    return it == actions_.end() ? nullptr : &it->second;
}

const CommandHandler* ActionRegistry::command(const std::string& id) const {
    auto it = commands_.find(id);
    return it == commands_.end() ? nullptr : &it->second;
}

std::vector<std::string> ActionRegistry::actionIds() const {
    std::vector<std::string> ids;
    for (const auto& [id, fn] : actions_) ids.push_back(id);
    return ids;
}

std::vector<std::string> ActionRegistry::commandIds() const {
    std::vector<std::string> ids;
    for (const auto& [id, fn] : commands_) ids.push_back(id);
    return ids;
}

} // namespace tapdeck
