#ifndef CMDTREE_COMMAND_HPP
#define CMDTREE_COMMAND_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flag.hpp"

namespace cmdtree {

class Context;

class Command {
public:
    using Action = std::function<void(const Context&)>;
    // Return empty optional on success, otherwise an error message.
    using ActionE = std::function<std::optional<std::string>(const Context&)>;

    explicit Command(std::string name = {}, std::string description = {})
        : name_(std::move(name)) {
        if (!description.empty()) description_ = std::move(description);
    }

    // Accepts a single alias or a comma-joined list ("a, ad").
    Command& alias(std::string_view a);
    Command& aliases(std::vector<std::string> a);

    Command& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }

    Command& usage(std::string u) {
        usage_ = std::move(u);
        return *this;
    }

    Command& flag(Flag f) {
        flags_.push_back(std::move(f));
        return *this;
    }

    Command& command(Command cmd) {
        children_.push_back(std::move(cmd));
        return *this;
    }

    // Installing an action replaces a previously installed ActionE, and vice versa.
    Command& action(Action a) {
        action_ = std::move(a);
        actionE_ = nullptr;
        return *this;
    }

    Command& actionE(ActionE a) {
        actionE_ = std::move(a);
        action_ = nullptr;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::optional<std::string>& description() const { return description_; }
    [[nodiscard]] const std::optional<std::string>& usage() const { return usage_; }
    [[nodiscard]] const std::vector<Flag>& flags() const { return flags_; }
    [[nodiscard]] const std::vector<Command>& commands() const { return children_; }

    [[nodiscard]] bool runnable() const { return static_cast<bool>(action_) || static_cast<bool>(actionE_); }

    // Runs whichever action is installed. Returns the ActionE error, if any.
    std::optional<std::string> invoke(const Context& ctx) const;

    [[nodiscard]] bool matches(std::string_view token) const;

    // First child, in declaration order, whose name or alias equals `token`.
    [[nodiscard]] const Command* findSubcommand(std::string_view token) const;

    // Flag declared directly on this command under `key` (name or alias).
    [[nodiscard]] const Flag* findFlag(std::string_view key) const;

    // Checks this command and its subtree: non-empty flag names, flag
    // names/aliases unique per command, child names non-empty and unique
    // among siblings (aliases included). Returns the first violation.
    [[nodiscard]] std::optional<std::string> validate() const;

private:
    std::optional<std::string> validate(const std::string& path) const;

    std::string name_;
    std::vector<std::string> aliases_;
    std::optional<std::string> description_;
    std::optional<std::string> usage_;
    std::vector<Flag> flags_;
    std::vector<Command> children_;
    Action action_;
    ActionE actionE_;
};

} // namespace cmdtree

#endif // CMDTREE_COMMAND_HPP
