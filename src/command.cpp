#include "cmdtree/command.hpp"

#include <unordered_map>

#include "cmdtree/context.hpp"
#include "cmdtree/utils.hpp"

namespace cmdtree {

Command& Command::alias(std::string_view a) {
    for (auto& part : utils::splitList(a)) aliases_.push_back(std::move(part));
    return *this;
}

Command& Command::aliases(std::vector<std::string> a) {
    aliases_.clear();
    for (const auto& entry : a) alias(entry);
    return *this;
}

std::optional<std::string> Command::invoke(const Context& ctx) const {
    if (actionE_) return actionE_(ctx);
    if (action_) action_(ctx);
    return std::nullopt;
}

bool Command::matches(std::string_view token) const {
    if (token == name_) return true;
    return utils::contains(aliases_, token);
}

const Command* Command::findSubcommand(std::string_view token) const {
    for (const auto& c : children_) {
        if (c.matches(token)) return &c;
    }
    return nullptr;
}

const Flag* Command::findFlag(std::string_view key) const {
    for (const auto& f : flags_) {
        if (f.matches(key)) return &f;
    }
    return nullptr;
}

std::optional<std::string> Command::validate() const {
    return validate(name_.empty() ? std::string("<root>") : name_);
}

std::optional<std::string> Command::validate(const std::string& path) const {
    std::unordered_map<std::string, std::string> flagOwner;
    for (const auto& f : flags_) {
        if (f.name().empty()) return "command \"" + path + "\" declares a flag with an empty name";
        for (const auto& n : f.invocationNames()) {
            const auto [it, inserted] = flagOwner.emplace(n, f.name());
            if (!inserted) {
                return "command \"" + path + "\": flag \"" + f.name() + "\" reuses \"" + n + "\" already taken by flag \"" +
                       it->second + "\"";
            }
        }
    }

    std::unordered_map<std::string, std::string> childOwner;
    for (const auto& c : children_) {
        if (c.name_.empty()) return "command \"" + path + "\" has a subcommand with an empty name";
        std::vector<std::string> names{c.name_};
        names.insert(names.end(), c.aliases_.begin(), c.aliases_.end());
        for (const auto& n : names) {
            const auto [it, inserted] = childOwner.emplace(n, c.name_);
            if (!inserted) {
                return "command \"" + path + "\": subcommand \"" + c.name_ + "\" reuses \"" + n +
                       "\" already taken by subcommand \"" + it->second + "\"";
            }
        }
        if (auto err = c.validate(path + " " + c.name_)) return err;
    }
    return std::nullopt;
}

} // namespace cmdtree
