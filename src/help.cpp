#include "cmdtree/help.hpp"

#include <sstream>
#include <string_view>
#include <unordered_set>

namespace cmdtree::help {

namespace {

std::string paintIf(const ColorTheme* theme, const std::string ColorTheme::*role, std::string_view text) {
    if (!theme) return std::string(text);
    return (theme->*role) + std::string(text) + theme->reset;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

std::string buildUsageLine(const AppInfo& info, const std::vector<const Command*>& chain) {
    const auto& cmd = *chain.back();
    if (cmd.usage().has_value()) return "Usage: " + *cmd.usage() + "\n";

    bool anyFlags = false;
    for (const auto* c : chain) anyFlags = anyFlags || !c->flags().empty();

    std::ostringstream oss;
    oss << "Usage: " << commandPath(info, chain);
    if (!cmd.commands().empty()) oss << " [command]";
    if (anyFlags) oss << " [flags]";
    oss << " [args]\n";
    return oss.str();
}

} // namespace

std::string flagSpelling(const std::string& key) {
    return (key.size() == 1 ? "-" : "--") + key;
}

std::string formatFlag(const Flag& f, const ColorTheme* theme) {
    std::vector<std::string> spellings;
    for (const auto& n : f.invocationNames()) spellings.push_back(flagSpelling(n));

    std::string out = paintIf(theme, &ColorTheme::flag, joinNames(spellings));
    if (f.type() != FlagType::Bool) {
        out.push_back(' ');
        out += paintIf(theme, &ColorTheme::type, flagTypeName(f.type()));
    }
    if (f.description().has_value() && !f.description()->empty()) out += " - " + *f.description();
    return out;
}

std::string commandPath(const AppInfo& info, const std::vector<const Command*>& chain) {
    std::string out = info.name;
    for (std::size_t i = 1; i < chain.size(); ++i) {
        if (!out.empty()) out.push_back(' ');
        out += chain[i]->name();
    }
    return out;
}

std::string versionText(const AppInfo& info) {
    if (info.version.empty()) return {};
    const auto& name = info.displayName.empty() ? info.name : info.displayName;
    if (name.empty()) return info.version;
    return name + " version " + info.version;
}

std::string render(const AppInfo& info, const std::vector<const Command*>& chain, const ColorTheme* theme) {
    const auto& cmd = *chain.back();
    const bool isRoot = chain.size() == 1;
    std::ostringstream oss;

    if (isRoot) {
        const auto& title = info.displayName.empty() ? info.name : info.displayName;
        bool header = false;
        if (!title.empty()) {
            oss << paintIf(theme, &ColorTheme::command, title);
            if (!info.version.empty()) oss << " " << info.version;
            oss << "\n";
            header = true;
        }
        if (!info.author.empty()) {
            oss << info.author << "\n";
            header = true;
        }
        if (header) oss << "\n";
    }

    oss << buildUsageLine(info, chain);

    if (cmd.description().has_value() && !cmd.description()->empty()) oss << "\n" << *cmd.description() << "\n";

    if (!isRoot && !cmd.aliases().empty()) {
        oss << "\n" << paintIf(theme, &ColorTheme::section, "Aliases:") << "\n";
        std::vector<std::string> names{cmd.name()};
        names.insert(names.end(), cmd.aliases().begin(), cmd.aliases().end());
        oss << "  " << joinNames(names) << "\n";
    }

    const bool listHelpCommand = isRoot && !info.helpCommand.empty();
    if (!cmd.commands().empty() || listHelpCommand) {
        oss << "\n" << paintIf(theme, &ColorTheme::section, "Commands:") << "\n";
        if (listHelpCommand) {
            oss << "  " << paintIf(theme, &ColorTheme::command, info.helpCommand) << " - Help about any command\n";
        }
        for (const auto& sub : cmd.commands()) {
            std::vector<std::string> names{sub.name()};
            names.insert(names.end(), sub.aliases().begin(), sub.aliases().end());
            oss << "  " << paintIf(theme, &ColorTheme::command, joinNames(names));
            if (sub.description().has_value() && !sub.description()->empty()) oss << " - " << *sub.description();
            oss << "\n";
        }
    }

    std::unordered_set<std::string> shown;
    std::ostringstream local;
    for (const auto& f : cmd.flags()) {
        shown.insert(f.name());
        local << "  " << formatFlag(f, theme) << "\n";
    }
    std::vector<std::string> helpSpellings;
    for (const auto& h : info.helpFlags) {
        bool declared = false;
        for (const auto* c : chain) declared = declared || c->findFlag(h) != nullptr;
        if (!declared) helpSpellings.push_back(flagSpelling(h));
    }
    if (!helpSpellings.empty()) {
        const auto path = commandPath(info, chain);
        local << "  " << paintIf(theme, &ColorTheme::flag, joinNames(helpSpellings)) << " - Help for "
              << (path.empty() ? std::string("this command") : path) << "\n";
    }
    if (!local.str().empty()) {
        oss << "\n" << paintIf(theme, &ColorTheme::section, "Flags:") << "\n" << local.str();
    }

    std::ostringstream global;
    for (auto it = chain.rbegin() + 1; it != chain.rend(); ++it) {
        for (const auto& f : (*it)->flags()) {
            if (!shown.insert(f.name()).second) continue;
            global << "  " << formatFlag(f, theme) << "\n";
        }
    }
    if (!global.str().empty()) {
        oss << "\n" << paintIf(theme, &ColorTheme::section, "Global Flags:") << "\n" << global.str();
    }

    return oss.str();
}

} // namespace cmdtree::help
