#ifndef CMDTREE_HELP_HPP
#define CMDTREE_HELP_HPP

#include <optional>
#include <string>
#include <vector>

#include "color.hpp"
#include "command.hpp"
#include "flag.hpp"

namespace cmdtree {

// App-level metadata shown in help and version output.
struct AppInfo {
    std::string name;
    std::string displayName;
    std::string author;
    std::string version;
    // Help trigger spellings, listed in the help so users can find them.
    std::vector<std::string> helpFlags;
    std::string helpCommand;
};

namespace help {

// "--age, -a" style: one dash for single-character spellings, two otherwise.
std::string flagSpelling(const std::string& key);

// "--age, -a int - Age of the user"
std::string formatFlag(const Flag& f, const ColorTheme* theme = nullptr);

// "app remote add"
std::string commandPath(const AppInfo& info, const std::vector<const Command*>& chain);

// "<name> version <version>", or empty if the app has no version.
std::string versionText(const AppInfo& info);

// Help for chain.back(). `chain` runs root..command and must not be empty.
// A non-null theme colors section titles, command names, flags and types.
std::string render(const AppInfo& info, const std::vector<const Command*>& chain, const ColorTheme* theme = nullptr);

} // namespace help
} // namespace cmdtree

#endif // CMDTREE_HELP_HPP
