#ifndef CMDTREE_APP_HPP
#define CMDTREE_APP_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "color.hpp"
#include "command.hpp"
#include "context.hpp"
#include "flag.hpp"
#include "help.hpp"
#include "resolver.hpp"

namespace cmdtree {

// Root of a command tree plus the app-wide metadata and dispatch settings.
//
// run() drops argv[0], splits the rest into positionals and flags, resolves
// the command path, and invokes the matched command's action with a Context.
// Without a matched action the root action runs; without that, nothing does.
class App {
public:
    struct Options {
        // Flag keys (no dashes) that print help instead of running an action,
        // unless the resolved command or an ancestor declares them itself.
        // A help or version key no command declares never takes the next word
        // as its value: `app --help sub` shows the help of `sub`.
        std::vector<std::string> helpFlags{"help", "h"};
        // Root-level positional that prints help for the path after it. Empty disables.
        std::string helpCommand{"help"};
        // Flag keys that print the version line; root only, ignored without a version.
        std::vector<std::string> versionFlags{"version"};
        ColorMode colorMode{ColorMode::Auto};
    };

    explicit App(std::string name = {}) { info_.name = std::move(name); }

    App& name(std::string n) {
        info_.name = std::move(n);
        return *this;
    }
    App& displayName(std::string n) {
        info_.displayName = std::move(n);
        return *this;
    }
    App& author(std::string a) {
        info_.author = std::move(a);
        return *this;
    }
    App& version(std::string v) {
        info_.version = std::move(v);
        return *this;
    }
    App& description(std::string d) {
        root_.description(std::move(d));
        return *this;
    }
    App& usage(std::string u) {
        root_.usage(std::move(u));
        return *this;
    }
    App& flag(Flag f) {
        root_.flag(std::move(f));
        return *this;
    }
    App& command(Command cmd) {
        root_.command(std::move(cmd));
        return *this;
    }
    App& action(Command::Action a) {
        root_.action(std::move(a));
        return *this;
    }
    App& actionE(Command::ActionE a) {
        root_.actionE(std::move(a));
        return *this;
    }
    App& options(Options o) {
        options_ = std::move(o);
        return *this;
    }
    App& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }
    App& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return info_.name; }
    [[nodiscard]] const std::string& displayName() const { return info_.displayName; }
    [[nodiscard]] const std::string& author() const { return info_.author; }
    [[nodiscard]] const std::string& version() const { return info_.version; }
    [[nodiscard]] const Command& root() const { return root_; }
    [[nodiscard]] const Options& options() const { return options_; }

    // Same checks as Command::validate() over the whole tree.
    [[nodiscard]] std::optional<std::string> validate() const;

    // Returns 0 on success. Configuration errors and ActionE failures are
    // written to the error stream as "Error: <message>" and return 1.
    int run(int argc, char** argv) const;
    int run(const std::vector<std::string>& args) const;

    // Like run(), but hands the error message back instead of printing it.
    std::optional<std::string> runWithResult(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string helpText() const;
    [[nodiscard]] std::string helpText(const std::vector<const Command*>& chain) const;
    void printHelp() const;

private:
    [[nodiscard]] AppInfo helpInfo() const;
    [[nodiscard]] bool colorEnabled() const;
    [[nodiscard]] std::vector<std::string> switchKeys() const;
    [[nodiscard]] bool triggered(const std::vector<std::string>& keys, const Context& ctx, const Tokens& tokens) const;

    std::ostream& out() const;
    std::ostream& err() const;

    AppInfo info_;
    Command root_;
    Options options_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace cmdtree

#endif // CMDTREE_APP_HPP
