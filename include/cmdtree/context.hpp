#ifndef CMDTREE_CONTEXT_HPP
#define CMDTREE_CONTEXT_HPP

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "command.hpp"
#include "error.hpp"
#include "flag.hpp"
#include "tokenizer.hpp"

namespace cmdtree {

// What an action sees: the positionals left after command resolution and the
// flags visible to the matched command. Built once per dispatch.
//
// Visibility: flags declared on the matched command and on its ancestors. A
// flag redeclared (same name) lower in the tree hides the ancestor's
// declaration, including its aliases.
class Context {
public:
    using HelpTextFunc = std::function<std::string()>;

    // `chain` runs root..matched command and must not be empty. `flags` are
    // all occurrences from the command line; only those naming an in-scope
    // flag are kept, the last occurrence of each winning.
    Context(std::vector<std::string> args,
            const std::vector<RawFlag>& flags,
            std::vector<const Command*> chain,
            HelpTextFunc helpText = {},
            std::ostream* out = nullptr);

    [[nodiscard]] const std::vector<std::string>& args() const { return args_; }
    [[nodiscard]] const Command& command() const { return *chain_.back(); }
    [[nodiscard]] const std::vector<const Command*>& chain() const { return chain_; }

    // Keyed by the declared flag name, whatever spelling was typed.
    [[nodiscard]] const std::unordered_map<std::string, RawFlag>& flags() const { return flags_; }

    // Switch semantics: true if the flag was given (a value, if any, is
    // ignored). Never fails; unknown or non-bool names read as false.
    [[nodiscard]] bool boolFlag(std::string_view name) const;

    [[nodiscard]] Result<std::string> stringFlag(std::string_view name) const;
    [[nodiscard]] Result<std::int64_t> intFlag(std::string_view name) const;
    [[nodiscard]] Result<double> floatFlag(std::string_view name) const;

    // Declared flag visible under `name` (name or alias), nearest command first.
    [[nodiscard]] const Flag* findFlag(std::string_view name) const;

    [[nodiscard]] std::string helpText() const;
    // Prints helpText() to the dispatcher's output stream.
    void help() const;

private:
    Result<std::string> rawValue(std::string_view name, FlagType want) const;

    std::vector<std::string> args_;
    std::vector<const Command*> chain_;
    std::vector<const Flag*> scope_;
    std::unordered_map<std::string, RawFlag> flags_;
    HelpTextFunc helpText_;
    std::ostream* out_{nullptr};
};

} // namespace cmdtree

#endif // CMDTREE_CONTEXT_HPP
