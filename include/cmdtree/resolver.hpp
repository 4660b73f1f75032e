#ifndef CMDTREE_RESOLVER_HPP
#define CMDTREE_RESOLVER_HPP

#include <string>
#include <vector>

#include "command.hpp"

namespace cmdtree {

struct Resolution {
    // Root first, matched command last. Never empty.
    std::vector<const Command*> chain;
    // Positionals left after the command path; these become Context::args().
    std::vector<std::string> remaining;

    [[nodiscard]] const Command& command() const { return *chain.back(); }
    [[nodiscard]] bool isRoot() const { return chain.size() == 1; }
};

// Greedy, leftmost descent: each positional that names a child of the current
// command (by name or alias, first declared wins) moves one level down. The
// first positional that does not match stops the walk; there is no
// backtracking and no failure case.
Resolution resolve(const Command& root, const std::vector<std::string>& positionals);

} // namespace cmdtree

#endif // CMDTREE_RESOLVER_HPP
