#include "cmdtree/resolver.hpp"

#include <cstddef>

namespace cmdtree {

Resolution resolve(const Command& root, const std::vector<std::string>& positionals) {
    Resolution r;
    r.chain.push_back(&root);

    std::size_t cursor = 0;
    while (cursor < positionals.size()) {
        const auto* sub = r.chain.back()->findSubcommand(positionals[cursor]);
        if (!sub) break;
        r.chain.push_back(sub);
        ++cursor;
    }

    r.remaining.assign(positionals.begin() + static_cast<std::ptrdiff_t>(cursor), positionals.end());
    return r;
}

} // namespace cmdtree
