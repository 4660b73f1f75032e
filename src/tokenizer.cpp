#include "cmdtree/tokenizer.hpp"

#include <cstddef>
#include <utility>

#include "cmdtree/utils.hpp"

namespace cmdtree {

// "-" and "--" stay positional.
bool isFlagToken(const std::string& s) {
    return s.size() >= 2 && s[0] == '-' && s != "--";
}

Tokens extract(const std::vector<std::string>& tokens, const std::vector<std::string>& switches) {
    Tokens out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& arg = tokens[i];
        if (!isFlagToken(arg)) {
            out.positionals.push_back(arg);
            continue;
        }

        const std::size_t prefix = (arg.rfind("--", 0) == 0) ? 2 : 1;
        RawFlag flag;

        const auto eq = arg.find('=', prefix);
        if (eq != std::string::npos) {
            flag.key = arg.substr(prefix, eq - prefix);
            flag.value = arg.substr(eq + 1);
            out.flags.push_back(std::move(flag));
            continue;
        }

        flag.key = arg.substr(prefix);
        if (!utils::contains(switches, flag.key) && i + 1 < tokens.size() && tokens[i + 1].rfind('-', 0) != 0) {
            flag.value = tokens[++i];
        }
        out.flags.push_back(std::move(flag));
    }
    return out;
}

} // namespace cmdtree
