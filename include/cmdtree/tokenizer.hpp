#ifndef CMDTREE_TOKENIZER_HPP
#define CMDTREE_TOKENIZER_HPP

#include <optional>
#include <string>
#include <vector>

namespace cmdtree {

// One flag as it appeared on the command line.
struct RawFlag {
    std::string key; // without the leading dashes; may be a name or an alias
    std::optional<std::string> value;

    friend bool operator==(const RawFlag& a, const RawFlag& b) { return a.key == b.key && a.value == b.value; }
    friend bool operator!=(const RawFlag& a, const RawFlag& b) { return !(a == b); }
};

struct Tokens {
    std::vector<std::string> positionals;
    std::vector<RawFlag> flags;
};

// Splits tokens into positionals and flag occurrences without looking at any
// declared flags.
//
// - `--key=value`, `-key=value`: split on the first '='.
// - `--key`, `-key`: the next token becomes the value unless it starts with '-'
//   or `key` is listed in `switches`.
// - everything else is a positional. That includes a bare "-" or "--": neither
//   is read as a flag with an empty key, so neither swallows the next token.
//
// No clustering: `-abc` is the single key "abc".
Tokens extract(const std::vector<std::string>& tokens, const std::vector<std::string>& switches = {});

bool isFlagToken(const std::string& s);

} // namespace cmdtree

#endif // CMDTREE_TOKENIZER_HPP
