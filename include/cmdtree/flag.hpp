#ifndef CMDTREE_FLAG_HPP
#define CMDTREE_FLAG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdtree {

enum class FlagType {
    Bool,
    String,
    Int,
    Float,
};

std::string_view flagTypeName(FlagType t);

class Flag {
public:
    explicit Flag(std::string name, FlagType type = FlagType::Bool)
        : name_(std::move(name)),
          type_(type) {}

    // Accepts a single alias or a comma-joined list ("a, ag").
    Flag& alias(std::string_view a);
    Flag& aliases(std::vector<std::string> a);

    Flag& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] FlagType type() const { return type_; }
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::optional<std::string>& description() const { return description_; }

    // True if `key` (as typed, without dashes) names this flag.
    [[nodiscard]] bool matches(std::string_view key) const;

    // Every spelling of this flag: name first, then aliases.
    [[nodiscard]] std::vector<std::string> invocationNames() const;

    static std::optional<std::int64_t> parseInt(std::string_view s);
    static std::optional<double> parseFloat(std::string_view s);

private:
    std::string name_;
    FlagType type_;
    std::vector<std::string> aliases_;
    std::optional<std::string> description_;
};

} // namespace cmdtree

#endif // CMDTREE_FLAG_HPP
