#include "cmdtree/context.hpp"

#include <iostream>
#include <unordered_set>
#include <utility>

namespace cmdtree {

Context::Context(std::vector<std::string> args,
                 const std::vector<RawFlag>& flags,
                 std::vector<const Command*> chain,
                 HelpTextFunc helpText,
                 std::ostream* out)
    : args_(std::move(args)),
      chain_(std::move(chain)),
      helpText_(std::move(helpText)),
      out_(out) {
    std::unordered_set<std::string> seen;
    for (auto it = chain_.rbegin(); it != chain_.rend(); ++it) {
        for (const auto& f : (*it)->flags()) {
            if (!seen.insert(f.name()).second) continue;
            scope_.push_back(&f);
        }
    }

    // Each occurrence belongs to the nearest declaration of its key only.
    for (const auto& occurrence : flags) {
        if (const auto* f = findFlag(occurrence.key)) flags_[f->name()] = occurrence;
    }
}

const Flag* Context::findFlag(std::string_view name) const {
    for (const auto* f : scope_) {
        if (f->matches(name)) return f;
    }
    return nullptr;
}

bool Context::boolFlag(std::string_view name) const {
    const auto* f = findFlag(name);
    if (!f || f->type() != FlagType::Bool) return false;
    return flags_.find(f->name()) != flags_.end();
}

Result<std::string> Context::rawValue(std::string_view name, FlagType want) const {
    const auto* f = findFlag(name);
    if (!f) return FlagError::Undefined;
    if (f->type() != want) return FlagError::TypeError;

    const auto it = flags_.find(f->name());
    if (it == flags_.end()) return FlagError::NotFound;
    if (!it->second.value.has_value()) return FlagError::ArgumentError;
    return *it->second.value;
}

Result<std::string> Context::stringFlag(std::string_view name) const {
    return rawValue(name, FlagType::String);
}

Result<std::int64_t> Context::intFlag(std::string_view name) const {
    const auto raw = rawValue(name, FlagType::Int);
    if (!raw) return raw.error();
    const auto v = Flag::parseInt(raw.value());
    if (!v) return FlagError::ValueTypeError;
    return *v;
}

Result<double> Context::floatFlag(std::string_view name) const {
    const auto raw = rawValue(name, FlagType::Float);
    if (!raw) return raw.error();
    const auto v = Flag::parseFloat(raw.value());
    if (!v) return FlagError::ValueTypeError;
    return *v;
}

std::string Context::helpText() const {
    if (helpText_) return helpText_();
    return {};
}

void Context::help() const {
    std::ostream& os = out_ ? *out_ : std::cout;
    os << helpText();
}

} // namespace cmdtree
