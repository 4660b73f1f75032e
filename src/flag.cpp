#include "cmdtree/flag.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "cmdtree/utils.hpp"

namespace cmdtree {

std::string_view flagTypeName(FlagType t) {
    switch (t) {
        case FlagType::Bool: return "bool";
        case FlagType::String: return "string";
        case FlagType::Int: return "int";
        case FlagType::Float: return "float";
    }
    return "bool";
}

Flag& Flag::alias(std::string_view a) {
    for (auto& part : utils::splitList(a)) aliases_.push_back(std::move(part));
    return *this;
}

Flag& Flag::aliases(std::vector<std::string> a) {
    aliases_.clear();
    for (const auto& entry : a) alias(entry);
    return *this;
}

bool Flag::matches(std::string_view key) const {
    if (key == name_) return true;
    return utils::contains(aliases_, key);
}

std::vector<std::string> Flag::invocationNames() const {
    std::vector<std::string> out;
    out.reserve(1 + aliases_.size());
    out.push_back(name_);
    out.insert(out.end(), aliases_.begin(), aliases_.end());
    return out;
}

std::optional<std::int64_t> Flag::parseInt(std::string_view s) {
    // [+-]?[0-9]+, nothing else: no padding, no base prefixes.
    const std::size_t digits = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    if (digits == s.size()) return std::nullopt;
    for (std::size_t i = digits; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }

    const std::string text(s);
    errno = 0;
    const long long v = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) return std::nullopt;
    return static_cast<std::int64_t>(v);
}

std::optional<double> Flag::parseFloat(std::string_view s) {
    if (s.empty()) return std::nullopt;
    if (std::isspace(static_cast<unsigned char>(s.front())) || std::isspace(static_cast<unsigned char>(s.back()))) {
        return std::nullopt;
    }
    // strtod also reads hex floats and "nan(...)" payloads; neither is a decimal number.
    if (s.find_first_of("xX(") != std::string_view::npos) return std::nullopt;

    const std::string text(s);
    char* end = nullptr;
    // Out-of-range input saturates: underflow reads as 0 or a denormal, overflow as infinity.
    const double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    return v;
}

} // namespace cmdtree
