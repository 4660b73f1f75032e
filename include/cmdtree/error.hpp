#ifndef CMDTREE_ERROR_HPP
#define CMDTREE_ERROR_HPP

#include <ostream>
#include <string_view>
#include <utility>
#include <variant>

namespace cmdtree {

// Failure kinds of a typed flag lookup on a Context.
enum class FlagError {
    Undefined,      // no flag with this name/alias in scope
    TypeError,      // declared with another FlagType than requested
    NotFound,       // declared, but not given on the command line
    ArgumentError,  // given, but without a value token
    ValueTypeError, // value does not parse as the declared type
};

constexpr std::string_view toString(FlagError e) {
    switch (e) {
        case FlagError::Undefined: return "Undefined";
        case FlagError::TypeError: return "TypeError";
        case FlagError::NotFound: return "NotFound";
        case FlagError::ArgumentError: return "ArgumentError";
        case FlagError::ValueTypeError: return "ValueTypeError";
    }
    return "Unknown";
}

constexpr std::string_view describe(FlagError e) {
    switch (e) {
        case FlagError::Undefined: return "flag undefined";
        case FlagError::TypeError: return "flag type mismatch";
        case FlagError::NotFound: return "flag not found";
        case FlagError::ArgumentError: return "flag needs an argument";
        case FlagError::ValueTypeError: return "value type mismatch";
    }
    return "unknown flag error";
}

inline std::ostream& operator<<(std::ostream& os, FlagError e) { return os << toString(e); }

// Either a value or the FlagError explaining why there is none.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(FlagError error) : data_(error) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    [[nodiscard]] FlagError error() const { return std::get<FlagError>(data_); }

    T valueOr(T fallback) const {
        if (ok()) return value();
        return fallback;
    }

    friend bool operator==(const Result& a, const Result& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Result& a, const Result& b) { return !(a == b); }

private:
    std::variant<T, FlagError> data_;
};

} // namespace cmdtree

#endif // CMDTREE_ERROR_HPP
