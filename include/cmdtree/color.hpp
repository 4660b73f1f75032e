#ifndef CMDTREE_COLOR_HPP
#define CMDTREE_COLOR_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cmdtree {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

// Escape sequences the help renderer uses per kind of text.
struct ColorTheme {
    std::string reset{"\x1b[0m"};
    std::string section;
    std::string command;
    std::string flag;
    std::string type;
};

namespace color {

// 1 for a stream writing through std::cout's buffer, 2 for std::cerr/std::clog.
// Any other stream (files, string streams) has no descriptor.
std::optional<int> standardFd(const std::ostream& os);

// Whether help written to `os` gets escape sequences. Always and Never are
// unconditional; Auto requires `os` to be a terminal, with NO_COLOR unset and
// TERM not "dumb".
bool enabled(ColorMode mode, const std::ostream& os);

inline const ColorTheme& defaultTheme() {
    static const ColorTheme theme = [] {
        ColorTheme t;
        t.section = "\x1b[1m\x1b[36m"; // bold cyan
        t.command = "\x1b[32m";        // green
        t.flag = "\x1b[33m";           // yellow
        t.type = "\x1b[35m";           // magenta
        return t;
    }();
    return theme;
}

inline std::string paint(std::string_view code, std::string_view text) {
    std::string out;
    out.reserve(code.size() + text.size() + 4);
    out.append(code).append(text).append("\x1b[0m");
    return out;
}

inline std::string black(std::string_view t) { return paint("\x1b[30m", t); }
inline std::string red(std::string_view t) { return paint("\x1b[31m", t); }
inline std::string green(std::string_view t) { return paint("\x1b[32m", t); }
inline std::string yellow(std::string_view t) { return paint("\x1b[33m", t); }
inline std::string blue(std::string_view t) { return paint("\x1b[34m", t); }
inline std::string magenta(std::string_view t) { return paint("\x1b[35m", t); }
inline std::string cyan(std::string_view t) { return paint("\x1b[36m", t); }
inline std::string white(std::string_view t) { return paint("\x1b[37m", t); }

inline std::string bgBlack(std::string_view t) { return paint("\x1b[40m", t); }
inline std::string bgRed(std::string_view t) { return paint("\x1b[41m", t); }
inline std::string bgGreen(std::string_view t) { return paint("\x1b[42m", t); }
inline std::string bgYellow(std::string_view t) { return paint("\x1b[43m", t); }
inline std::string bgBlue(std::string_view t) { return paint("\x1b[44m", t); }
inline std::string bgMagenta(std::string_view t) { return paint("\x1b[45m", t); }
inline std::string bgCyan(std::string_view t) { return paint("\x1b[46m", t); }
inline std::string bgWhite(std::string_view t) { return paint("\x1b[47m", t); }

inline std::optional<ColorMode> parseMode(std::string_view s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always") return ColorMode::Always;
    if (s == "never") return ColorMode::Never;
    return std::nullopt;
}

inline std::string_view modeName(ColorMode m) {
    switch (m) {
        case ColorMode::Auto: return "auto";
        case ColorMode::Always: return "always";
        case ColorMode::Never: return "never";
    }
    return "auto";
}

} // namespace color
} // namespace cmdtree

#endif // CMDTREE_COLOR_HPP
