#include "cmdtree/color.hpp"

#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#else
#include <unistd.h>
#endif

namespace cmdtree::color {

namespace {

bool environmentForbidsColor() {
    // https://no-color.org/
    if (std::getenv("NO_COLOR") != nullptr) return true;
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

bool isTerminal(int fd) {
#if defined(_WIN32)
    return _isatty(fd) != 0;
#else
    return ::isatty(fd) != 0;
#endif
}

// Windows consoles render SGR codes only once VT processing is switched on.
bool prepareTerminal(int fd) {
#if defined(_WIN32)
    const auto handle = reinterpret_cast<HANDLE>(_get_osfhandle(fd));
    if (handle == INVALID_HANDLE_VALUE) return false;
    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode)) return false;
    if (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) return true;
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    (void)fd;
    return true;
#endif
}

} // namespace

std::optional<int> standardFd(const std::ostream& os) {
    const auto* buf = os.rdbuf();
    if (buf == nullptr) return std::nullopt;
    if (buf == std::cout.rdbuf()) return 1;
    if (buf == std::cerr.rdbuf() || buf == std::clog.rdbuf()) return 2;
    return std::nullopt;
}

bool enabled(ColorMode mode, const std::ostream& os) {
    if (mode == ColorMode::Never) return false;

    const auto fd = standardFd(os);
    if (mode == ColorMode::Always) {
        if (fd && isTerminal(*fd)) (void)prepareTerminal(*fd);
        return true;
    }

    if (!fd || environmentForbidsColor() || !isTerminal(*fd)) return false;
    return prepareTerminal(*fd);
}

} // namespace cmdtree::color
