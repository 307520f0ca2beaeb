// term_utils.hpp — terminal width and tty detection (POSIX)
#pragma once
#include <cstdio>
#include <cstdlib>

#include <unistd.h>
#include <sys/ioctl.h>

namespace io {

inline int get_terminal_width() {
    if (const char* env = std::getenv("COLUMNS")) {
        int c = std::atoi(env); if (c > 0) return c;
    }
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return (int)w.ws_col;
    return 80;
}

inline bool is_tty(std::FILE* f) { return ::isatty(::fileno(f)) != 0; }

} // namespace io
