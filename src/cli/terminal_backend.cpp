#include "cli/terminal_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include "ftxui/screen/color.hpp"
#include "ftxui/screen/terminal.hpp"

namespace graphos {

namespace {

const char kEnterScreen[] = "\x1b[?1049h\x1b[?25l\x1b[2J";
const char kEnableMouse[] = "\x1b[?1000h\x1b[?1002h\x1b[?1006h";
const char kLeaveScreen[] =
    "\x1b[?1006l\x1b[?1002l\x1b[?1000l\x1b[0m\x1b[?25h\x1b[?1049l";

// Process-wide copy of the cooked-mode settings so signal handlers can
// restore them without touching the AnsiTerminal object.
struct termios g_saved_termios;
volatile std::sig_atomic_t g_raw_active = 0;
volatile std::sig_atomic_t g_resized = 0;
std::terminate_handler g_previous_terminate = nullptr;

// Async-signal-safe: only write(2) and tcsetattr(3).
void restore_terminal_state() {
    if (!g_raw_active) return;
    g_raw_active = 0;
    ssize_t ignored = ::write(STDOUT_FILENO, kLeaveScreen, sizeof(kLeaveScreen) - 1);
    (void)ignored;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_saved_termios);
}

void on_fatal_signal(int sig) {
    restore_terminal_state();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

void on_resize_signal(int) {
    g_resized = 1;
}

void on_terminate() {
    restore_terminal_state();
    if (g_previous_terminate) {
        g_previous_terminate();
    }
    std::abort();
}

} // namespace

std::string sgr_for(const ftxui::Pixel& pixel) {
    std::string s = "\x1b[0";
    if (pixel.bold) s += ";1";
    if (pixel.dim) s += ";2";
    if (pixel.underlined) s += ";4";
    if (pixel.blink) s += ";5";
    if (pixel.inverted) s += ";7";
    s += ";" + pixel.foreground_color.Print(false);
    s += ";" + pixel.background_color.Print(true);
    s += "m";
    return s;
}

AnsiTerminal::AnsiTerminal(bool mouse) : mouse_(mouse) {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &g_saved_termios) != 0) {
        throw GraphError(GraphErrc::Terminal, "stdin is not a terminal");
    }
    SetRaw();
    g_raw_active = 1;

    g_previous_terminate = std::set_terminate(on_terminate);
    for (int sig : {SIGTERM, SIGHUP, SIGSEGV, SIGABRT}) {
        std::signal(sig, on_fatal_signal);
    }
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_resize_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, nullptr);  // no SA_RESTART: poll() returns EINTR

    std::string init = kEnterScreen;
    if (mouse_) init += kEnableMouse;
    try {
        write_all(init);
    } catch (const GraphError&) {
        Restore();
        throw;
    }
}

AnsiTerminal::~AnsiTerminal() {
    Restore();
}

void AnsiTerminal::SetRaw() {
    struct termios raw = g_saved_termios;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        throw GraphError(GraphErrc::Terminal,
                         std::string("Failed to enter raw mode: ") + std::strerror(errno));
    }
}

void AnsiTerminal::Restore() {
    restore_terminal_state();
    std::signal(SIGWINCH, SIG_DFL);
}

TermSize AnsiTerminal::size() const {
    ftxui::Dimensions dim = ftxui::Terminal::Size();
    return {dim.dimy, dim.dimx};
}

// Reads whatever is waiting on stdin into the decoder. Returns false on
// EINTR/EAGAIN.
bool AnsiTerminal::read_available() {
    char buf[256];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return false;
        throw GraphError(GraphErrc::Terminal,
                         std::string("Failed to read input: ") + std::strerror(errno));
    }
    if (n == 0) {
        throw GraphError(GraphErrc::Terminal, "Input closed");
    }
    decoder_.feed(buf, static_cast<std::size_t>(n));
    return true;
}

std::optional<InputEvent> AnsiTerminal::poll(std::chrono::milliseconds timeout) {
    if (g_resized) {
        g_resized = 0;
        return InputEvent::make_resize();
    }
    if (auto ev = decoder_.next()) return ev;

    struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int r = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(0, timeout.count())));
    if (r < 0) {
        if (errno != EINTR) {
            throw GraphError(GraphErrc::Terminal,
                             std::string("poll failed: ") + std::strerror(errno));
        }
        if (g_resized) {
            g_resized = 0;
            return InputEvent::make_resize();
        }
        return std::nullopt;
    }
    if (r == 0) {
        // Nothing new: a buffered lone ESC is a real Escape key.
        return decoder_.next(true);
    }
    if (!read_available()) return std::nullopt;
    if (auto ev = decoder_.next()) return ev;

    // An incomplete escape sequence: give the rest a moment to arrive.
    if (decoder_.pending()) {
        struct pollfd more{STDIN_FILENO, POLLIN, 0};
        if (::poll(&more, 1, 25) > 0) {
            read_available();
            return decoder_.next();
        }
        return decoder_.next(true);
    }
    return std::nullopt;
}

void AnsiTerminal::write(const std::vector<CellUpdate>& updates) {
    if (updates.empty()) return;
    std::string out;
    out.reserve(updates.size() * 16);
    std::string style;
    int next_x = -1;
    int next_y = -1;
    for (const CellUpdate& u : updates) {
        if (u.x != next_x || u.y != next_y) {
            out += "\x1b[" + std::to_string(u.y + 1) + ";" + std::to_string(u.x + 1) + "H";
        }
        std::string sgr = sgr_for(u.pixel);
        if (sgr != style) {
            out += sgr;
            style = sgr;
        }
        out += u.pixel.character.empty() ? std::string(" ") : u.pixel.character;
        next_x = u.x + 1;
        next_y = u.y;
    }
    out += "\x1b[0m";
    write_all(out);
}

void AnsiTerminal::write_all(const std::string& bytes) {
    std::size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(STDOUT_FILENO, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw GraphError(GraphErrc::Terminal,
                             std::string("Failed to write to terminal: ") + std::strerror(errno));
        }
        off += static_cast<std::size_t>(n);
    }
}

} // namespace graphos
