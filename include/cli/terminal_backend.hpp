#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "cli/terminal_input.hpp"
#include "render/frame_renderer.hpp"

namespace graphos {

struct TermSize {
    int rows = 0;
    int cols = 0;
};

// What the run loop needs from a terminal. AnsiTerminal drives a real tty;
// tests substitute a scripted one.
class TerminalBackend {
public:
    virtual ~TerminalBackend() = default;

    virtual TermSize size() const = 0;
    // Waits at most `timeout` for the next input event. A resize is
    // reported as InputEvent::Type::Resize.
    virtual std::optional<InputEvent> poll(std::chrono::milliseconds timeout) = 0;
    // Emits changed cells. Throws GraphError(Terminal) on write failure.
    virtual void write(const std::vector<CellUpdate>& updates) = 0;
};

// Owns the controlling terminal for the lifetime of the object: raw mode,
// alternate screen, hidden cursor and (optionally) SGR mouse reporting.
// The saved state is restored by the destructor, by the terminate handler
// and by the fatal-signal handlers installed in the constructor.
class AnsiTerminal : public TerminalBackend {
public:
    // Throws GraphError(Terminal) when stdin is not a terminal.
    explicit AnsiTerminal(bool mouse = true);
    ~AnsiTerminal() override;

    AnsiTerminal(const AnsiTerminal&) = delete;
    AnsiTerminal& operator=(const AnsiTerminal&) = delete;

    TermSize size() const override;
    std::optional<InputEvent> poll(std::chrono::milliseconds timeout) override;
    void write(const std::vector<CellUpdate>& updates) override;

    // Idempotent.
    void Restore();

private:
    void SetRaw();
    bool read_available();
    void write_all(const std::string& bytes);

    InputDecoder decoder_;
    bool mouse_;
};

// SGR sequence for a pixel's style, e.g. "\x1b[0;1;38;5;6;49m".
std::string sgr_for(const ftxui::Pixel& pixel);

} // namespace graphos
