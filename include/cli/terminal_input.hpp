#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "graphos_types.hpp"

namespace graphos {

// Special key codes. Printable input arrives as InputEvent::Type::Character.
enum Key {
    UP = 1000,
    DOWN,
    LEFT,
    RIGHT,
    BACKSPACE,
    ENTER,
    TAB,
    DEL,
    ESC,
    CTRL_C,
    UNKNOWN
};

struct MouseEvent {
    enum class Button { Left, Middle, Right, WheelUp, WheelDown, None };
    enum class Action { Press, Release, Drag, Move };
    Button button = Button::None;
    Action action = Action::Move;
    CellPos pos;
};

struct InputEvent {
    enum class Type { Key, Character, Mouse, Resize };
    Type type = Type::Key;
    int key = UNKNOWN;
    std::string text;
    MouseEvent mouse;

    static InputEvent make_key(int k) {
        InputEvent e;
        e.type = Type::Key;
        e.key = k;
        return e;
    }
    static InputEvent make_char(const std::string& s) {
        InputEvent e;
        e.type = Type::Character;
        e.text = s;
        return e;
    }
    static InputEvent make_mouse(MouseEvent::Button b, MouseEvent::Action a,
                                 CellPos pos) {
        InputEvent e;
        e.type = Type::Mouse;
        e.mouse.button = b;
        e.mouse.action = a;
        e.mouse.pos = pos;
        return e;
    }
    static InputEvent make_resize() {
        InputEvent e;
        e.type = Type::Resize;
        return e;
    }

    bool is_key(int k) const { return type == Type::Key && key == k; }
    bool is_char(const char* s) const { return type == Type::Character && text == s; }
};

// Turns raw tty bytes into events: arrows and Delete (CSI/SS3), SGR mouse
// reports (ESC [ < b ; x ; y M|m), UTF-8 characters and control keys.
// Bytes of an unfinished sequence stay buffered until more arrive; a lone
// ESC is only reported as Escape when the caller asks to flush.
class InputDecoder {
public:
    void feed(const char* data, std::size_t size);
    void feed(const std::string& bytes) { feed(bytes.data(), bytes.size()); }

    // Next complete event, or nullopt if the buffer holds only a prefix.
    // With flush=true a dangling prefix is resolved (ESC) or dropped.
    std::optional<InputEvent> next(bool flush = false);

    bool pending() const { return !buffer_.empty(); }

private:
    std::optional<InputEvent> parse_escape(bool flush);
    std::string buffer_;
};

} // namespace graphos
