#include "cli/terminal_input.hpp"

#include <cstdlib>

namespace graphos {

namespace {

// Length of a UTF-8 sequence from its lead byte; 0 for a stray
// continuation byte.
std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool is_final_byte(char c) {
    return c >= 0x40 && c <= 0x7E;
}

} // namespace

void InputDecoder::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

std::optional<InputEvent> InputDecoder::next(bool flush) {
    if (buffer_.empty()) return std::nullopt;

    unsigned char c = static_cast<unsigned char>(buffer_[0]);
    if (c == '\x1b') {
        return parse_escape(flush);
    }

    if (c == 3) {
        buffer_.erase(0, 1);
        return InputEvent::make_key(CTRL_C);
    } else if (c == 127 || c == 8) { // Backspace on Mac/Linux
        buffer_.erase(0, 1);
        return InputEvent::make_key(BACKSPACE);
    } else if (c == '\n' || c == '\r') {
        buffer_.erase(0, 1);
        return InputEvent::make_key(ENTER);
    } else if (c == '\t') {
        buffer_.erase(0, 1);
        return InputEvent::make_key(TAB);
    } else if (c < 0x20) {
        buffer_.erase(0, 1);
        return InputEvent::make_key(UNKNOWN);
    }

    std::size_t len = utf8_length(c);
    if (len == 0) {
        buffer_.erase(0, 1);
        return InputEvent::make_key(UNKNOWN);
    }
    // Every byte after the lead must be 10xxxxxx; drop a broken lead byte
    // and decode what follows on its own.
    for (std::size_t i = 1; i < len && i < buffer_.size(); ++i) {
        if ((static_cast<unsigned char>(buffer_[i]) & 0xC0) != 0x80) {
            buffer_.erase(0, 1);
            return InputEvent::make_key(UNKNOWN);
        }
    }
    if (buffer_.size() < len) {
        if (flush) {
            buffer_.clear();
            return InputEvent::make_key(UNKNOWN);
        }
        return std::nullopt;
    }
    std::string ch = buffer_.substr(0, len);
    buffer_.erase(0, len);
    return InputEvent::make_char(ch);
}

std::optional<InputEvent> InputDecoder::parse_escape(bool flush) {
    if (buffer_.size() == 1) {
        if (!flush) return std::nullopt;
        buffer_.clear();
        return InputEvent::make_key(ESC);
    }

    char kind = buffer_[1];
    if (kind == 'O') { // SS3, sent by keypads in application mode
        if (buffer_.size() < 3) {
            if (!flush) return std::nullopt;
            buffer_.clear();
            return InputEvent::make_key(UNKNOWN);
        }
        char k = buffer_[2];
        buffer_.erase(0, 3);
        switch (k) {
            case 'A': return InputEvent::make_key(UP);
            case 'B': return InputEvent::make_key(DOWN);
            case 'C': return InputEvent::make_key(RIGHT);
            case 'D': return InputEvent::make_key(LEFT);
            default: return InputEvent::make_key(UNKNOWN);
        }
    }

    if (kind != '[') {
        // ESC followed by something else: report Escape, keep the rest.
        buffer_.erase(0, 1);
        return InputEvent::make_key(ESC);
    }

    // CSI: find the final byte.
    std::size_t end = 2;
    while (end < buffer_.size() && !is_final_byte(buffer_[end])) ++end;
    if (end >= buffer_.size()) {
        if (!flush) return std::nullopt;
        buffer_.clear();
        return InputEvent::make_key(UNKNOWN);
    }
    // SGR mouse reports start with '<' which is itself not a final byte.
    std::string params = buffer_.substr(2, end - 2);
    char final_byte = buffer_[end];
    buffer_.erase(0, end + 1);

    if (!params.empty() && params[0] == '<' && (final_byte == 'M' || final_byte == 'm')) {
        int b = 0, x = 0, y = 0;
        const char* p = params.c_str() + 1;
        char* next_p = nullptr;
        b = static_cast<int>(std::strtol(p, &next_p, 10));
        if (*next_p != ';') return InputEvent::make_key(UNKNOWN);
        x = static_cast<int>(std::strtol(next_p + 1, &next_p, 10));
        if (*next_p != ';') return InputEvent::make_key(UNKNOWN);
        y = static_cast<int>(std::strtol(next_p + 1, &next_p, 10));

        CellPos pos{x - 1, y - 1};
        using Button = MouseEvent::Button;
        using Action = MouseEvent::Action;
        if (b & 64) {
            return InputEvent::make_mouse((b & 1) ? Button::WheelDown : Button::WheelUp,
                                          Action::Press, pos);
        }
        Button button = Button::None;
        switch (b & 3) {
            case 0: button = Button::Left; break;
            case 1: button = Button::Middle; break;
            case 2: button = Button::Right; break;
            default: button = Button::None; break;
        }
        Action action = Action::Press;
        if (final_byte == 'm') {
            action = Action::Release;
        } else if (b & 32) {
            action = (button == Button::None) ? Action::Move : Action::Drag;
        }
        return InputEvent::make_mouse(button, action, pos);
    }

    switch (final_byte) {
        case 'A': return InputEvent::make_key(UP);
        case 'B': return InputEvent::make_key(DOWN);
        case 'C': return InputEvent::make_key(RIGHT);
        case 'D': return InputEvent::make_key(LEFT);
        case '~':
            if (params == "3") return InputEvent::make_key(DEL);
            return InputEvent::make_key(UNKNOWN);
        default:
            return InputEvent::make_key(UNKNOWN);
    }
}

} // namespace graphos
