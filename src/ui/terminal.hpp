#pragma once

#include <string>
#include <vector>

namespace Shio {

struct TermSize {
    int rows = 24;
    int cols = 80;
};

enum class KeyCode {
    Char,       // printable text in KeyEvent::text
    Enter,
    Escape,
    Backspace,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Home,
    End,
    Interrupt,  // Ctrl-C
    Resize,
};

struct KeyEvent {
    KeyCode code = KeyCode::Char;
    std::string text;   // UTF-8, only for KeyCode::Char

    static KeyEvent character(const std::string& text) {
        return KeyEvent{KeyCode::Char, text};
    }
    static KeyEvent key(KeyCode code) {
        return KeyEvent{code, ""};
    }
};

enum class LineStyle {
    Normal,
    Title,
    Prompt,
    Selected,
    Dim,
    Error,
    Status,
};

struct FrameLine {
    std::string text;
    LineStyle style = LineStyle::Normal;
};

/**
 * One full screen worth of content
 */
struct Frame {
    std::vector<FrameLine> lines;
    int cursor_row = -1;      // -1 hides the cursor
    int cursor_col = 0;
};

/**
 * Terminal capability consumed by the UI controller.
 * Keeps the controller independent from the curses backend.
 */
class Terminal {
public:
    virtual ~Terminal() = default;

    /**
     * Take over the screen (alternate buffer, raw input)
     */
    virtual bool open() = 0;

    /**
     * Restore the terminal
     */
    virtual void close() = 0;

    virtual TermSize get_size() const = 0;

    /**
     * Replace the screen contents with frame
     */
    virtual void draw(const Frame& frame) = 0;

    /**
     * Drain pending input without blocking
     */
    virtual std::vector<KeyEvent> read_keys() = 0;

    /**
     * File descriptor that becomes readable when input is pending
     */
    virtual int get_input_fd() const = 0;

    /**
     * Re-query the window size after SIGWINCH
     */
    virtual void resize() = 0;
};

} // namespace Shio
