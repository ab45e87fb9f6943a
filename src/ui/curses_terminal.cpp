#include "curses_terminal.hpp"
#include <glib.h>
#include <ncurses.h>
#include <unistd.h>
#include <clocale>

namespace Shio {

enum ColorPair {
    PAIR_TITLE = 1,
    PAIR_SELECTED,
    PAIR_ERROR,
    PAIR_STATUS,
};

CursesTerminal::CursesTerminal() = default;

CursesTerminal::~CursesTerminal() {
    close();
}

bool CursesTerminal::open() {
    if (open_) return true;

    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        g_warning("[Terminal] stdin/stdout is not a terminal");
        return false;
    }

    setlocale(LC_ALL, "");
    if (!initscr()) {
        g_warning("[Terminal] Failed to initialize curses");
        return false;
    }

    raw();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    has_colors_ = has_colors();
    if (has_colors_) {
        start_color();
        use_default_colors();
        init_pair(PAIR_TITLE, COLOR_CYAN, -1);
        init_pair(PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
        init_pair(PAIR_ERROR, COLOR_RED, -1);
        init_pair(PAIR_STATUS, COLOR_YELLOW, -1);
    }

    open_ = true;
    return true;
}

void CursesTerminal::close() {
    if (!open_) return;
    curs_set(1);
    endwin();
    open_ = false;
}

TermSize CursesTerminal::get_size() const {
    TermSize size;
    if (open_) {
        getmaxyx(stdscr, size.rows, size.cols);
    }
    return size;
}

int CursesTerminal::attributes_for(LineStyle style) const {
    switch (style) {
        case LineStyle::Title:
            return A_BOLD | (has_colors_ ? COLOR_PAIR(PAIR_TITLE) : 0);
        case LineStyle::Prompt:
            return A_BOLD;
        case LineStyle::Selected:
            return has_colors_ ? (COLOR_PAIR(PAIR_SELECTED) | A_BOLD) : (A_REVERSE | A_BOLD);
        case LineStyle::Dim:
            return A_DIM;
        case LineStyle::Error:
            return A_BOLD | (has_colors_ ? COLOR_PAIR(PAIR_ERROR) : 0);
        case LineStyle::Status:
            return has_colors_ ? COLOR_PAIR(PAIR_STATUS) : A_DIM;
        case LineStyle::Normal:
            break;
    }
    return A_NORMAL;
}

void CursesTerminal::draw(const Frame& frame) {
    if (!open_) return;

    erase();
    int rows = getmaxy(stdscr);
    int cols = getmaxx(stdscr);

    for (int row = 0; row < rows && row < static_cast<int>(frame.lines.size()); row++) {
        const FrameLine& line = frame.lines[row];
        int attrs = attributes_for(line.style);

        attron(attrs);
        mvaddstr(row, 0, line.text.c_str());
        if (line.style == LineStyle::Selected) {
            // Fill the rest of the row so the highlight spans the width
            int y, x;
            getyx(stdscr, y, x);
            if (y == row) {
                for (; x < cols; x++) addch(' ');
            }
        }
        attroff(attrs);
    }

    if (frame.cursor_row >= 0 && frame.cursor_row < rows) {
        curs_set(1);
        move(frame.cursor_row, frame.cursor_col < cols ? frame.cursor_col : cols - 1);
    } else {
        curs_set(0);
    }

    refresh();
}

std::vector<KeyEvent> CursesTerminal::read_keys() {
    std::vector<KeyEvent> keys;
    if (!open_) return keys;

    wint_t ch;
    int rc;
    while ((rc = get_wch(&ch)) != ERR) {
        if (rc == KEY_CODE_YES) {
            switch (ch) {
                case KEY_UP: keys.push_back(KeyEvent::key(KeyCode::Up)); break;
                case KEY_DOWN: keys.push_back(KeyEvent::key(KeyCode::Down)); break;
                case KEY_LEFT: keys.push_back(KeyEvent::key(KeyCode::Left)); break;
                case KEY_RIGHT: keys.push_back(KeyEvent::key(KeyCode::Right)); break;
                case KEY_PPAGE: keys.push_back(KeyEvent::key(KeyCode::PageUp)); break;
                case KEY_NPAGE: keys.push_back(KeyEvent::key(KeyCode::PageDown)); break;
                case KEY_HOME: keys.push_back(KeyEvent::key(KeyCode::Home)); break;
                case KEY_END: keys.push_back(KeyEvent::key(KeyCode::End)); break;
                case KEY_ENTER: keys.push_back(KeyEvent::key(KeyCode::Enter)); break;
                case KEY_BACKSPACE: keys.push_back(KeyEvent::key(KeyCode::Backspace)); break;
                case KEY_RESIZE: keys.push_back(KeyEvent::key(KeyCode::Resize)); break;
                default: break;
            }
            continue;
        }

        switch (ch) {
            case '\n':
            case '\r':
                keys.push_back(KeyEvent::key(KeyCode::Enter));
                break;
            case 27:
                keys.push_back(KeyEvent::key(KeyCode::Escape));
                break;
            case 127:
            case 8:
                keys.push_back(KeyEvent::key(KeyCode::Backspace));
                break;
            case 3:
                keys.push_back(KeyEvent::key(KeyCode::Interrupt));
                break;
            default:
                if (g_unichar_isprint(static_cast<gunichar>(ch))) {
                    gchar buf[8] = {0};
                    gint len = g_unichar_to_utf8(static_cast<gunichar>(ch), buf);
                    keys.push_back(KeyEvent::character(std::string(buf, len)));
                }
                break;
        }
    }

    return keys;
}

int CursesTerminal::get_input_fd() const {
    return STDIN_FILENO;
}

void CursesTerminal::resize() {
    if (!open_) return;
    endwin();
    refresh();
}

} // namespace Shio
