#pragma once

#include "terminal.hpp"

namespace Shio {

/**
 * ncurses implementation of Terminal
 */
class CursesTerminal : public Terminal {
public:
    CursesTerminal();
    ~CursesTerminal() override;

    CursesTerminal(const CursesTerminal&) = delete;
    CursesTerminal& operator=(const CursesTerminal&) = delete;

    bool open() override;
    void close() override;
    TermSize get_size() const override;
    void draw(const Frame& frame) override;
    std::vector<KeyEvent> read_keys() override;
    int get_input_fd() const override;
    void resize() override;

private:
    bool open_ = false;
    bool has_colors_ = false;

    int attributes_for(LineStyle style) const;
};

} // namespace Shio
