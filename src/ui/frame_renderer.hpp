#pragma once

#include "../session.hpp"
#include "terminal.hpp"
#include <cstddef>
#include <string>

namespace Shio {

/**
 * UI-local state that is not part of the Session: prompt contents,
 * list cursors and scroll offsets, spinner phase.
 */
struct ViewState {
    bool editing = false;
    std::string input;

    size_t result_cursor = 0;
    size_t result_scroll = 0;
    size_t episode_cursor = 0;
    size_t episode_scroll = 0;

    unsigned int spinner = 0;
};

/**
 * Build the screen for a session snapshot. Pure: no I/O, no mutation.
 */
Frame render_frame(const SessionState& state, const ViewState& view, TermSize size);

/**
 * Number of list rows available below the header for a terminal size
 */
size_t list_capacity(TermSize size);

/**
 * First visible row of a list so that cursor stays on screen
 */
size_t list_offset(size_t cursor, size_t scroll, size_t count, size_t visible);

/**
 * Terminal columns taken by text; wide (CJK) characters count as two
 */
size_t display_width(const std::string& text);

/**
 * Cut text to fit max_columns terminal columns, marking the cut with "..."
 */
std::string truncate_text(const std::string& text, size_t max_columns);

std::string format_result(const SearchResult& result, size_t index);
std::string format_episode(const EpisodeRef& episode);

} // namespace Shio
