#include "frame_renderer.hpp"
#include <glib.h>
#include <algorithm>

namespace Shio {

static const int HEADER_ROWS = 3;   // title, prompt, blank
static const int FOOTER_ROWS = 2;   // message, key help
static const char SPINNER[] = { '|', '/', '-', '\\' };

size_t list_capacity(TermSize size) {
    int rows = size.rows - HEADER_ROWS - FOOTER_ROWS - 1;   // list caption
    return rows > 0 ? static_cast<size_t>(rows) : 0;
}

size_t list_offset(size_t cursor, size_t scroll, size_t count, size_t visible) {
    if (visible == 0 || count <= visible) return 0;

    size_t offset = scroll;
    if (cursor < offset) offset = cursor;
    if (cursor >= offset + visible) offset = cursor - visible + 1;
    offset = std::min(offset, count - visible);
    return offset;
}

static size_t char_width(gunichar c) {
    if (g_unichar_iszerowidth(c)) return 0;
    return g_unichar_iswide(c) ? 2 : 1;
}

size_t display_width(const std::string& text) {
    if (!g_utf8_validate(text.c_str(), static_cast<gssize>(text.size()), nullptr)) {
        return text.size();
    }

    size_t width = 0;
    for (const gchar* p = text.c_str(); *p; p = g_utf8_next_char(p)) {
        width += char_width(g_utf8_get_char(p));
    }
    return width;
}

std::string truncate_text(const std::string& text, size_t max_columns) {
    if (!g_utf8_validate(text.c_str(), static_cast<gssize>(text.size()), nullptr)) {
        return text.substr(0, max_columns);
    }
    if (display_width(text) <= max_columns) {
        return text;
    }

    bool ellipsis = max_columns > 3;
    size_t budget = ellipsis ? max_columns - 3 : max_columns;
    size_t used = 0;
    const gchar* p = text.c_str();
    while (*p) {
        size_t width = char_width(g_utf8_get_char(p));
        if (used + width > budget) break;
        used += width;
        p = g_utf8_next_char(p);
    }

    std::string cut(text.c_str(), p);
    return ellipsis ? cut + "..." : cut;
}

std::string format_result(const SearchResult& result, size_t index) {
    std::string line = std::to_string(index + 1) + ". " + result.title;
    if (result.english_title && *result.english_title != result.title) {
        line += " (" + *result.english_title + ")";
    }
    if (result.episode_count) {
        line += " [" + std::to_string(*result.episode_count) + " eps]";
    }
    if (result.year) {
        line += " " + std::to_string(*result.year);
    }
    line += "  " + result.adapter_id;
    return line;
}

std::string format_episode(const EpisodeRef& episode) {
    std::string line = "Episode " + episode.number;
    if (episode.title) {
        line += ": " + *episode.title;
    }
    return line;
}

static std::string stage_title(const SessionState& state) {
    switch (state.stage) {
        case Stage::Idle: return "Search";
        case Stage::Searching: return "Searching";
        case Stage::Results: return "Results";
        case Stage::EpisodeList: return state.episodes_loading ? "Loading episodes" : "Episodes";
        case Stage::Resolving: return "Resolving stream";
        case Stage::ReadyToPlay: return "Playing";
        case Stage::Error: return "Error";
    }
    return "";
}

static std::string help_line(const SessionState& state, bool editing) {
    if (editing || state.stage == Stage::Idle) {
        return "Enter search  Esc cancel  Ctrl-C quit";
    }

    switch (state.stage) {
        case Stage::Searching:
        case Stage::Resolving:
            return "Esc cancel  / new search  q quit";
        case Stage::Results:
            return "Enter open  j/k move  Esc back  / search  q quit";
        case Stage::EpisodeList:
            if (state.episodes_loading) return "Esc cancel  / new search  q quit";
            return "Enter play  j/k move  Esc back  / search  q quit";
        case Stage::ReadyToPlay:
            return "n next  p previous  r replay  Esc back  / search  q quit";
        case Stage::Error:
            return "r retry  Esc back  / search  q quit";
        default:
            return "";
    }
}

static void add_list(Frame& frame, const std::vector<std::string>& items, size_t cursor,
                     size_t scroll, size_t visible, size_t width) {
    size_t offset = list_offset(cursor, scroll, items.size(), visible);
    size_t end = std::min(items.size(), offset + visible);

    for (size_t i = offset; i < end; i++) {
        bool selected = i == cursor;
        std::string text = (selected ? "> " : "  ") + items[i];
        frame.lines.push_back({truncate_text(text, width),
                               selected ? LineStyle::Selected : LineStyle::Normal});
    }
}

Frame render_frame(const SessionState& state, const ViewState& view, TermSize size) {
    Frame frame;
    size_t width = size.cols > 0 ? static_cast<size_t>(size.cols) : 0;
    size_t visible = list_capacity(size);
    char spinner = SPINNER[view.spinner % G_N_ELEMENTS(SPINNER)];

    frame.lines.push_back({truncate_text("shio | " + stage_title(state), width), LineStyle::Title});

    bool editing = view.editing || state.stage == Stage::Idle;
    if (editing) {
        std::string prompt = "Search: " + view.input;
        frame.lines.push_back({truncate_text(prompt, width), LineStyle::Prompt});
        frame.cursor_row = 1;
        frame.cursor_col = static_cast<int>(std::min<size_t>(
            display_width(prompt), size.cols > 0 ? static_cast<size_t>(size.cols - 1) : 0));
    } else {
        frame.lines.push_back({truncate_text("Search: " + state.query, width), LineStyle::Dim});
    }
    frame.lines.push_back({"", LineStyle::Normal});

    switch (state.stage) {
        case Stage::Idle:
            frame.lines.push_back({"Type an anime title and press Enter.", LineStyle::Dim});
            break;

        case Stage::Searching:
            frame.lines.push_back({truncate_text(std::string(1, spinner) + " Searching for '" +
                                                 state.query + "'...", width), LineStyle::Normal});
            break;

        case Stage::Results: {
            frame.lines.push_back({truncate_text(std::to_string(state.results.size()) +
                                                 " results for '" + state.query + "'", width),
                                   LineStyle::Dim});
            std::vector<std::string> items;
            items.reserve(state.results.size());
            for (size_t i = 0; i < state.results.size(); i++) {
                items.push_back(format_result(state.results[i], i));
            }
            add_list(frame, items, view.result_cursor, view.result_scroll, visible, width);
            break;
        }

        case Stage::EpisodeList: {
            std::string title = state.anime ? state.anime->title : "";
            if (state.episodes_loading) {
                frame.lines.push_back({truncate_text(std::string(1, spinner) +
                                                     " Loading episodes of " + title + "...", width),
                                       LineStyle::Normal});
                break;
            }
            frame.lines.push_back({truncate_text(title + " (" + std::to_string(state.episodes.size()) +
                                                 " episodes)", width), LineStyle::Dim});
            std::vector<std::string> items;
            items.reserve(state.episodes.size());
            for (const auto& episode : state.episodes) {
                items.push_back(format_episode(episode));
            }
            add_list(frame, items, view.episode_cursor, view.episode_scroll, visible, width);
            break;
        }

        case Stage::Resolving: {
            const EpisodeRef* episode = state.current_episode();
            std::string label = episode ? episode->number : "?";
            std::string title = state.anime ? state.anime->title : "";
            frame.lines.push_back({truncate_text(std::string(1, spinner) + " Resolving episode " +
                                                 label + " of " + title + "...", width),
                                   LineStyle::Normal});
            break;
        }

        case Stage::ReadyToPlay: {
            const EpisodeRef* episode = state.current_episode();
            std::string label = episode ? episode->number : "?";
            std::string title = state.anime ? state.anime->title : "";
            frame.lines.push_back({truncate_text("Playing episode " + label + " of " + title, width),
                                   LineStyle::Normal});
            if (state.stream) {
                if (state.stream->provider) {
                    frame.lines.push_back({truncate_text("Source: " + *state.stream->provider, width),
                                           LineStyle::Dim});
                }
                frame.lines.push_back({truncate_text("Stream: " + state.stream->url, width),
                                       LineStyle::Dim});
            }
            if (state.player) {
                frame.lines.push_back({truncate_text("Player pid " + state.player->identifier + ": " +
                                                     state.player->command_line, width),
                                       LineStyle::Dim});
            }
            break;
        }

        case Stage::Error:
            frame.lines.push_back({truncate_text(state.last_error ? state.last_error->describe()
                                                                  : "Unknown error", width),
                                   LineStyle::Error});
            break;
    }

    // Footer pinned to the bottom rows
    int footer_row = std::max(size.rows - FOOTER_ROWS, static_cast<int>(frame.lines.size()));
    while (static_cast<int>(frame.lines.size()) < footer_row) {
        frame.lines.push_back({"", LineStyle::Normal});
    }

    if (state.last_error && state.stage != Stage::Error) {
        frame.lines.push_back({truncate_text(state.last_error->describe(), width), LineStyle::Error});
    } else {
        frame.lines.push_back({"", LineStyle::Normal});
    }
    frame.lines.push_back({truncate_text(help_line(state, view.editing), width), LineStyle::Status});

    return frame;
}

} // namespace Shio
