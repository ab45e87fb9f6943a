#include "ui_controller.hpp"
#include <glib-unix.h>
#include <signal.h>
#include <algorithm>

namespace Shio {

static const guint SPINNER_INTERVAL_MS = 120;

static bool is_loading(const SessionState& state) {
    return state.stage == Stage::Searching || state.stage == Stage::Resolving ||
           (state.stage == Stage::EpisodeList && state.episodes_loading);
}

static bool is_char(const KeyEvent& key, const char* text) {
    return key.code == KeyCode::Char && key.text == text;
}

UiController::UiController(Session& session, Terminal& terminal)
    : session_(session)
    , terminal_(terminal) {
    session_.on_changed([this]() { on_session_changed(); });
}

UiController::~UiController() {
    stop();
}

bool UiController::start(const std::string& initial_query) {
    if (started_) return true;

    if (!terminal_.open()) {
        return false;
    }
    started_ = true;

    input_watch_ = g_unix_fd_add(terminal_.get_input_fd(), G_IO_IN, on_input_ready, this);
    resize_watch_ = g_unix_signal_add(SIGWINCH, on_resize, this);

    render();

    if (!initial_query.empty()) {
        session_.submit(initial_query);
    }
    return true;
}

void UiController::stop() {
    if (input_watch_) {
        g_source_remove(input_watch_);
        input_watch_ = 0;
    }
    if (resize_watch_) {
        g_source_remove(resize_watch_);
        resize_watch_ = 0;
    }
    if (spinner_timer_) {
        g_source_remove(spinner_timer_);
        spinner_timer_ = 0;
    }
    if (started_) {
        terminal_.close();
        started_ = false;
    }
}

void UiController::on_quit(QuitCallback callback) {
    quit_callbacks_.push_back(std::move(callback));
}

void UiController::request_quit() {
    session_.quit();
}

gboolean UiController::on_input_ready([[maybe_unused]] gint fd,
                                      [[maybe_unused]] GIOCondition condition,
                                      gpointer user_data) {
    auto* self = static_cast<UiController*>(user_data);
    for (const auto& key : self->terminal_.read_keys()) {
        self->handle_key(key);
        if (self->session_.get_state().quit) break;
    }
    return G_SOURCE_CONTINUE;
}

gboolean UiController::on_resize(gpointer user_data) {
    auto* self = static_cast<UiController*>(user_data);
    self->terminal_.resize();
    self->render();
    return G_SOURCE_CONTINUE;
}

gboolean UiController::on_spinner_tick(gpointer user_data) {
    auto* self = static_cast<UiController*>(user_data);
    self->view_.spinner++;
    self->render();
    return G_SOURCE_CONTINUE;
}

void UiController::update_spinner() {
    bool loading = is_loading(session_.get_state());
    if (loading && !spinner_timer_ && started_) {
        spinner_timer_ = g_timeout_add(SPINNER_INTERVAL_MS, on_spinner_tick, this);
    } else if (!loading && spinner_timer_) {
        g_source_remove(spinner_timer_);
        spinner_timer_ = 0;
    }
}

void UiController::on_session_changed() {
    const SessionState& state = session_.get_state();

    if (state.quit) {
        auto callbacks = std::move(quit_callbacks_);
        quit_callbacks_.clear();
        stop();
        for (const auto& callback : callbacks) {
            callback();
        }
        return;
    }

    if (state.stage == Stage::Results && last_stage_ == Stage::Searching) {
        view_.result_cursor = 0;
        view_.result_scroll = 0;
    }

    if (state.stage == Stage::EpisodeList && !state.episodes_loading) {
        if (last_stage_ == Stage::EpisodeList && last_loading_) {
            view_.episode_cursor = 0;
            view_.episode_scroll = 0;
        } else if (last_stage_ != Stage::EpisodeList && state.episode_index) {
            // Coming back from playback: keep the played episode under the cursor
            view_.episode_cursor = *state.episode_index;
        }
    }

    if (state.stage == Stage::Idle && last_stage_ != Stage::Idle) {
        view_.input = state.query;
    }

    last_stage_ = state.stage;
    last_loading_ = state.episodes_loading;

    update_spinner();
    render();
}

void UiController::render() {
    if (!started_) return;

    TermSize size = terminal_.get_size();
    size_t visible = list_capacity(size);
    const SessionState& state = session_.get_state();

    // Persist scroll positions so lists do not jump between frames
    view_.result_scroll = list_offset(view_.result_cursor, view_.result_scroll,
                                      state.results.size(), visible);
    view_.episode_scroll = list_offset(view_.episode_cursor, view_.episode_scroll,
                                       state.episodes.size(), visible);

    terminal_.draw(render_frame(state, view_, size));
}

size_t UiController::list_size() const {
    const SessionState& state = session_.get_state();
    if (state.stage == Stage::Results) return state.results.size();
    if (state.stage == Stage::EpisodeList && !state.episodes_loading) return state.episodes.size();
    return 0;
}

size_t& UiController::active_cursor() {
    if (session_.get_stage() == Stage::EpisodeList) return view_.episode_cursor;
    return view_.result_cursor;
}

void UiController::move_cursor(long delta) {
    size_t count = list_size();
    if (count == 0) return;

    size_t& cursor = active_cursor();
    long target = static_cast<long>(cursor) + delta;
    target = std::max(0L, std::min(target, static_cast<long>(count) - 1));
    cursor = static_cast<size_t>(target);
    render();
}

void UiController::handle_key(const KeyEvent& key) {
    if (key.code == KeyCode::Interrupt) {
        request_quit();
        return;
    }
    if (key.code == KeyCode::Resize) {
        terminal_.resize();
        render();
        return;
    }

    if (view_.editing || session_.get_stage() == Stage::Idle) {
        handle_prompt_key(key);
    } else {
        handle_navigation_key(key);
    }
}

void UiController::handle_prompt_key(const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Char:
            view_.input += key.text;
            break;

        case KeyCode::Backspace:
            if (!view_.input.empty()) {
                const gchar* start = view_.input.c_str();
                const gchar* last = g_utf8_find_prev_char(start, start + view_.input.size());
                view_.input.resize(last ? static_cast<size_t>(last - start) : 0);
            }
            break;

        case KeyCode::Enter: {
            std::string query = view_.input;
            g_autofree gchar* trimmed = g_strstrip(g_strdup(query.c_str()));
            if (!trimmed || *trimmed == '\0') break;
            view_.editing = false;
            session_.submit(query);
            return;
        }

        case KeyCode::Escape:
            if (session_.get_stage() != Stage::Idle) {
                view_.editing = false;
            } else if (!view_.input.empty()) {
                view_.input.clear();
            } else {
                request_quit();
                return;
            }
            break;

        default:
            break;
    }

    render();
}

void UiController::handle_navigation_key(const KeyEvent& key) {
    const SessionState& state = session_.get_state();
    size_t visible = std::max<size_t>(list_capacity(terminal_.get_size()), 1);

    if (is_char(key, "q")) {
        request_quit();
        return;
    }
    if (is_char(key, "/")) {
        view_.editing = true;
        view_.input = state.query;
        render();
        return;
    }

    bool back = key.code == KeyCode::Escape || key.code == KeyCode::Backspace ||
                key.code == KeyCode::Left || is_char(key, "h") || is_char(key, "b");

    switch (state.stage) {
        case Stage::Results:
        case Stage::EpisodeList:
            if (back) {
                session_.back();
            } else if (state.stage == Stage::EpisodeList && state.episodes_loading) {
                break;
            } else if (key.code == KeyCode::Up || is_char(key, "k")) {
                move_cursor(-1);
            } else if (key.code == KeyCode::Down || is_char(key, "j")) {
                move_cursor(1);
            } else if (key.code == KeyCode::PageUp) {
                move_cursor(-static_cast<long>(visible));
            } else if (key.code == KeyCode::PageDown) {
                move_cursor(static_cast<long>(visible));
            } else if (key.code == KeyCode::Home || is_char(key, "g")) {
                move_cursor(-static_cast<long>(list_size()));
            } else if (key.code == KeyCode::End || is_char(key, "G")) {
                move_cursor(static_cast<long>(list_size()));
            } else if (key.code == KeyCode::Enter || key.code == KeyCode::Right || is_char(key, "l")) {
                if (state.stage == Stage::Results) {
                    session_.select_anime(view_.result_cursor);
                } else {
                    session_.select_episode(view_.episode_cursor);
                }
            }
            break;

        case Stage::Searching:
        case Stage::Resolving:
            if (back) session_.cancel();
            break;

        case Stage::ReadyToPlay:
            if (back) {
                session_.back();
            } else if (is_char(key, "n")) {
                session_.play_next();
            } else if (is_char(key, "p")) {
                session_.play_previous();
            } else if (is_char(key, "r")) {
                session_.replay();
            }
            break;

        case Stage::Error:
            if (back) {
                session_.back();
            } else if (is_char(key, "r") || key.code == KeyCode::Enter) {
                session_.retry();
            }
            break;

        case Stage::Idle:
            break;
    }
}

} // namespace Shio
