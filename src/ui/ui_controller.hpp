#pragma once

#include "../session.hpp"
#include "frame_renderer.hpp"
#include "terminal.hpp"
#include <glib.h>
#include <functional>
#include <string>
#include <vector>

namespace Shio {

/**
 * Maps key events onto Session transitions and redraws on every change.
 * Never touches the network; pipeline work is started by the Session and
 * completes asynchronously on the main loop.
 */
class UiController {
public:
    using QuitCallback = std::function<void()>;

    UiController(Session& session, Terminal& terminal);
    ~UiController();

    UiController(const UiController&) = delete;
    UiController& operator=(const UiController&) = delete;

    /**
     * Take over the terminal and start watching input.
     * A non-empty initial_query is submitted right away.
     */
    bool start(const std::string& initial_query = "");

    /**
     * Stop watching input and restore the terminal
     */
    void stop();

    void handle_key(const KeyEvent& key);

    void render();

    const ViewState& get_view() const { return view_; }

    /**
     * Called once when the user quits
     */
    void on_quit(QuitCallback callback);

private:
    Session& session_;
    Terminal& terminal_;
    ViewState view_;

    Stage last_stage_ = Stage::Idle;
    bool last_loading_ = false;
    bool started_ = false;

    guint input_watch_ = 0;
    guint resize_watch_ = 0;
    guint spinner_timer_ = 0;
    std::vector<QuitCallback> quit_callbacks_;

    void on_session_changed();
    void update_spinner();

    void handle_prompt_key(const KeyEvent& key);
    void handle_navigation_key(const KeyEvent& key);
    void move_cursor(long delta);
    size_t list_size() const;
    size_t& active_cursor();
    void request_quit();

    static gboolean on_input_ready(gint fd, GIOCondition condition, gpointer user_data);
    static gboolean on_resize(gpointer user_data);
    static gboolean on_spinner_tick(gpointer user_data);
};

} // namespace Shio
