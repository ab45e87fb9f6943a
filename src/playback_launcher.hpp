#pragma once

#include "source/source_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Shio {

/**
 * Player command template with {url}, {user_agent} and {referer}
 * placeholders, e.g. "mpv --user-agent={user_agent} {url}"
 */
class PlayerCommand {
public:
    /**
     * Validate and split a template. Fails on unbalanced quoting, unknown or
     * unterminated placeholders and templates without {url}.
     */
    static std::optional<PlayerCommand> parse(const std::string& command_template, Error& error);

    /**
     * Platform default: termux-open under Termux, mpv elsewhere
     */
    static std::string default_template();

    /**
     * Argument vector with placeholders substituted. Missing optional
     * fields become empty; arguments left completely empty are dropped.
     */
    std::vector<std::string> expand(const StreamDescriptor& descriptor) const;

    /**
     * expand() joined with single spaces, for display and logging
     */
    std::string expand_to_string(const StreamDescriptor& descriptor) const;

private:
    std::vector<std::string> argv_;

    static std::string substitute(const std::string& arg, const StreamDescriptor& descriptor);
};

struct PlayerProcess {
    std::string identifier;     // pid as reported by GSubprocess
    std::string command_line;
};

/**
 * Hands a resolved stream to a player
 */
class Launcher {
public:
    virtual ~Launcher() = default;

    /**
     * Start playback and return immediately.
     * @return process info, or std::nullopt with error set to a Launch error
     */
    virtual std::optional<PlayerProcess> launch(const StreamDescriptor& descriptor, Error& error) = 0;
};

/**
 * Starts the configured external player as a detached process.
 * The player's lifetime is not managed beyond the initial spawn.
 */
class PlaybackLauncher : public Launcher {
public:
    explicit PlaybackLauncher(PlayerCommand command);

    std::optional<PlayerProcess> launch(const StreamDescriptor& descriptor, Error& error) override;

    /**
     * One-shot form: parse command_template and launch descriptor with it
     */
    static std::optional<PlayerProcess> launch(const StreamDescriptor& descriptor,
                                               const std::string& command_template,
                                               Error& error);

private:
    PlayerCommand command_;
};

} // namespace Shio
