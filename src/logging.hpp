#pragma once

#include <string>

namespace Shio {

/**
 * Routes GLib log output to a file so it never lands on the curses screen.
 * Messages still go through g_warning/g_info/g_debug as usual.
 */
class Logging {
public:
    /**
     * Install the file writer and open the log file, creating the parent
     * directory if needed. The writer stays installed when the file cannot
     * be opened; non-fatal records are then discarded.
     * @return false with error set if the file could not be opened
     */
    static bool init(const std::string& path, bool debug, std::string& error);

    /**
     * Flush and close the log file
     */
    static void shutdown();
};

} // namespace Shio
