#include "logging.hpp"
#include <glib.h>
#include <glib/gstdio.h>
#include <cerrno>
#include <cstdio>

namespace Shio {

namespace {

FILE* log_stream = nullptr;
bool debug_enabled = false;
bool writer_installed = false;

GLogWriterOutput write_to_file(GLogLevelFlags log_level,
                               const GLogField* fields,
                               gsize n_fields,
                               gpointer user_data) {
    if (!log_stream) {
        // Only records that abort the process may reach stderr
        if (log_level & G_LOG_FLAG_FATAL) {
            return g_log_writer_default(log_level, fields, n_fields, user_data);
        }
        return G_LOG_WRITER_HANDLED;
    }

    if ((log_level & G_LOG_LEVEL_DEBUG) && !debug_enabled) {
        return G_LOG_WRITER_HANDLED;
    }

    g_autofree gchar* line = g_log_writer_format_fields(log_level, fields, n_fields, FALSE);
    g_autoptr(GDateTime) now = g_date_time_new_now_local();
    g_autofree gchar* stamp = g_date_time_format(now, "%Y-%m-%d %H:%M:%S");

    fprintf(log_stream, "%s %s\n", stamp, line);
    fflush(log_stream);

    return G_LOG_WRITER_HANDLED;
}

} // namespace

bool Logging::init(const std::string& path, bool debug, std::string& error) {
    debug_enabled = debug;
    g_log_set_debug_enabled(debug);

    // GLib allows a single writer per process
    if (!writer_installed) {
        g_log_set_writer_func(write_to_file, nullptr, nullptr);
        writer_installed = true;
    }
    shutdown();

    g_autofree gchar* dir = g_path_get_dirname(path.c_str());
    if (g_mkdir_with_parents(dir, 0755) != 0) {
        int saved_errno = errno;
        error = std::string("Failed to create ") + dir + ": " + g_strerror(saved_errno);
        return false;
    }

    log_stream = g_fopen(path.c_str(), "a");
    if (!log_stream) {
        int saved_errno = errno;
        error = "Failed to open " + path + ": " + g_strerror(saved_errno);
        return false;
    }

    g_info("[Logging] Writing to %s", path.c_str());
    return true;
}

void Logging::shutdown() {
    if (log_stream) {
        fclose(log_stream);
        log_stream = nullptr;
    }
}

} // namespace Shio
