#pragma once

#include <gio/gio.h>
#include "config.hpp"
#include "session.hpp"

G_BEGIN_DECLS

#define SHIO_TYPE_APPLICATION (shio_application_get_type())

G_DECLARE_FINAL_TYPE(ShioApplication, shio_application, SHIO, APPLICATION, GApplication)

ShioApplication *shio_application_new(void);

/**
 * Exit status set by activate when the terminal could not be taken over
 */
int shio_application_get_exit_status(ShioApplication *app);

G_END_DECLS
