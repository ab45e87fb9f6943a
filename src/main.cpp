#include "application.hpp"
#include <clocale>

int main(int argc, char *argv[]) {
    // ncurses needs the locale for wide character input and output
    setlocale(LC_ALL, "");

    g_autoptr(ShioApplication) app = shio_application_new();
    int status = g_application_run(G_APPLICATION(app), argc, argv);

    if (status == 0) {
        status = shio_application_get_exit_status(app);
    }
    return status;
}
