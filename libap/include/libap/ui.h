#pragma once

#include <unistd.h> // For isatty and STDOUT_FILENO

namespace ap::ui {

    /**
     * @brief Checks if standard output is connected to an interactive terminal (TTY).
     * @return False under cron or a systemd timer, where colour codes would end up in mail and journals.
     */
    inline bool is_interactive() {
        return isatty(STDOUT_FILENO) != 0;
    }

} // namespace ap::ui
