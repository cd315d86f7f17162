//
// Created by the autopatch developers on 10/12/26.
//

#pragma once

#include <iostream>
#include <string>
#include <source_location> // C++20, but essential for good logging

#include "libap/ui.h"

namespace ap::log {

    // Console diagnostics only. Anything that must survive the run goes to a LogSink.
    inline void print(std::ostream& out, const std::string& level, const std::string& color_code, const std::string& msg) {
        if (ap::ui::is_interactive()) {
            out << color_code << "autopatch :: [" << level << "] :: " << "\033[0m" << msg << std::endl;
        } else {
            out << "autopatch :: [" << level << "] :: " << msg << std::endl;
        }
    }

    inline void ok(const std::string& msg) {
        print(std::cout, "OK", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print(std::cerr, "ER", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print(std::cout, "..", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print(std::cout, "WR", "\033[1;33m", msg); // Bold Yellow
    }

} // namespace ap::log
