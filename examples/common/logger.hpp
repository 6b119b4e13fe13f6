#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace rallycode::examples {

    // The CLI validator has already restricted `log_level` to known names.
    inline void configure_logger(const std::string& log_level, bool color) {
        auto& logger = lcr::log::Logger::instance();
        lcr::log::Level lvl = lcr::log::Level::Info;
        if (!lcr::log::parse_level(log_level, lvl)) {
            RC_WARN("Unknown log level '" << log_level << "', using info");
        }
        logger.set_level(lvl);
        logger.enable_color(color);
    }

} // namespace rallycode::examples
