#include "stanza/logging.hpp"

#include <spdlog/spdlog.h>

namespace Stanza {

    LoggerPtr get_logger(const std::string& name) {
        if (auto logger = spdlog::get(name)) return logger;

        auto logger = spdlog::default_logger()->clone(name);
        try {
            spdlog::register_logger(logger);
        } catch (const spdlog::spdlog_ex&) {
            // Registered by another thread in the meantime.
            if (auto existing = spdlog::get(name)) return existing;
        }
        return logger;
    }

} // namespace Stanza
