#pragma once


/*
    --------------------
    Stanza diagnostics
    --------------------
    Stanza logs through spdlog. Every component asks for a named logger
    (`stanza.decoder`, `stanza.formatter`); the first request clones the
    application's default logger under that name, so sinks, pattern and
    level follow whatever the application configured, and the named logger
    can be tuned on its own afterwards (e.g. `SPDLOG_LEVEL=stanza.decoder=debug`
    with `spdlog::cfg::load_env_levels()`).

    What gets logged
        - debug: malformed bodies and decodes that reported errors
        - debug: rejected charsets
        - warn: an error collection running out of budget
*/

#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "stanza/config.hpp"

namespace Stanza {

    using Logger = spdlog::logger;
    using LoggerPtr = std::shared_ptr<Logger>;

    /// @brief Named logger, cloned from the default logger on first use
    [[nodiscard]] STANZA_API LoggerPtr get_logger(const std::string& name);

} // namespace Stanza
