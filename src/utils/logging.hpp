#ifndef CATFLEET_LOGGING_HPP
#define CATFLEET_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace catfleet::logging {
    // Installs the colored stdout default logger at `level` (trace|debug|info|warn|error|off).
    // Throws http_error::ConfigError on an unknown level.
    void init_logging(const std::string& level);

    // Named logger sharing the default logger's sinks and level. Created on first use.
    std::shared_ptr<spdlog::logger> category_logger(const std::string& name);
}  // namespace catfleet::logging

#endif
