#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

#include "../http/error/http_error.hpp"
#include "string_utils.hpp"

namespace catfleet::logging {
    namespace {
        constexpr const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ %n: %v";

        std::mutex registry_mutex;
    }  // namespace

    void init_logging(const std::string& level) {
        const auto parsed = spdlog::level::from_str(string_utils::to_lower(level));

        // from_str falls back to "off" for anything it does not know.
        if (parsed == spdlog::level::off && string_utils::to_lower(level) != "off") {
            throw http::http_error::ConfigError("unknown log level '" + level + "'");
        }

        std::lock_guard<std::mutex> lock(registry_mutex);

        spdlog::drop("catfleet");
        auto logger = spdlog::stdout_color_mt("catfleet");
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(parsed);
        spdlog::set_default_logger(logger);
        spdlog::set_level(parsed);
    }

    std::shared_ptr<spdlog::logger> category_logger(const std::string& name) {
        std::lock_guard<std::mutex> lock(registry_mutex);

        if (auto existing = spdlog::get(name)) {
            return existing;
        }

        auto base = spdlog::default_logger();
        auto logger = std::make_shared<spdlog::logger>(name, base->sinks().begin(), base->sinks().end());
        logger->set_level(base->level());
        logger->set_pattern(LOG_PATTERN);
        spdlog::register_logger(logger);
        return logger;
    }
}  // namespace catfleet::logging
