#include <cstdlib>
#include <iostream>

#include "src/config/options.hpp"
#include "src/http/api/api_client.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/utils/logging.hpp"

int main() {
    using namespace catfleet;

    try {
        //
        // Configure
        //

        const config::ClientOptions options = config::load_options_from_env();
        logging::init_logging(options.log_level_);

        http::client::CurlGlobal curl_global;
        spdlog::info("using libcurl {}", curl_global.version());

        if (!options.bearer_token_.has_value()) {
            spdlog::warn("SPACETRADERS_TOKEN not set; requests are unauthenticated");
        }

        //
        // Build
        //

        auto client = http::api::ClientBuilder().with_options(options).validate().build();

        //
        // Report
        //

        const http::api::ServerStatus status = client->get_status();

        spdlog::info("{} ({}) is {}", options.base_url_, status.version_, status.status_);
        spdlog::info("last reset {}; next reset {} ({})", status.reset_date_, status.server_resets_.next_, status.server_resets_.frequency_);
        spdlog::info("{} agents, {} ships, {} systems, {} waypoints", status.stats_.agents_, status.stats_.ships_, status.stats_.systems_,
                     status.stats_.waypoints_);
        for (const auto& announcement : status.announcements_) {
            spdlog::info("announcement: {}", announcement.title_);
        }
    } catch (const catfleet::http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
