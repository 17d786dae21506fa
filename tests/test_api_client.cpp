#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "http/api/api_client.hpp"
#include "http/error/http_error.hpp"
#include "test_helpers.hpp"

using namespace catfleet;
using namespace std::chrono_literals;

namespace {
    constexpr const char* STATUS_BODY = R"({
        "status": "SpaceTraders is currently online and available to play",
        "version": "v2.1.4",
        "resetDate": "2023-09-30",
        "description": "SpaceTraders is a headless game.",
        "stats": {"agents": 4122, "ships": 28311, "systems": 12000, "waypoints": 80216},
        "leaderboards": {"mostCredits": [], "mostSubmittedCharts": []},
        "serverResets": {"next": "2023-10-14T00:00:00.000Z", "frequency": "fortnightly"},
        "announcements": [{"title": "Server resets", "body": "Every two weeks."}],
        "links": [{"name": "Website", "url": "https://spacetraders.io/"}, {"name": "Discord", "url": "https://discord.com/invite/jh6zurdWk5"}]
    })";

    struct ClientFixture {
        std::shared_ptr<testing::SessionScript> script = std::make_shared<testing::SessionScript>();
        std::shared_ptr<testing::ManualClock> clock = std::make_shared<testing::ManualClock>();

        http::api::ClientBuilder builder() {
            http::api::ClientBuilder b;
            b.with_session_factory(std::make_unique<testing::FakeSessionFactory>(script)).with_clock(clock);
            return b;
        }
    };
}  // namespace

TEST_CASE("get_status parses the server status document", "[client]") {
    ClientFixture f;
    f.script->body_ = STATUS_BODY;
    auto client = f.builder().with_base_url("https://api.spacetraders.io/v2/").build();

    const auto status = client->get_status();

    REQUIRE(status.status_ == "SpaceTraders is currently online and available to play");
    REQUIRE(status.version_ == "v2.1.4");
    REQUIRE(status.reset_date_ == "2023-09-30");
    REQUIRE(status.description_ == "SpaceTraders is a headless game.");
    REQUIRE(status.stats_.agents_ == 4122);
    REQUIRE(status.stats_.waypoints_ == 80216);
    REQUIRE(status.server_resets_.frequency_ == "fortnightly");
    REQUIRE(status.announcements_.size() == 1);
    REQUIRE(status.announcements_[0].title_ == "Server resets");
    REQUIRE(status.links_.size() == 2);
    REQUIRE(status.links_[1].name_ == "Discord");

    REQUIRE(f.script->sent_.size() == 1);
    REQUIRE(f.script->sent_[0].url_ == "https://api.spacetraders.io/v2/");
    REQUIRE(f.script->sent_[0].method_ == "GET");
}

TEST_CASE("get_status tolerates a minimal document", "[client]") {
    ClientFixture f;
    f.script->body_ = R"({"status": "ok", "version": "v2", "resetDate": "2024-01-01", "description": "d"})";
    auto client = f.builder().build();

    const auto status = client->get_status();
    REQUIRE(status.status_ == "ok");
    REQUIRE(status.stats_.agents_ == 0);
    REQUIRE(status.links_.empty());
}

TEST_CASE("get_status throws HttpError on a non-2xx status", "[client]") {
    ClientFixture f;
    f.script->status_ = 503;
    f.script->body_ = R"({"error": {"message": "maintenance"}})";
    auto client = f.builder().build();

    try {
        (void)client->get_status();
        FAIL("expected HttpError");
    } catch (const http::http_error::HttpError& e) {
        REQUIRE(e.status_ == 503);
        REQUIRE(e.url_ == "https://api.spacetraders.io/v2/");
        REQUIRE(e.body_preview_.find("maintenance") != std::string::npos);
    }
}

TEST_CASE("get_status throws HttpError on an unparsable body", "[client]") {
    ClientFixture f;
    f.script->body_ = "<html>not json</html>";
    auto client = f.builder().build();

    REQUIRE_THROWS_AS(client->get_status(), http::http_error::HttpError);
}

TEST_CASE("Built stack applies every layer to each request", "[client][builder]") {
    ClientFixture f;
    auto client = f.builder()
                      .with_base_url("https://127.0.0.1:3000/v2/")
                      .with_bearer_token("tok")
                      .with_extra_headers({{"x-client", "tests"}})
                      .with_user_agent("fleet-test/1")
                      .build();

    const auto resp = client->send("POST", "/my/ships", {{"content-type", "application/json"}}, R"({"shipType":"SHIP_MINING_DRONE"})");
    REQUIRE(resp.status_ == 200);

    const auto& sent = f.script->sent_.at(0);
    REQUIRE(sent.url_ == "https://127.0.0.1:3000/v2/my/ships");
    REQUIRE(sent.method_ == "POST");
    REQUIRE(sent.body_ == R"({"shipType":"SHIP_MINING_DRONE"})");
    REQUIRE(sent.version_ == http::model::HttpVersion::HTTP_2);
    REQUIRE(http::model::find_header(sent.headers_, "authorization") == "Bearer tok");
    REQUIRE(http::model::find_header(sent.headers_, "x-client") == "tests");
    REQUIRE(http::model::find_header(sent.headers_, "user-agent") == "fleet-test/1");
    REQUIRE(http::model::find_header(sent.headers_, "content-type") == "application/json");
}

TEST_CASE("Built stack is rate limited", "[client][builder]") {
    ClientFixture f;
    auto client = f.builder().with_rates(http::limit::Rate(1, 100ms), http::limit::Rate(2, 400ms)).build();

    for (int i = 0; i < 4; ++i) {
        client->send("GET", "/");
    }

    REQUIRE(f.script->sent_.size() == 4);
    REQUIRE(f.clock->sleeps().size() == 1);
    REQUIRE(f.clock->elapsed() == 100ms);
}

TEST_CASE("Builder validation rejects bad options", "[client][builder]") {
    ClientFixture f;

    REQUIRE_THROWS_AS(f.builder().with_base_url("/v2/").validate(), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(f.builder().with_base_url("http://api.spacetraders.io/v2/").validate(), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(f.builder().with_base_url("not a url").validate(), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(f.builder().with_user_agent("").validate(), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(f.builder().with_bearer_token("").validate(), http::http_error::ConfigError);
    REQUIRE(f.script->connects_ == 0);
}
