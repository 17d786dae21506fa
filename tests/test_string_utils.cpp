#include <catch2/catch.hpp>

#include <string>

#include "utils/string_utils.hpp"

using namespace catfleet;

TEST_CASE("ieq_prefix matches case-insensitively", "[strings]") {
    const std::string line = "http/2 200";
    REQUIRE(string_utils::ieq_prefix(line.c_str(), line.size(), "HTTP/"));
    REQUIRE_FALSE(string_utils::ieq_prefix(line.c_str(), 3, "HTTP/"));
    REQUIRE_FALSE(string_utils::ieq_prefix("content-type", 12, "HTTP/"));
}

TEST_CASE("ieq_prefix handles bytes outside ASCII", "[strings]") {
    const std::string line = "\xC3\xA9tag: x";
    REQUIRE_FALSE(string_utils::ieq_prefix(line.c_str(), line.size(), "HTTP/"));
    REQUIRE(string_utils::ieq_prefix(line.c_str(), line.size(), "\xC3\xA9"));
}

TEST_CASE("trim and iequals ignore surrounding space and case", "[strings]") {
    REQUIRE(string_utils::trim("  User-Agent \r\n") == "User-Agent");
    REQUIRE(string_utils::iequals("User-Agent", "user-agent"));
    REQUIRE_FALSE(string_utils::iequals("User-Agent", "user-agents"));
}
