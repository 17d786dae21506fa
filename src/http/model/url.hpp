#ifndef CATFLEET_URL_HPP
#define CATFLEET_URL_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace catfleet::http::model {
    // Request target split the way HTTP/2 pseudo-headers see it. Empty members are absent.
    struct Url {
        std::string scheme_;
        std::string authority_;
        std::string path_and_query_;

        // Accepts absolute-form ("https://host:port/p?q") and origin-form ("/p?q") targets.
        // Throws std::invalid_argument on anything else.
        static Url parse(std::string_view text);

        [[nodiscard]] bool is_absolute() const { return !scheme_.empty() && !authority_.empty(); }
        [[nodiscard]] std::string path() const;
        [[nodiscard]] std::string host() const;
        [[nodiscard]] std::uint16_t port_or(std::uint16_t fallback) const;
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Url&) const = default;
    };
}  // namespace catfleet::http::model

#endif
