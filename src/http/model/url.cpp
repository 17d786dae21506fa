#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>

namespace catfleet::http::model {
    namespace {
        bool valid_scheme(std::string_view s) {
            if (s.empty() || std::isalpha(static_cast<unsigned char>(s.front())) == 0) {
                return false;
            }
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) != 0 || c == '+' || c == '-' || c == '.'; });
        }

        bool has_whitespace(std::string_view s) {
            return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        }

        // Position of the ':' separating host and port, or npos. Skips bracketed IPv6 literals.
        std::size_t port_separator(std::string_view authority) {
            const std::size_t close = authority.rfind(']');
            const std::size_t colon = authority.rfind(':');
            if (colon == std::string_view::npos || (close != std::string_view::npos && colon < close)) {
                return std::string_view::npos;
            }
            return colon;
        }
    }  // namespace

    Url Url::parse(std::string_view text) {
        if (text.empty() || has_whitespace(text)) {
            throw std::invalid_argument("invalid url: '" + std::string(text) + "'");
        }

        Url url;

        if (text.front() == '/') {
            url.path_and_query_ = std::string(text);
            return url;
        }

        const std::size_t scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos || !valid_scheme(text.substr(0, scheme_end))) {
            throw std::invalid_argument("invalid url: '" + std::string(text) + "'");
        }

        url.scheme_ = std::string(text.substr(0, scheme_end));
        std::transform(url.scheme_.begin(), url.scheme_.end(), url.scheme_.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        const std::string_view rest = text.substr(scheme_end + 3);
        const std::size_t authority_end = rest.find_first_of("/?#");
        url.authority_ = std::string(rest.substr(0, authority_end));

        if (url.authority_.empty()) {
            throw std::invalid_argument("url has no authority: '" + std::string(text) + "'");
        }

        if (authority_end != std::string_view::npos) {
            std::string_view pq = rest.substr(authority_end);
            pq = pq.substr(0, pq.find('#'));
            url.path_and_query_ = std::string(pq);
            if (!url.path_and_query_.empty() && url.path_and_query_.front() == '?') {
                url.path_and_query_.insert(0, "/");
            }
        }

        return url;
    }

    std::string Url::path() const { return path_and_query_.substr(0, path_and_query_.find('?')); }

    std::string Url::host() const {
        std::string_view authority = authority_;
        const std::size_t at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        std::string_view host = authority.substr(0, port_separator(authority));
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }
        return std::string(host);
    }

    std::uint16_t Url::port_or(std::uint16_t fallback) const {
        const std::string_view authority = authority_;
        const std::size_t colon = port_separator(authority);
        if (colon == std::string_view::npos || colon + 1 == authority.size()) {
            return fallback;
        }

        const std::string_view digits = authority.substr(colon + 1);
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
        if (ec != std::errc{} || ptr != digits.data() + digits.size() || port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            throw std::invalid_argument("invalid port in authority '" + authority_ + "'");
        }
        return static_cast<std::uint16_t>(port);
    }

    std::string Url::to_string() const {
        std::string out;
        if (!scheme_.empty()) {
            out += scheme_ + "://";
        }
        out += authority_;
        out += path_and_query_;
        return out;
    }
}  // namespace catfleet::http::model
