#include "model.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "../../utils/string_utils.hpp"

namespace catfleet::http::model {

    std::optional<std::string> find_header(const Headers& headers, std::string_view name) {
        auto it = std::find_if(headers.begin(), headers.end(), [name](const Header& h) { return string_utils::iequals(h.name_, name); });

        if (it == headers.end()) {
            return std::nullopt;
        }

        return it->value_;
    }

    std::size_t count_header(const Headers& headers, std::string_view name) {
        return static_cast<std::size_t>(std::count_if(headers.begin(), headers.end(), [name](const Header& h) { return string_utils::iequals(h.name_, name); }));
    }

    std::optional<std::string> set_header(Headers& headers, std::string_view name, std::string value) {
        std::optional<std::string> previous = find_header(headers, name);

        std::erase_if(headers, [name](const Header& h) { return string_utils::iequals(h.name_, name); });
        headers.push_back(Header{.name_ = std::string(name), .value_ = std::move(value)});

        return previous;
    }

    const char* to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_1:
                return "HTTP/1.1";
            case HttpVersion::HTTP_2:
                return "HTTP/2";
        }
        return "unknown";
    }
}  // namespace catfleet::http::model
