#ifndef CATFLEET_MODEL_HPP
#define CATFLEET_MODEL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace catfleet::http::model {
    enum class HttpVersion {
        HTTP_1_1,
        HTTP_2,
    };

    struct Header {
        std::string name_;
        std::string value_;

        bool operator==(const Header&) const = default;
    };

    using Headers = std::vector<Header>;

    struct Request {
        std::string method_ = "GET";
        std::string url_;
        Headers headers_;
        std::string body_;
        HttpVersion version_ = HttpVersion::HTTP_1_1;
    };

    struct Response {
        long status_ = 0;
        Headers headers_;
        std::string body_;
        std::string effective_url_;
        HttpVersion version_ = HttpVersion::HTTP_2;
    };

    [[nodiscard]] std::optional<std::string> find_header(const Headers& headers, std::string_view name);
    [[nodiscard]] std::size_t count_header(const Headers& headers, std::string_view name);

    // Replaces every instance of `name` with a single entry. Returns the previous value, if any.
    std::optional<std::string> set_header(Headers& headers, std::string_view name, std::string value);

    [[nodiscard]] const char* to_string(HttpVersion version);
}  // namespace catfleet::http::model

#endif
