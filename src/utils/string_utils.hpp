#ifndef CATFLEET_STRING_UTILS_HPP
#define CATFLEET_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace catfleet::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    std::string to_lower(std::string s);

    std::string trim(std::string s);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);
}  // namespace catfleet::string_utils

#endif
