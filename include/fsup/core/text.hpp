#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace fsup::text {

inline std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

inline bool is_blank(std::string_view value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/// True when the optional input is absent or only whitespace
inline bool is_missing(const std::optional<std::string>& value) {
    return !value.has_value() || is_blank(*value);
}

} // namespace fsup::text
