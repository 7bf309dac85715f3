#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xdcc::utils {

template<typename IntegerT = long long int>
inline auto to_integer(std::string_view s) -> std::optional<IntegerT>
{
    IntegerT value{};
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{} or result.ptr != s.end()) {
        return std::nullopt;
    }

    return value;
};

inline auto trim(std::string_view s) -> std::string_view
{
    while (not s.empty() and std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (not s.empty() and std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

inline auto to_lower(std::string_view s) -> std::string
{
    std::string lowered{s};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

/**
 * @brief Case-insensitive substring search
 */
inline auto contains_nocase(std::string_view haystack, std::string_view needle)
  -> bool
{
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

/**
 * @brief Split by delimiter keeping empty parts
 */
inline auto split(std::string_view s, char delimiter)
  -> std::vector<std::string_view>
{
    std::vector<std::string_view> parts;

    std::size_t begin = 0;
    for (;;) {
        const auto end = s.find(delimiter, begin);
        if (end == std::string_view::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, end - begin));
        begin = end + 1;
    }

    return parts;
}

}  // namespace xdcc::utils
