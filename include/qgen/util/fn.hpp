#pragma once

#include <algorithm>
#include <cctype>
#include <cstring>
#include <qgen/qgen-config.hpp>
#include <qgen/util/macro.hpp>
#include <string>
#include <string_view>


namespace qg {

inline bool streq(const char *first, const char *second)
{
    QG_insist(first and second, "cannot compare a null string");
    return 0 == strcmp(first, second);
}
inline bool strneq(const char *first, const char *second, std::size_t n)
{
    QG_insist(first and second, "cannot compare a null string");
    return 0 == strncmp(first, second, n);
}

/** Checks whether `haystack` contains `needle`, comparing characters without regard to case. */
inline bool contains_insensitive(std::string_view haystack, std::string_view needle)
{
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char lhs, char rhs) {
        return std::toupper(static_cast<unsigned char>(lhs)) == std::toupper(static_cast<unsigned char>(rhs));
    });
    return it != haystack.end() or needle.empty();
}

/** Returns `str` without leading and trailing whitespace. */
inline std::string_view trim(std::string_view str)
{
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)); };
    while (not str.empty() and is_space(str.front())) str.remove_prefix(1);
    while (not str.empty() and is_space(str.back())) str.remove_suffix(1);
    return str;
}

/** Returns `true` iff every character of `s` is whitespace. */
inline bool isspace(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

}
