#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "error.hpp"

#define _CONCAT_NAMES_INNER(a, b) a##b
#define _CONCAT_NAMES(a, b) _CONCAT_NAMES_INNER(a, b)
#define _ASSIGN_OR_RETURN_INNER(tmp, var, val)  \
    auto tmp = val;                             \
    if(!tmp.has_value()) {                      \
        return std::unexpected(tmp.error());    \
    }                                           \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define ASSIGN_OR_RETURN(var, val)                                      \
    _ASSIGN_OR_RETURN_INNER(_CONCAT_NAMES(assign_or_return_tmp, __COUNTER__), var, val)

// Val should be a rvalue.
#define DO_OR_RETURN(val)                               \
    if(auto rt = val; !rt.has_value())                  \
    {                                                   \
        return std::unexpected(std::move(rt).error());  \
    }

// Parse the whole of “s” as a number. The error is a RuntimeError;
// callers re-wrap it into whatever kind of error fits their context.
template<typename NumType>
E<NumType> strToNumber(std::string_view s, int base = 10)
{
    NumType x{};
    auto begin = s.data();
    auto end = s.data() + s.size();
    auto rt = std::from_chars(begin, end, x, base);
    if(rt.ptr == end && rt.ec == std::errc())
    {
        return x;
    }
    if(rt.ec == std::errc::result_out_of_range)
    {
        return std::unexpected(runtimeError("out of range"));
    }
    if(rt.ptr > begin)
    {
        return std::unexpected(runtimeError(
            "Only part of the string can be converted to number"));
    }
    return std::unexpected(runtimeError(
        "Failed to convert string to number"));
}

// Lower case a string in-place.
inline std::string& toLower(std::string& s)
{
    std::transform(s.begin(), s.end(), s.begin(),
    [](unsigned char c){ return std::tolower(c); });
    return s;
}

inline std::string_view lstrip(std::string_view s)
{
    size_t i = 0;
    while(i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    {
        i++;
    }
    return s.substr(i);
}

inline std::string_view rstrip(std::string_view s)
{
    size_t n = s.size();
    while(n > 0 && std::isspace(static_cast<unsigned char>(s[n-1])))
    {
        n--;
    }
    return s.substr(0, n);
}

inline std::string_view strip(std::string_view s)
{
    return rstrip(lstrip(s));
}

// Split “s” at every “delim”. Empty fields are kept, so “$a$$b”
// splits into {"", "a", "", "b"}.
inline std::vector<std::string_view> split(std::string_view s, char delim)
{
    std::vector<std::string_view> parts;
    size_t begin = 0;
    while(true)
    {
        size_t pos = s.find(delim, begin);
        if(pos == std::string_view::npos)
        {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}
