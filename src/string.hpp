#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// NO. LOCALES.
char toLower(char c);

bool ciEqual(std::string_view a, std::string_view b);

bool isHttpWhitespace(char c);
bool isDigit(char c);
bool isAlphaNum(char c);

std::vector<std::string_view> split(std::string_view str, char delim);

std::string_view httpTrim(std::string_view str);

bool startsWith(std::string_view str, std::string_view start);
bool endsWith(std::string_view str, std::string_view end);

template <typename T = uint64_t>
std::optional<T> parseInt(std::string_view str, int base = 10)
{
    const auto first = str.data();
    const auto last = first + str.size();
    T value;
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc() && res.ptr == last) {
        return value;
    } else {
        return std::nullopt;
    }
}

std::string pathJoin(std::string_view a, std::string_view b);

// Splits into the part up to and including the last slash and the rest (like Go's path.Split).
std::pair<std::string_view, std::string_view> pathSplit(std::string_view path);

// Resolves "." and "..", collapses repeated slashes and keeps a trailing slash if the input had
// one. The input must be absolute. The result is always absolute.
std::string cleanPath(std::string_view path);

// Returns nullopt for malformed escapes
std::optional<std::string> percentDecode(std::string_view str);

template <typename Container>
std::string join(const Container& container, std::string_view delim = ", ")
{
    std::string ret;
    bool first = true;
    for (const auto& elem : container) {
        if (!first) {
            ret.append(delim);
        }
        first = false;
        ret.append(elem);
    }
    return ret;
}
