#include "string.hpp"

#include <array>
#include <cassert>

constexpr std::array<char, 256> getToLowerTable()
{
    std::array<char, 256> table = {};
    for (size_t i = 0; i < 256; ++i) {
        table[i] = static_cast<char>(static_cast<uint8_t>(i));
        if (i >= 'A' && i <= 'Z') {
            table[i] -= 'A' - 'a';
        }
    }
    return table;
}

char toLower(char c)
{
    static auto table = getToLowerTable();
    return table[static_cast<uint8_t>(c)];
}

bool ciEqual(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) {
            return false;
        }
    }
    return true;
}

bool isHttpWhitespace(char c)
{
    return c == ' ' || c == '\t';
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isAlphaNum(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || isDigit(c);
}

std::vector<std::string_view> split(std::string_view str, char delim)
{
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < str.size()) {
        const auto delimPos = str.find(delim, i);
        if (delimPos == std::string_view::npos) {
            break;
        }
        parts.push_back(str.substr(i, delimPos - i));
        i = delimPos + 1;
    }
    parts.push_back(str.substr(i));
    return parts;
}

std::string_view httpTrim(std::string_view str)
{
    if (str.empty()) {
        return str;
    }

    size_t start = 0;
    while (start < str.size() && isHttpWhitespace(str[start])) {
        start++;
    }
    if (start == str.size()) {
        return str.substr(start, 0);
    }
    assert(start < str.size());

    auto end = str.size() - 1;
    while (end > start && isHttpWhitespace(str[end])) {
        end--;
    }

    return str.substr(start, end + 1 - start);
}

bool startsWith(std::string_view str, std::string_view start)
{
    return str.substr(0, start.size()) == start;
}

bool endsWith(std::string_view str, std::string_view end)
{
    return str.size() >= end.size() && str.substr(str.size() - end.size()) == end;
}

std::string pathJoin(std::string_view a, std::string_view b)
{
    assert(!a.empty());
    std::string ret(a);
    if (a.back() != '/') {
        ret.push_back('/');
    }
    ret.append(b);
    return ret;
}

std::pair<std::string_view, std::string_view> pathSplit(std::string_view path)
{
    const auto lastSlash = path.rfind('/');
    if (lastSlash == std::string_view::npos) {
        return { std::string_view(), path };
    }
    return { path.substr(0, lastSlash + 1), path.substr(lastSlash + 1) };
}

std::string cleanPath(std::string_view path)
{
    // Same idea as removeDotSegments in http.cpp, but segment-based, so empty segments (repeated
    // slashes) just disappear.
    assert(!path.empty() && path[0] == '/');
    std::vector<std::string_view> segments;
    for (const auto segment : split(path.substr(1), '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else {
            segments.push_back(segment);
        }
    }
    if (segments.empty()) {
        return "/";
    }
    std::string ret = "/" + join(segments, "/");
    if (path.back() == '/') {
        ret.push_back('/');
    }
    return ret;
}

namespace {
std::optional<uint8_t> hexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return std::nullopt;
}
}

std::optional<std::string> percentDecode(std::string_view str)
{
    std::string ret;
    ret.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '%') {
            ret.push_back(str[i]);
            continue;
        }
        if (i + 2 >= str.size()) {
            return std::nullopt;
        }
        const auto hi = hexValue(str[i + 1]);
        const auto lo = hexValue(str[i + 2]);
        if (!hi || !lo) {
            return std::nullopt;
        }
        ret.push_back(static_cast<char>((*hi << 4) | *lo));
        i += 2;
    }
    return ret;
}
