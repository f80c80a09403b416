#include "tagcodec.hpp"

#include <array>
#include <cassert>

#include "string.hpp"

namespace {
constexpr std::string_view alphabet
    = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
static_assert(alphabet.size() == 62);

constexpr auto npos = std::string_view::npos;

std::string withoutSegment(std::string_view dir, std::string_view base, size_t dot, size_t end)
{
    std::string name(dir);
    name.append(base.substr(0, dot));
    if (end != npos) {
        name.append(base.substr(end));
    }
    return name;
}

// Segment between the dot at position dot and the next dot (or the end)
std::string_view segmentAfter(std::string_view base, size_t dot, size_t& end)
{
    end = base.find('.', dot + 1);
    return base.substr(dot + 1, end == npos ? npos : end - dot - 1);
}
}

std::string makeTag(const uint8_t* digest, size_t digestSize)
{
    assert(digestSize >= 8);
    uint64_t n = 0;
    for (size_t i = 0; i < 8; ++i) {
        n = (n << 8) | digest[i];
    }
    std::string tag(tagLength, '0');
    for (size_t i = 0; i < tagLength; ++i) {
        tag[i] = alphabet[n % alphabet.size()];
        n /= alphabet.size();
    }
    return tag;
}

bool isTag(std::string_view str)
{
    if (str.size() != tagLength) {
        return false;
    }
    for (const auto c : str) {
        if (!isAlphaNum(c)) {
            return false;
        }
    }
    return true;
}

TagSplit extractTag(std::string_view path)
{
    const auto [dir, base] = pathSplit(path);

    const auto last = base.rfind('.');
    if (last == npos) {
        return { "", std::string(path) };
    }

    size_t end = npos;
    if (const auto seg = segmentAfter(base, last, end); isTag(seg)) {
        return { std::string(seg), withoutSegment(dir, base, last, end) };
    }

    if (last == 0) {
        return { "", std::string(path) };
    }
    const auto prev = base.rfind('.', last - 1);
    if (prev == npos) {
        return { "", std::string(path) };
    }
    if (const auto seg = segmentAfter(base, prev, end); isTag(seg)) {
        return { std::string(seg), withoutSegment(dir, base, prev, end) };
    }

    const auto first = base.find('.');
    if (first < prev) {
        if (const auto seg = segmentAfter(base, first, end); isTag(seg)) {
            return { std::string(seg), withoutSegment(dir, base, first, end) };
        }
    }
    return { "", std::string(path) };
}

std::string insertTag(std::string_view path, std::string_view tag)
{
    const auto [dir, base] = pathSplit(path);
    std::string tagged(dir);
    const auto first = base.find('.');
    if (first == npos) {
        // name.xxxxxxxxxx
        tagged.append(base);
        tagged.push_back('.');
        tagged.append(tag);
    } else {
        // name.xxxxxxxxxx.ext(.ext)*
        tagged.append(base.substr(0, first + 1));
        tagged.append(tag);
        tagged.append(base.substr(first));
    }
    return tagged;
}
