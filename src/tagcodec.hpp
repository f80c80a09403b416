#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// A tag is a short, content-derived token that is embedded in a file name, so the URL changes
// whenever the content does: "style.css" -> "style.3nAh0bzDk4.css".
// Tags are base62 ({0-9, a-z, A-Z}), so they need no escaping anywhere.

constexpr size_t tagLength = 10;

// Encodes the first 8 bytes of digest (big-endian) with exactly tagLength base62 digits, least
// significant digit first. digestSize must be at least 8.
std::string makeTag(const uint8_t* digest, size_t digestSize);

bool isTag(std::string_view str);

struct TagSplit {
    std::string tag; // empty if there is none
    std::string name;
};

// Only looks at the last path element. Candidates are, in this order: the last dot-separated
// segment ("name.TAG"), the second to last ("name.TAG.ext") and the one after the first dot
// ("name.TAG.min.js"). If none of them is a tag, the path is returned unchanged.
TagSplit extractTag(std::string_view path);

// Inserts the tag after the first dot of the last path element, so compound extensions like
// ".tar.gz" stay intact. Without a dot the tag is appended as a new extension.
std::string insertTag(std::string_view path, std::string_view tag);
