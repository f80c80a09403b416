#pragma once

#include <optional>
#include <string>
#include <string_view>

// ext is without the leading dot and compared case-insensitively
std::optional<std::string> getMimeTypeByExtension(std::string_view ext);

// The extension of the last path element (without the dot), or an empty view
std::string_view getExtension(std::string_view path);

constexpr size_t sniffLength = 512;

// Content type detection from the first (at most) sniffLength bytes of a file, following the
// signatures of https://mimesniff.spec.whatwg.org/. Always returns a valid MIME type and falls back
// to "application/octet-stream".
std::string sniffContentType(std::string_view data);
