#include "mimetypes.hpp"

#include <array>
#include <unordered_map>

#include "string.hpp"

std::string_view getExtension(std::string_view path)
{
    const auto lastSlash = path.rfind('/');
    const auto base = lastSlash == std::string_view::npos ? path : path.substr(lastSlash + 1);
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos) {
        return std::string_view();
    }
    return base.substr(dot + 1);
}

std::optional<std::string> getMimeTypeByExtension(std::string_view ext)
{
    // https://developer.mozilla.org/en-US/docs/Web/HTTP/Basics_of_HTTP/MIME_types/Common_types
    // Textual types carry a charset, because that's what browsers want for assets.
    static const std::unordered_map<std::string, std::string> mimeTypes {
        { "aac", "audio/aac" },
        { "avif", "image/avif" },
        { "avi", "video/x-msvideo" },
        { "bin", "application/octet-stream" },
        { "bmp", "image/bmp" },
        { "bz", "application/x-bzip" },
        { "bz2", "application/x-bzip2" },
        { "css", "text/css; charset=utf-8" },
        { "csv", "text/csv; charset=utf-8" },
        { "eot", "application/vnd.ms-fontobject" },
        { "epub", "application/epub+zip" },
        { "gz", "application/gzip" },
        { "gif", "image/gif" },
        { "htm", "text/html; charset=utf-8" },
        { "html", "text/html; charset=utf-8" },
        { "ico", "image/vnd.microsoft.icon" },
        { "ics", "text/calendar; charset=utf-8" },
        { "jpeg", "image/jpeg" },
        { "jpg", "image/jpeg" },
        { "js", "text/javascript; charset=utf-8" },
        { "json", "application/json" },
        { "jsonld", "application/ld+json" },
        { "map", "application/json" },
        { "md", "text/markdown; charset=utf-8" },
        { "mid", "audio/midi" },
        { "midi", "audio/midi" },
        { "mjs", "text/javascript; charset=utf-8" },
        { "mp3", "audio/mpeg" },
        { "mp4", "video/mp4" },
        { "mpeg", "video/mpeg" },
        { "oga", "audio/ogg" },
        { "ogv", "video/ogg" },
        { "ogx", "application/ogg" },
        { "opus", "audio/opus" },
        { "otf", "font/otf" },
        { "png", "image/png" },
        { "pdf", "application/pdf" },
        { "rar", "application/vnd.rar" },
        { "rtf", "application/rtf" },
        { "svg", "image/svg+xml" },
        { "tar", "application/x-tar" },
        { "tif", "image/tiff" },
        { "tiff", "image/tiff" },
        { "ttf", "font/ttf" },
        { "txt", "text/plain; charset=utf-8" },
        { "wasm", "application/wasm" },
        { "wav", "audio/wav" },
        { "weba", "audio/webm" },
        { "webm", "video/webm" },
        { "webmanifest", "application/manifest+json" },
        { "webp", "image/webp" },
        { "woff", "font/woff" },
        { "woff2", "font/woff2" },
        { "xhtml", "application/xhtml+xml" },
        { "xml", "text/xml; charset=utf-8" },
        { "zip", "application/zip" },
        { "7z", "application/x-7z-compressed" },
    };
    if (ext.empty()) {
        return std::nullopt;
    }
    std::string lower(ext);
    for (auto& c : lower) {
        c = toLower(c);
    }
    const auto it = mimeTypes.find(lower);
    if (it == mimeTypes.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {
struct Signature {
    std::string_view mask; // empty means all 0xFF
    std::string_view pattern;
    std::string_view contentType;
};

using namespace std::literals;

// mimesniff 6.1 - 6.3, in the order they are checked. The trailing NULs in some patterns are part
// of the pattern, hence the sv literals.
const std::array signatures {
    Signature { "\xFF\xFF\xFF\xFF\xFF"sv, "%PDF-"sv, "application/pdf" },
    Signature { ""sv, "%!PS-Adobe-"sv, "application/postscript" },
    Signature { ""sv, "\xFE\xFF"sv, "text/plain; charset=utf-16be" },
    Signature { ""sv, "\xFF\xFE"sv, "text/plain; charset=utf-16le" },
    Signature { ""sv, "\xEF\xBB\xBF"sv, "text/plain; charset=utf-8" },
    Signature { ""sv, "\x00\x00\x01\x00"sv, "image/x-icon" },
    Signature { ""sv, "\x00\x00\x02\x00"sv, "image/x-icon" },
    Signature { ""sv, "BM"sv, "image/bmp" },
    Signature { ""sv, "GIF87a"sv, "image/gif" },
    Signature { ""sv, "GIF89a"sv, "image/gif" },
    Signature { "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF\xFF\xFF"sv,
        "RIFF\x00\x00\x00\x00WEBPVP"sv, "image/webp" },
    Signature { ""sv, "\x89PNG\x0D\x0A\x1A\x0A"sv, "image/png" },
    Signature { ""sv, "\xFF\xD8\xFF"sv, "image/jpeg" },
    Signature { "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
        "RIFF\x00\x00\x00\x00WAVE"sv, "audio/wave" },
    Signature { "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF"sv,
        "RIFF\x00\x00\x00\x00" "AVI "sv, "video/avi" },
    Signature { ""sv, "OggS\x00"sv, "application/ogg" },
    Signature { ""sv, "ID3"sv, "audio/mpeg" },
    Signature { ""sv, "\x1A\x45\xDF\xA3"sv, "video/webm" },
    Signature { ""sv, "wOFF"sv, "font/woff" },
    Signature { ""sv, "wOF2"sv, "font/woff2" },
    Signature { ""sv, "\x1F\x8B\x08"sv, "application/x-gzip" },
    Signature { ""sv, "PK\x03\x04"sv, "application/zip" },
    Signature { ""sv, "Rar!\x1A\x07\x00"sv, "application/x-rar-compressed" },
    Signature { ""sv, "Rar!\x1A\x07\x01\x00"sv, "application/x-rar-compressed" },
    Signature { ""sv, "\x00\x61\x73\x6D"sv, "application/wasm" },
};

bool matchSignature(std::string_view data, const Signature& sig)
{
    if (data.size() < sig.pattern.size()) {
        return false;
    }
    for (size_t i = 0; i < sig.pattern.size(); ++i) {
        const auto mask = sig.mask.empty() ? '\xFF' : sig.mask[i];
        if ((data[i] & mask) != sig.pattern[i]) {
            return false;
        }
    }
    return true;
}

bool isTagTerminating(char c)
{
    return c == ' ' || c == '>';
}

// HTML tags are case-insensitive and have to be followed by a space or '>'
bool matchHtmlTag(std::string_view data, std::string_view tag)
{
    if (data.size() < tag.size() + 1) {
        return false;
    }
    return ciEqual(data.substr(0, tag.size()), tag) && isTagTerminating(data[tag.size()]);
}

bool isWhitespaceByte(char c)
{
    return c == '\t' || c == '\n' || c == '\x0C' || c == '\r' || c == ' ';
}

// mimesniff 7.1: a binary data byte is one of 0x00-0x08, 0x0B, 0x0E-0x1A or 0x1C-0x1F
bool isBinaryDataByte(char ch)
{
    const auto c = static_cast<unsigned char>(ch);
    return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) || (c >= 0x1C && c <= 0x1F);
}
}

std::string sniffContentType(std::string_view data)
{
    data = data.substr(0, sniffLength);

    // HTML and XML may be preceded by whitespace
    auto trimmed = data;
    while (!trimmed.empty() && isWhitespaceByte(trimmed.front())) {
        trimmed.remove_prefix(1);
    }
    static constexpr std::array htmlTags = { "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT",
        "<IFRAME", "<H1", "<DIV", "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY",
        "<BR", "<P", "<!--" };
    for (const auto tag : htmlTags) {
        if (matchHtmlTag(trimmed, tag)) {
            return "text/html; charset=utf-8";
        }
    }
    if (startsWith(trimmed, "<?xml")) {
        return "text/xml; charset=utf-8";
    }

    for (const auto& sig : signatures) {
        if (matchSignature(data, sig)) {
            return std::string(sig.contentType);
        }
    }

    for (const auto c : data) {
        if (isBinaryDataByte(c)) {
            return "application/octet-stream";
        }
    }
    return "text/plain; charset=utf-8";
}
