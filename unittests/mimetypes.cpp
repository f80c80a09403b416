#include "test.hpp"

#include "mimetypes.hpp"

using namespace std::literals;

TEST_CASE("getExtension")
{
    TEST_CHECK(getExtension("a.js") == "js");
    TEST_CHECK(getExtension("/d/style.min.css") == "css");
    TEST_CHECK(getExtension("v1.2/noext").empty());
    TEST_CHECK(getExtension("noext").empty());
    TEST_CHECK(getExtension("trailing.").empty());
}

TEST_CASE("getMimeTypeByExtension")
{
    TEST_CHECK(getMimeTypeByExtension("js") == "text/javascript; charset=utf-8");
    TEST_CHECK(getMimeTypeByExtension("css") == "text/css; charset=utf-8");
    TEST_CHECK(getMimeTypeByExtension("PNG") == "image/png");
    TEST_CHECK(getMimeTypeByExtension("Html") == "text/html; charset=utf-8");
    TEST_CHECK(getMimeTypeByExtension("woff2") == "font/woff2");
    TEST_CHECK(!getMimeTypeByExtension("unknownext"));
    TEST_CHECK(!getMimeTypeByExtension(""));
}

TEST_CASE("sniffContentType HTML and XML")
{
    TEST_CHECK(sniffContentType("<!doctype html>\n") == "text/html; charset=utf-8");
    TEST_CHECK(sniffContentType("  \n<HTML lang=\"en\">") == "text/html; charset=utf-8");
    TEST_CHECK(sniffContentType("<p>Hello</p>") == "text/html; charset=utf-8");
    TEST_CHECK(sniffContentType("<?xml version=\"1.0\"?>") == "text/xml; charset=utf-8");
    // Not followed by a tag-terminating byte
    TEST_CHECK(sniffContentType("<pre") == "text/plain; charset=utf-8");
}

TEST_CASE("sniffContentType signatures")
{
    TEST_CHECK(sniffContentType("%PDF-1.7\n") == "application/pdf");
    TEST_CHECK(sniffContentType("\x89PNG\r\n\x1A\n\0\0\0\rIHDR"sv) == "image/png");
    TEST_CHECK(sniffContentType("GIF89a\x01\x00"sv) == "image/gif");
    TEST_CHECK(sniffContentType("\xFF\xD8\xFF\xE0"sv) == "image/jpeg");
    TEST_CHECK(sniffContentType("RIFF\x10\x20\x30\x40WEBPVP8 "sv) == "image/webp");
    TEST_CHECK(sniffContentType("RIFF\x10\x20\x30\x40WAVEfmt "sv) == "audio/wave");
    TEST_CHECK(sniffContentType("PK\x03\x04\x14\x00"sv) == "application/zip");
    TEST_CHECK(sniffContentType("\x1F\x8B\x08\x00"sv) == "application/x-gzip");
    TEST_CHECK(sniffContentType("wOF2\x00\x01"sv) == "font/woff2");
    TEST_CHECK(sniffContentType("\0asm\x01\0\0\0"sv) == "application/wasm");
}

TEST_CASE("sniffContentType fallbacks")
{
    TEST_CHECK(sniffContentType("") == "text/plain; charset=utf-8");
    TEST_CHECK(sniffContentType("ajs\n") == "text/plain; charset=utf-8");
    TEST_CHECK(sniffContentType("tab\tand\r\nnewlines") == "text/plain; charset=utf-8");
    TEST_CHECK(sniffContentType("abc\x01\x02"sv) == "application/octet-stream");

    // Only the first 512 bytes are looked at
    auto data = std::string(512, 'a');
    data.push_back('\0');
    TEST_CHECK(sniffContentType(data) == "text/plain; charset=utf-8");
    data[100] = '\0';
    TEST_CHECK(sniffContentType(data) == "application/octet-stream");
}
