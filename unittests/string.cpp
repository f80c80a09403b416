#include "test.hpp"

#include "http.hpp"
#include "string.hpp"

TEST_CASE("cleanPath")
{
    TEST_CHECK(cleanPath("/") == "/");
    TEST_CHECK(cleanPath("/a.js") == "/a.js");
    TEST_CHECK(cleanPath("//a.js") == "/a.js");
    TEST_CHECK(cleanPath("/d//style.css") == "/d/style.css");
    TEST_CHECK(cleanPath("/d/./style.css") == "/d/style.css");
    TEST_CHECK(cleanPath("/xyz/../a.js") == "/a.js");
    TEST_CHECK(cleanPath("/../../a.js") == "/a.js");
    TEST_CHECK(cleanPath("/d/style.css/") == "/d/style.css/");
    TEST_CHECK(cleanPath("/xyz/../a.js//") == "/a.js/");
    TEST_CHECK(cleanPath("/d/..") == "/");
    TEST_CHECK(cleanPath("/d/../") == "/");
    TEST_CHECK(cleanPath("/.") == "/");
}

TEST_CASE("pathSplit")
{
    TEST_CHECK(pathSplit("d/style.css").first == "d/");
    TEST_CHECK(pathSplit("d/style.css").second == "style.css");
    TEST_CHECK(pathSplit("/a.js").first == "/");
    TEST_CHECK(pathSplit("/a.js").second == "a.js");
    TEST_CHECK(pathSplit("a.js").first.empty());
    TEST_CHECK(pathSplit("a.js").second == "a.js");
    TEST_CHECK(pathSplit("d/").second.empty());
}

TEST_CASE("percentDecode")
{
    TEST_CHECK(percentDecode("/a.js") == "/a.js");
    TEST_CHECK(percentDecode("/with%20space.txt") == "/with space.txt");
    TEST_CHECK(percentDecode("/%61%2Ejs") == "/a.js");
    TEST_CHECK(percentDecode("/%c3%a4.txt") == "/\xc3\xa4.txt");
    TEST_CHECK(percentDecode("%2F") == "/");
    TEST_CHECK(percentDecode("") == "");
    TEST_CHECK(!percentDecode("/%"));
    TEST_CHECK(!percentDecode("/%4"));
    TEST_CHECK(!percentDecode("/%zz"));
    TEST_CHECK(!percentDecode("/a%g1"));

    const auto nul = percentDecode("/a%00b");
    TEST_REQUIRE(nul.has_value());
    TEST_CHECK(nul->size() == 4);
    TEST_CHECK((*nul)[2] == '\0');
}

TEST_CASE("Url::parse")
{
    const auto url = Url::parse("/d/style.css?v=1#top");
    TEST_REQUIRE(url.has_value());
    TEST_CHECK(url->rawPath == "/d/style.css");
    TEST_CHECK(url->path == "/d/style.css");
    TEST_CHECK(url->query == "v=1");

    const auto dots = Url::parse("/xyz/../a.js/");
    TEST_REQUIRE(dots.has_value());
    TEST_CHECK(dots->rawPath == "/xyz/../a.js/");
    TEST_CHECK(dots->path == "/a.js/");
    TEST_CHECK(dots->query.empty());

    const auto absolute = Url::parse("http://example.org/a.js?x");
    TEST_REQUIRE(absolute.has_value());
    TEST_CHECK(absolute->path == "/a.js");
    TEST_CHECK(absolute->query == "x");

    TEST_CHECK(!Url::parse(""));
    TEST_CHECK(!Url::parse("a.js"));
    TEST_CHECK(!Url::parse("http://example.org"));
}

TEST_CASE("Request::parse")
{
    const std::string raw = "GET /a.js HTTP/1.1\r\nHost: localhost\r\nIf-None-Match: \"x\"\r\n\r\n";
    const auto req = Request::parse(raw);
    TEST_REQUIRE(req.has_value());
    TEST_CHECK(req->method == Method::Get);
    TEST_CHECK(req->url.path == "/a.js");
    TEST_CHECK(req->version == "HTTP/1.1");
    TEST_CHECK(req->headers.get("if-none-match") == "\"x\"");
    TEST_CHECK(req->body.empty());

    TEST_CHECK(Request::parse("HEAD / HTTP/1.0\r\n\r\n").has_value());
    TEST_CHECK(!Request::parse("GET /a.js HTTP/2.0\r\n\r\n"));
    TEST_CHECK(!Request::parse("FETCH /a.js HTTP/1.1\r\n\r\n"));
    TEST_CHECK(!Request::parse("GET /a.js HTTP/1.1\r\nNoColon\r\n\r\n"));
}
