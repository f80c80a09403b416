#include "test.hpp"

#include "servecontent.hpp"
#include "testutil.hpp"

namespace {
constexpr int64_t modTime = 784111777; // Sun, 06 Nov 1994 08:49:37 GMT
constexpr int64_t modTimeNs = modTime * 1'000'000'000 + 123'456'789;
const std::string content = "hello world";

// GETs f.txt ("hello world") with an ETag of "abc"
Response serve(std::string_view method, const std::vector<std::pair<std::string, std::string>>& headers = {})
{
    MemoryFileTree tree;
    tree.set("f.txt", content, modTimeNs);
    auto file = tree.open("f.txt");
    const TestRequest req(method, "/f.txt", headers);
    auto resp = Response(StatusCode::Ok);
    resp.headers.set("ETag", "\"abc\"");
    serveContent(req.request, resp, "f.txt", modTimeNs, **file);
    return resp;
}
}

TEST_CASE("parseRange")
{
    ByteRange range { 0, 0 };
    TEST_CHECK(parseRange("bytes=0-4", 11, range) == RangeResult::Valid);
    TEST_CHECK(range.offset == 0 && range.length == 5);
    TEST_CHECK(parseRange("bytes=6-", 11, range) == RangeResult::Valid);
    TEST_CHECK(range.offset == 6 && range.length == 5);
    TEST_CHECK(parseRange("bytes=-3", 11, range) == RangeResult::Valid);
    TEST_CHECK(range.offset == 8 && range.length == 3);
    TEST_CHECK(parseRange("bytes=-100", 11, range) == RangeResult::Valid);
    TEST_CHECK(range.offset == 0 && range.length == 11);
    TEST_CHECK(parseRange("bytes=6-100", 11, range) == RangeResult::Valid);
    TEST_CHECK(range.offset == 6 && range.length == 5);

    TEST_CHECK(parseRange("", 11, range) == RangeResult::None);
    TEST_CHECK(parseRange("bytes=11-", 11, range) == RangeResult::Unsatisfiable);
    TEST_CHECK(parseRange("bytes=-0", 11, range) == RangeResult::Unsatisfiable);
    TEST_CHECK(parseRange("bytes=0-0", 0, range) == RangeResult::Unsatisfiable);
    TEST_CHECK(parseRange("bytes=5-4", 11, range) == RangeResult::Invalid);
    TEST_CHECK(parseRange("bytes=0-1,3-4", 11, range) == RangeResult::Invalid);
    TEST_CHECK(parseRange("items=0-4", 11, range) == RangeResult::Invalid);
    TEST_CHECK(parseRange("bytes=a-b", 11, range) == RangeResult::Invalid);
    TEST_CHECK(parseRange("bytes=4", 11, range) == RangeResult::Invalid);
}

TEST_CASE("serveContent GET")
{
    const auto resp = serve("GET");
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.body == content);
    TEST_CHECK(resp.headers.get("Content-Type") == "text/plain; charset=utf-8");
    TEST_CHECK(resp.headers.get("Content-Length") == "11");
    TEST_CHECK(resp.headers.get("Last-Modified") == "Sun, 06 Nov 1994 08:49:37 GMT");
    TEST_CHECK(resp.headers.get("Accept-Ranges") == "bytes");
    TEST_CHECK(resp.headers.get("ETag") == "\"abc\"");
}

TEST_CASE("serveContent HEAD")
{
    const auto resp = serve("HEAD");
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.body.empty());
    TEST_CHECK(resp.headers.get("Content-Length") == "11");
    TEST_CHECK(resp.headers.get("Content-Type") == "text/plain; charset=utf-8");
}

TEST_CASE("serveContent If-None-Match")
{
    for (const auto value : { "\"abc\"", "W/\"abc\"", "\"x\", \"abc\"", "\"x\",W/\"abc\"", "*" }) {
        const auto resp = serve("GET", { { "If-None-Match", value } });
        TEST_CHECK(resp.status == StatusCode::NotModified);
        TEST_CHECK(resp.body.empty());
        TEST_CHECK(resp.headers.get("ETag") == "\"abc\"");
        TEST_CHECK(!resp.headers.contains("Content-Type"));
        TEST_CHECK(!resp.headers.contains("Content-Length"));
        TEST_CHECK(!resp.headers.contains("Last-Modified"));
    }

    const auto other = serve("GET", { { "If-None-Match", "\"other\"" } });
    TEST_CHECK(other.status == StatusCode::Ok);
    TEST_CHECK(other.body == content);

    const auto post = serve("POST", { { "If-None-Match", "\"abc\"" } });
    TEST_CHECK(post.status == StatusCode::PreconditionFailed);
}

TEST_CASE("serveContent If-Modified-Since")
{
    const auto same = serve("GET", { { "If-Modified-Since", "Sun, 06 Nov 1994 08:49:37 GMT" } });
    TEST_CHECK(same.status == StatusCode::NotModified);

    const auto later = serve("GET", { { "If-Modified-Since", "Mon, 07 Nov 1994 08:49:37 GMT" } });
    TEST_CHECK(later.status == StatusCode::NotModified);

    const auto earlier
        = serve("GET", { { "If-Modified-Since", "Sun, 06 Nov 1994 08:49:36 GMT" } });
    TEST_CHECK(earlier.status == StatusCode::Ok);

    const auto invalid = serve("GET", { { "If-Modified-Since", "yesterday" } });
    TEST_CHECK(invalid.status == StatusCode::Ok);

    // Ignored if If-None-Match is present
    const auto both = serve("GET",
        { { "If-None-Match", "\"other\"" },
            { "If-Modified-Since", "Sun, 06 Nov 1994 08:49:37 GMT" } });
    TEST_CHECK(both.status == StatusCode::Ok);
}

TEST_CASE("serveContent If-Match and If-Unmodified-Since")
{
    const auto status = [](std::string_view name, std::string_view value) {
        return serve("GET", { { std::string(name), std::string(value) } }).status;
    };
    TEST_CHECK(status("If-Match", "\"abc\"") == StatusCode::Ok);
    TEST_CHECK(status("If-Match", "*") == StatusCode::Ok);
    TEST_CHECK(status("If-Match", "\"other\"") == StatusCode::PreconditionFailed);
    // Strong comparison
    TEST_CHECK(status("If-Match", "W/\"abc\"") == StatusCode::PreconditionFailed);

    TEST_CHECK(status("If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:37 GMT") == StatusCode::Ok);
    TEST_CHECK(status("If-Unmodified-Since", "Sat, 05 Nov 1994 08:49:37 GMT")
        == StatusCode::PreconditionFailed);
}

TEST_CASE("serveContent Range")
{
    const auto first = serve("GET", { { "Range", "bytes=0-4" } });
    TEST_CHECK(first.status == StatusCode::PartialContent);
    TEST_CHECK(first.body == "hello");
    TEST_CHECK(first.headers.get("Content-Range") == "bytes 0-4/11");
    TEST_CHECK(first.headers.get("Content-Length") == "5");

    const auto suffix = serve("GET", { { "Range", "bytes=-5" } });
    TEST_CHECK(suffix.status == StatusCode::PartialContent);
    TEST_CHECK(suffix.body == "world");
    TEST_CHECK(suffix.headers.get("Content-Range") == "bytes 6-10/11");

    const auto head = serve("HEAD", { { "Range", "bytes=6-" } });
    TEST_CHECK(head.status == StatusCode::PartialContent);
    TEST_CHECK(head.body.empty());
    TEST_CHECK(head.headers.get("Content-Length") == "5");

    const auto unsatisfiable = serve("GET", { { "Range", "bytes=11-" } });
    TEST_CHECK(unsatisfiable.status == StatusCode::RangeNotSatisfiable);
    TEST_CHECK(unsatisfiable.headers.get("Content-Range") == "bytes */11");

    const auto multi = serve("GET", { { "Range", "bytes=0-1,3-4" } });
    TEST_CHECK(multi.status == StatusCode::Ok);
    TEST_CHECK(multi.body == content);
}

TEST_CASE("serveContent If-Range")
{
    const auto matching = serve("GET", { { "Range", "bytes=0-4" }, { "If-Range", "\"abc\"" } });
    TEST_CHECK(matching.status == StatusCode::PartialContent);
    TEST_CHECK(matching.body == "hello");

    const auto stale = serve("GET", { { "Range", "bytes=0-4" }, { "If-Range", "\"old\"" } });
    TEST_CHECK(stale.status == StatusCode::Ok);
    TEST_CHECK(stale.body == content);

    const auto weak = serve("GET", { { "Range", "bytes=0-4" }, { "If-Range", "W/\"abc\"" } });
    TEST_CHECK(weak.status == StatusCode::Ok);

    const auto date = serve("GET",
        { { "Range", "bytes=0-4" }, { "If-Range", "Sun, 06 Nov 1994 08:49:37 GMT" } });
    TEST_CHECK(date.status == StatusCode::PartialContent);

    const auto oldDate = serve("GET",
        { { "Range", "bytes=0-4" }, { "If-Range", "Sat, 05 Nov 1994 08:49:37 GMT" } });
    TEST_CHECK(oldDate.status == StatusCode::Ok);
}

TEST_CASE("serveContent content type")
{
    MemoryFileTree tree;
    tree.set("noext", "<!doctype html>\n<p>hi</p>");
    tree.set("script.js", "ajs\n");

    {
        auto file = tree.open("noext");
        const TestRequest req("GET", "/noext");
        auto resp = Response(StatusCode::Ok);
        serveContent(req.request, resp, "noext", 0, **file);
        TEST_CHECK(resp.headers.get("Content-Type") == "text/html; charset=utf-8");
        // Sniffing must not eat the start of the body
        TEST_CHECK(resp.body == "<!doctype html>\n<p>hi</p>");
        // Unknown modification time
        TEST_CHECK(!resp.headers.contains("Last-Modified"));
    }

    {
        auto file = tree.open("noext");
        const TestRequest req("GET", "/noext");
        auto resp = Response(StatusCode::Ok);
        serveContent(req.request, resp, "noext", 0, **file, false);
        TEST_CHECK(!resp.headers.contains("Content-Type"));
        TEST_CHECK(resp.body == "<!doctype html>\n<p>hi</p>");
    }

    {
        auto file = tree.open("script.js");
        const TestRequest req("GET", "/script.js");
        auto resp = Response(StatusCode::Ok);
        serveContent(req.request, resp, "script.js", 0, **file);
        TEST_CHECK(resp.headers.get("Content-Type") == "text/javascript; charset=utf-8");
    }

    {
        auto file = tree.open("script.js");
        const TestRequest req("GET", "/script.js");
        auto resp = Response(StatusCode::Ok);
        resp.headers.set("Content-Type", "application/x-custom");
        serveContent(req.request, resp, "script.js", 0, **file);
        TEST_CHECK(resp.headers.get("Content-Type") == "application/x-custom");
        TEST_CHECK(resp.headers.getAll("Content-Type").size() == 1);
    }
}

TEST_CASE("serveContent read error")
{
    MemoryFileTree tree;
    tree.set("f.txt", content);
    tree.setReadError(std::make_error_code(std::errc::io_error));
    auto file = tree.open("f.txt");
    const TestRequest req("GET", "/f.txt");
    auto resp = Response(StatusCode::Ok);
    resp.headers.set("ETag", "\"abc\"");
    serveContent(req.request, resp, "f.txt", modTimeNs, **file);
    TEST_CHECK(resp.status == StatusCode::InternalServerError);
    TEST_CHECK(resp.body == "500 Internal Server Error");
    TEST_CHECK(!resp.headers.contains("ETag"));
}
