#include "test.hpp"

#include <atomic>
#include <thread>

#include "assethandler.hpp"
#include "testutil.hpp"

namespace {
struct Fixture {
    Fixture(AssetServer::Options options = {})
        : server(makeTree(dir), options)
        , handler(server)
    {
    }

    static std::unique_ptr<FileTree> makeTree(const TempDir& dir)
    {
        dir.write("a.js", "ajs\n");
        dir.write("d/style.css", "style\n");
        dir.write("b.min.js", "b\n");
        dir.write("d/sub/noext", "<!doctype html>\n");
        return std::make_unique<DirFileTree>(dir.path());
    }

    Response get(std::string_view target,
        const std::vector<std::pair<std::string, std::string>>& headers = {}) const
    {
        return request("GET", target, headers);
    }

    Response request(std::string_view method, std::string_view target,
        const std::vector<std::pair<std::string, std::string>>& headers = {}) const
    {
        const TestRequest req(method, target, headers);
        return handler(req.request);
    }

    TempDir dir;
    AssetServer server;
    AssetHandler handler;
};

const auto ajsTag = hashTag("ajs\n");
const auto styleTag = hashTag("style\n");
}

TEST_CASE("AssetHandler untagged")
{
    const Fixture fx;
    const auto resp = fx.get("/a.js");
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.body == "ajs\n");
    TEST_CHECK(resp.headers.get("Cache-Control") == "public, max-age=60");
    TEST_CHECK(resp.headers.get("ETag") == "\"" + ajsTag + "\"");
    TEST_CHECK(resp.headers.get("Content-Type") == "text/javascript; charset=utf-8");
    TEST_CHECK(resp.headers.get("Content-Length") == "4");
}

TEST_CASE("AssetHandler tagged")
{
    const Fixture fx;
    const auto resp = fx.get("/a." + ajsTag + ".js");
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.body == "ajs\n");
    TEST_CHECK(resp.headers.get("Cache-Control") == "public, max-age=31536000, immutable");
    TEST_CHECK(resp.headers.get("ETag") == "\"" + ajsTag + "\"");

    const auto minJs = fx.get("/b." + hashTag("b\n") + ".min.js");
    TEST_CHECK(minJs.status == StatusCode::Ok);
    TEST_CHECK(minJs.body == "b\n");
    TEST_CHECK(minJs.headers.get("Content-Type") == "text/javascript; charset=utf-8");

    const auto style = fx.get("/d/style." + styleTag + ".css");
    TEST_CHECK(style.status == StatusCode::Ok);
    TEST_CHECK(style.body == "style\n");

    const auto noext = fx.get("/d/sub/noext." + hashTag("<!doctype html>\n"));
    TEST_CHECK(noext.status == StatusCode::Ok);
    TEST_CHECK(noext.headers.get("Content-Type") == "text/html; charset=utf-8");
}

TEST_CASE("AssetHandler wrong tag")
{
    const Fixture fx;
    const auto wrong = ajsTag == "0000000000" ? std::string("1111111111") : "0000000000";
    const auto resp = fx.get("/a." + wrong + ".js");
    TEST_CHECK(resp.status == StatusCode::NotFound);
    TEST_CHECK(resp.body == "404 Not Found");
    TEST_CHECK(!resp.headers.contains("ETag"));

    // Never redirected either
    TEST_CHECK(fx.get("/a." + wrong + ".js/").status == StatusCode::NotFound);
    // A tag of some other file
    TEST_CHECK(fx.get("/a." + styleTag + ".js").status == StatusCode::NotFound);
}

TEST_CASE("AssetHandler If-None-Match")
{
    const Fixture fx;
    const auto resp = fx.get("/a.js", { { "If-None-Match", "\"" + ajsTag + "\"" } });
    TEST_CHECK(resp.status == StatusCode::NotModified);
    TEST_CHECK(resp.body.empty());
    TEST_CHECK(resp.headers.get("Cache-Control") == "public, max-age=60");
    TEST_CHECK(resp.headers.get("ETag") == "\"" + ajsTag + "\"");

    const auto tagged
        = fx.get("/a." + ajsTag + ".js", { { "If-None-Match", "\"" + ajsTag + "\"" } });
    TEST_CHECK(tagged.status == StatusCode::NotModified);
    TEST_CHECK(tagged.headers.get("Cache-Control") == "public, max-age=31536000, immutable");

    const auto stale = fx.get("/a.js", { { "If-None-Match", "\"" + styleTag + "\"" } });
    TEST_CHECK(stale.status == StatusCode::Ok);
    TEST_CHECK(stale.body == "ajs\n");
}

TEST_CASE("AssetHandler trailing slash")
{
    const Fixture fx;
    const auto resp = fx.get("/d/style.css/");
    TEST_CHECK(resp.status == StatusCode::PermanentRedirect);
    TEST_CHECK(resp.headers.get("Location") == "../style.css");
    TEST_CHECK(resp.body.find("../style.css") != std::string::npos);

    const auto query = fx.get("/d/style.css/?v=1&x=2");
    TEST_CHECK(query.status == StatusCode::PermanentRedirect);
    TEST_CHECK(query.headers.get("Location") == "../style.css?v=1&x=2");

    const auto tagged = fx.get("/d/style." + styleTag + ".css/");
    TEST_CHECK(tagged.status == StatusCode::PermanentRedirect);
    TEST_CHECK(tagged.headers.get("Location") == "../style." + styleTag + ".css");

    const auto head = fx.request("HEAD", "/d/style.css/");
    TEST_CHECK(head.status == StatusCode::PermanentRedirect);
    TEST_CHECK(head.headers.get("Location") == "../style.css");
    TEST_CHECK(head.body.empty());

    // Missing files are not redirected
    TEST_CHECK(fx.get("/d/missing.css/").status == StatusCode::NotFound);
}

TEST_CASE("AssetHandler not found and method not allowed")
{
    const Fixture fx;
    TEST_CHECK(fx.get("/").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/..").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/d").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/d/").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/d/sub").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/missing.js").status == StatusCode::NotFound);

    const auto post = fx.request("POST", "/a.js");
    TEST_CHECK(post.status == StatusCode::MethodNotAllowed);
    TEST_CHECK(post.headers.get("Allow") == "GET, HEAD");
    TEST_CHECK(post.body == "405 Method Not Allowed");
    TEST_CHECK(fx.request("DELETE", "/a.js").status == StatusCode::MethodNotAllowed);
}

TEST_CASE("AssetHandler path canonicalization")
{
    const Fixture fx;
    TEST_CHECK(fx.get("/xyz/../a.js").body == "ajs\n");
    TEST_CHECK(fx.get("/d//style.css").body == "style\n");
    TEST_CHECK(fx.get("/d/./style.css").body == "style\n");
    TEST_CHECK(fx.get("/../../a.js").body == "ajs\n");

    // Decoded before canonicalization
    TEST_CHECK(fx.get("/%61.js").body == "ajs\n");
    TEST_CHECK(fx.get("/d%2Fstyle.css").body == "style\n");
    TEST_CHECK(fx.get("/%2E%2E/a.js").body == "ajs\n");

    TEST_CHECK(fx.get("/a%2.js").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/a%zz.js").status == StatusCode::NotFound);
    TEST_CHECK(fx.get("/a.js%00").status == StatusCode::NotFound);
}

TEST_CASE("AssetHandler HEAD and ranges")
{
    const Fixture fx;
    const auto head = fx.request("HEAD", "/a.js");
    TEST_CHECK(head.status == StatusCode::Ok);
    TEST_CHECK(head.body.empty());
    TEST_CHECK(head.headers.get("Content-Length") == "4");
    TEST_CHECK(head.headers.get("ETag") == "\"" + ajsTag + "\"");

    const auto range = fx.get("/d/style." + styleTag + ".css", { { "Range", "bytes=1-3" } });
    TEST_CHECK(range.status == StatusCode::PartialContent);
    TEST_CHECK(range.body == "tyl");
    TEST_CHECK(range.headers.get("Content-Range") == "bytes 1-3/6");
}

TEST_CASE("AssetHandler no-cache")
{
    const Fixture fx(AssetServer::Options { .noCache = true });
    const auto untagged = fx.get("/a.js");
    TEST_CHECK(untagged.status == StatusCode::Ok);
    TEST_CHECK(untagged.headers.get("Cache-Control") == "no-cache");

    const auto tagged = fx.get("/a." + ajsTag + ".js");
    TEST_CHECK(tagged.status == StatusCode::Ok);
    TEST_CHECK(tagged.headers.get("Cache-Control") == "no-cache");

    TEST_CHECK(fx.get("/a." + styleTag + ".js").status == StatusCode::NotFound);
}

TEST_CASE("AssetHandler keeps caller Content-Type")
{
    const Fixture fx;
    const TestRequest req("GET", "/d/sub/noext");
    auto resp = Response(StatusCode::Ok);
    resp.headers.set("Content-Type", "text/x-template");
    resp.headers.set("X-Custom", "1");
    fx.handler.serve(req.request, resp);
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.headers.get("Content-Type") == "text/x-template");
    TEST_CHECK(resp.headers.get("X-Custom") == "1");
    TEST_CHECK(resp.body == "<!doctype html>\n");

    // Errors replace the response
    const TestRequest missing("GET", "/missing");
    auto missingResp = Response(StatusCode::Ok);
    missingResp.headers.set("Content-Type", "text/x-template");
    fx.handler.serve(missing.request, missingResp);
    TEST_CHECK(missingResp.status == StatusCode::NotFound);
    TEST_CHECK(missingResp.headers.get("Content-Type") == "text/plain; charset=utf-8");
}

TEST_CASE("AssetHandler internal errors")
{
    auto tree = std::make_unique<MemoryFileTree>();
    auto treePtr = tree.get();
    tree->set("a.js", "ajs\n");
    AssetServer server(std::move(tree));
    const AssetHandler handler(server);

    treePtr->setOpenError(std::make_error_code(std::errc::permission_denied));
    const TestRequest req("GET", "/a.js");
    const auto resp = handler(req.request);
    TEST_CHECK(resp.status == StatusCode::InternalServerError);
    TEST_CHECK(resp.body == "500 Internal Server Error");
    TEST_CHECK(!resp.headers.contains("ETag"));

    treePtr->setOpenError(std::nullopt);
    TEST_CHECK(handler(req.request).status == StatusCode::Ok);
}

TEST_CASE("AssetHandler large files")
{
    TempDir dir;
    // Several times the size of a single hashing read
    std::string script;
    while (script.size() < 100'000) {
        script += "console.log(" + std::to_string(script.size()) + ");\n";
    }
    std::string blob(100'003, '\0');
    for (size_t i = 0; i < blob.size(); ++i) {
        blob[i] = static_cast<char>((i * 31 + 7) % 256);
    }
    dir.write("big.js", script);
    dir.write("d/blob", blob);
    AssetServer server(std::make_unique<DirFileTree>(dir.path()));
    const AssetHandler handler(server);

    const auto get = [&handler](std::string_view target) {
        const TestRequest req("GET", target);
        return handler(req.request);
    };

    const std::pair<std::string, std::string> files[] = { { "/big.js", script },
        { "/d/blob", blob } };
    for (const auto& [path, content] : files) {
        const auto etag = "\"" + hashTag(content) + "\"";
        // Cache miss, then cache hit
        for (int i = 0; i < 2; ++i) {
            const auto resp = get(path);
            TEST_CHECK(resp.status == StatusCode::Ok);
            TEST_CHECK(resp.body.size() == content.size());
            TEST_CHECK(resp.body == content);
            TEST_CHECK(resp.headers.get("Content-Length") == std::to_string(content.size()));
            TEST_CHECK(resp.headers.get("ETag") == etag);
        }
    }

    const auto tagged = get("/big." + hashTag(script) + ".js");
    TEST_CHECK(tagged.status == StatusCode::Ok);
    TEST_CHECK(tagged.body == script);
    TEST_CHECK(tagged.headers.get("Content-Type") == "text/javascript; charset=utf-8");

    const auto taggedBlob = get("/d/blob." + hashTag(blob));
    TEST_CHECK(taggedBlob.status == StatusCode::Ok);
    TEST_CHECK(taggedBlob.body == blob);
    TEST_CHECK(taggedBlob.headers.get("Content-Type") == "application/octet-stream");
}

TEST_CASE("AssetHandler body always matches ETag under concurrent replacement")
{
    TempDir dir;
    const auto content = [](int seq) { return "asset version " + std::to_string(seq) + "\n"; };
    dir.write("a.js", content(0));
    AssetServer server(std::make_unique<DirFileTree>(dir.path()));
    const AssetHandler handler(server);

    std::atomic<bool> done { false };
    std::atomic<size_t> mismatches { 0 };
    std::atomic<size_t> failures { 0 };
    std::atomic<size_t> responses { 0 };

    std::vector<std::thread> clients;
    for (int i = 0; i < 4; ++i) {
        clients.emplace_back([&]() {
            int lastSeq = 0;
            while (!done.load()) {
                const TestRequest req("GET", "/a.js");
                const auto resp = handler(req.request);
                const auto etag = resp.headers.get("ETag");
                if (resp.status != StatusCode::Ok || !etag || etag->size() < 2) {
                    failures++;
                    continue;
                }
                if ("\"" + hashTag(resp.body) + "\"" != *etag) {
                    mismatches++;
                }
                const auto seq = std::stoi(resp.body.substr(std::string("asset version ").size()));
                if (seq < lastSeq) {
                    mismatches++;
                }
                lastSeq = seq;
                responses++;
            }
        });
    }

    for (int seq = 1; seq <= 200; ++seq) {
        dir.replace("a.js", content(seq), 1'000'000 + seq);
    }
    done = true;
    for (auto& client : clients) {
        client.join();
    }

    TEST_CHECK(mismatches.load() == 0);
    TEST_CHECK(failures.load() == 0);
    TEST_CHECK(responses.load() > 0);

    const TestRequest req("GET", "/a.js");
    const auto latest = handler(req.request);
    TEST_CHECK(latest.body == content(200));
    TEST_CHECK(latest.headers.get("ETag") == "\"" + hashTag(content(200)) + "\"");
}

TEST_CASE("errorResponse")
{
    TEST_CHECK(errorResponse(AssetErrc::NotFound).status == StatusCode::NotFound);
    TEST_CHECK(errorResponse(std::make_error_code(std::errc::no_such_file_or_directory)).status
        == StatusCode::NotFound);
    TEST_CHECK(errorResponse(AssetErrc::Internal).status == StatusCode::InternalServerError);
    const auto denied = errorResponse(std::make_error_code(std::errc::permission_denied));
    TEST_CHECK(denied.status == StatusCode::InternalServerError);
    TEST_CHECK(denied.body == "500 Internal Server Error");
}

TEST_CASE("stripPrefix")
{
    const Fixture fx;
    const auto handler = stripPrefix("/sub", fx.handler);
    const auto get = [&handler](std::string_view target) {
        const TestRequest req("GET", target);
        return handler(req.request);
    };

    const auto resp = get("/sub/a.js");
    TEST_CHECK(resp.status == StatusCode::Ok);
    TEST_CHECK(resp.body == "ajs\n");

    TEST_CHECK(get("/sub/d/style." + styleTag + ".css").body == "style\n");
    TEST_CHECK(get("/a.js").status == StatusCode::NotFound);
    TEST_CHECK(get("/subway/a.js").status == StatusCode::NotFound);
    TEST_CHECK(get("/sub").status == StatusCode::NotFound);
    TEST_CHECK(get("/sub/").status == StatusCode::NotFound);

    // The relative redirect resolves to /sub/d/style.css on the client
    const auto redirect = get("/sub/d/style.css/?v=1");
    TEST_CHECK(redirect.status == StatusCode::PermanentRedirect);
    TEST_CHECK(redirect.headers.get("Location") == "../style.css?v=1");

    const auto slashHandler = stripPrefix("/sub/", fx.handler);
    const TestRequest req("GET", "/sub/d/style.css");
    TEST_CHECK(slashHandler(req.request).body == "style\n");
    const TestRequest outside("GET", "/subway/a.js");
    TEST_CHECK(slashHandler(outside.request).status == StatusCode::NotFound);
}
