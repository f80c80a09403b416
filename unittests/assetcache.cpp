#include "test.hpp"

#include <atomic>
#include <thread>

#include "assetcache.hpp"
#include "testutil.hpp"

namespace {
MemoryFileTree* makeTree(std::unique_ptr<FileTree>& owner)
{
    auto tree = std::make_unique<MemoryFileTree>();
    auto ptr = tree.get();
    owner = std::move(tree);
    return ptr;
}

std::string readAll(File& file)
{
    std::string content;
    char buffer[64];
    while (true) {
        const auto n = file.read(buffer, sizeof(buffer));
        if (!n || *n == 0) {
            break;
        }
        content.append(buffer, *n);
    }
    return content;
}
}

TEST_CASE("AssetServer resolve")
{
    std::unique_ptr<FileTree> owner;
    auto tree = makeTree(owner);
    tree->set("a.js", "ajs\n", 5'000'000'123);
    tree->set("d/style.css", "style\n");
    AssetServer server(std::move(owner));

    auto asset = server.resolve("a.js");
    TEST_REQUIRE(asset.hasValue());
    TEST_CHECK(asset->info.tag == hashTag("ajs\n"));
    TEST_CHECK(asset->info.size == 4);
    TEST_CHECK(asset->info.modTimeNs == 5'000'000'123);
    TEST_CHECK(asset->info.contentType == "text/javascript; charset=utf-8");
    // Positioned at the start after hashing
    TEST_CHECK(readAll(*asset->content) == "ajs\n");

    const auto style = server.resolve("d/style.css");
    TEST_REQUIRE(style.hasValue());
    TEST_CHECK(style->info.tag == hashTag("style\n"));
    TEST_CHECK(style->info.contentType == "text/css; charset=utf-8");
    TEST_CHECK(server.cache().size() == 2);
}

TEST_CASE("AssetServer tags are independent of the instance")
{
    TempDir dir;
    dir.write("a.js", "ajs\n");
    dir.write("d/style.css", "style\n");

    AssetServer first(std::make_unique<DirFileTree>(dir.path()));
    AssetServer second(std::make_unique<DirFileTree>(dir.path()));
    const auto a = first.lookup("d/style.css");
    const auto b = second.lookup("d/style.css");
    TEST_REQUIRE(a.hasValue());
    TEST_REQUIRE(b.hasValue());
    TEST_CHECK(a->tag == b->tag);
    TEST_CHECK(a->tag == hashTag("style\n"));
    // Separate caches
    TEST_CHECK(first.cache().size() == 1);
    TEST_CHECK(second.cache().size() == 1);
}

TEST_CASE("AssetServer lookup only stats cached files")
{
    std::unique_ptr<FileTree> owner;
    auto tree = makeTree(owner);
    tree->set("a.js", "ajs\n");
    AssetServer server(std::move(owner));

    const auto first = server.lookup("a.js");
    TEST_REQUIRE(first.hasValue());
    TEST_CHECK(tree->numOpens() == 1);

    for (int i = 0; i < 10; ++i) {
        const auto info = server.lookup("a.js");
        TEST_REQUIRE(info.hasValue());
        TEST_CHECK(info->tag == first->tag);
        const auto tagged = server.tag("/a.js");
        TEST_REQUIRE(tagged.hasValue());
        TEST_CHECK(*tagged == "/a." + first->tag + ".js");
    }
    TEST_CHECK(tree->numOpens() == 1);

    // resolve always opens, but doesn't hash again
    const auto asset = server.resolve("a.js");
    TEST_REQUIRE(asset.hasValue());
    TEST_CHECK(tree->numOpens() == 2);
    TEST_CHECK(asset->info.tag == first->tag);
}

TEST_CASE("AssetServer reloads changed files")
{
    std::unique_ptr<FileTree> owner;
    auto tree = makeTree(owner);
    tree->set("a.js", "ajs\n", 1'000'000'000);
    AssetServer server(std::move(owner));

    const auto v1 = server.lookup("a.js");
    TEST_REQUIRE(v1.hasValue());
    TEST_CHECK(v1->tag == hashTag("ajs\n"));

    // Same mtime, different size
    tree->set("a.js", "ajs 2\n", 1'000'000'000);
    const auto v2 = server.lookup("a.js");
    TEST_REQUIRE(v2.hasValue());
    TEST_CHECK(v2->tag == hashTag("ajs 2\n"));

    // Same size, different mtime
    tree->set("a.js", "bjs 2\n", 2'000'000'000);
    const auto v3 = server.lookup("a.js");
    TEST_REQUIRE(v3.hasValue());
    TEST_CHECK(v3->tag == hashTag("bjs 2\n"));
    TEST_CHECK(v3->modTimeNs == 2'000'000'000);

    // Only ever one entry per path
    TEST_CHECK(server.cache().size() == 1);
}

TEST_CASE("AssetServer tag")
{
    TempDir dir;
    dir.write("d/style.css", "style\n");
    dir.write("b.min.js", "b\n");
    dir.write("d/sub/noext", "<!doctype html>\n");
    AssetServer server(std::make_unique<DirFileTree>(dir.path()));

    const auto style = server.tag("/d/style.css");
    TEST_REQUIRE(style.hasValue());
    TEST_CHECK(*style == "/d/style." + hashTag("style\n") + ".css");

    const auto relative = server.tag("d/style.css");
    TEST_REQUIRE(relative.hasValue());
    TEST_CHECK(*relative == "d/style." + hashTag("style\n") + ".css");

    const auto minJs = server.tag("b.min.js");
    TEST_REQUIRE(minJs.hasValue());
    TEST_CHECK(*minJs == "b." + hashTag("b\n") + ".min.js");

    const auto noext = server.tag("/d/sub/noext");
    TEST_REQUIRE(noext.hasValue());
    TEST_CHECK(*noext == "/d/sub/noext." + hashTag("<!doctype html>\n"));

    const auto missing = server.tag("/missing.js");
    TEST_REQUIRE(!missing.hasValue());
    TEST_CHECK(missing.error() == AssetErrc::NotFound);
}

TEST_CASE("AssetServer content type of files without extension")
{
    std::unique_ptr<FileTree> owner;
    auto tree = makeTree(owner);
    // Larger than the sniffing window and than a single read
    std::string binary(40'000, 'x');
    binary[100] = '\x01';
    binary[30'000] = '\x02';
    tree->set("blob", binary);
    tree->set("page", "<!doctype html>\n" + std::string(2000, 'p'));
    // The control byte is only after the first 512 bytes
    tree->set("late", std::string(600, 't') + '\x01');
    AssetServer server(std::move(owner));

    const auto blob = server.lookup("blob");
    TEST_REQUIRE(blob.hasValue());
    TEST_CHECK(blob->contentType == "application/octet-stream");
    TEST_CHECK(blob->tag == hashTag(binary));
    TEST_CHECK(blob->size == binary.size());

    const auto page = server.lookup("page");
    TEST_REQUIRE(page.hasValue());
    TEST_CHECK(page->contentType == "text/html; charset=utf-8");

    const auto late = server.lookup("late");
    TEST_REQUIRE(late.hasValue());
    TEST_CHECK(late->contentType == "text/plain; charset=utf-8");
}

TEST_CASE("AssetServer errors")
{
    std::unique_ptr<FileTree> owner;
    auto tree = makeTree(owner);
    tree->set("a.js", "ajs\n");
    tree->mkdir("d");
    AssetServer server(std::move(owner));

    const auto missing = server.resolve("missing.js");
    TEST_REQUIRE(!missing.hasValue());
    TEST_CHECK(missing.error() == AssetErrc::NotFound);

    const auto dir = server.resolve("d");
    TEST_REQUIRE(!dir.hasValue());
    TEST_CHECK(dir.error() == AssetErrc::NotFound);
    TEST_CHECK(!server.lookup("d").hasValue());

    tree->setStatError(std::make_error_code(std::errc::permission_denied));
    const auto denied = server.resolve("a.js");
    TEST_REQUIRE(!denied.hasValue());
    TEST_CHECK(denied.error() == AssetErrc::Internal);
    tree->setStatError(std::nullopt);

    tree->setOpenError(std::make_error_code(std::errc::too_many_files_open));
    const auto noFds = server.resolve("a.js");
    TEST_REQUIRE(!noFds.hasValue());
    TEST_CHECK(noFds.error() == AssetErrc::Internal);
    tree->setOpenError(std::nullopt);

    tree->setReadError(std::make_error_code(std::errc::io_error));
    const auto ioError = server.resolve("a.js");
    TEST_REQUIRE(!ioError.hasValue());
    TEST_CHECK(ioError.error() == AssetErrc::Internal);
    tree->setReadError(std::nullopt);

    // Nothing was cached by the failed attempts
    const auto ok = server.resolve("a.js");
    TEST_REQUIRE(ok.hasValue());
    TEST_CHECK(ok->info.tag == hashTag("ajs\n"));
}

TEST_CASE("AssetServer invalid names")
{
    TempDir dir;
    dir.write("a.js", "ajs\n");
    AssetServer server(std::make_unique<DirFileTree>(dir.path()));

    for (const auto name : { "", "/a.js", "a.js/", "../a.js", "d/../a.js", "./a.js", "d//a.js" }) {
        const auto res = server.resolve(name);
        TEST_CHECK(!res.hasValue());
        if (!res) {
            TEST_CHECK(res.error() == AssetErrc::NotFound);
        }
    }
    TEST_CHECK(server.resolve("a.js").hasValue());
}

TEST_CASE("FileInfoCache")
{
    FileInfoCache cache;
    TEST_CHECK(cache.size() == 0);
    TEST_CHECK(cache.find("a.js") == nullptr);

    auto& entry = cache.getOrCreate("a.js");
    TEST_CHECK(entry.load() == nullptr);
    TEST_CHECK(cache.find("a.js") == &entry);
    TEST_CHECK(&cache.getOrCreate("a.js") == &entry);
    TEST_CHECK(cache.size() == 1);

    entry.store(FileInfo { 1, 4, "1231231234", "text/plain" });
    const auto first = entry.load();
    TEST_REQUIRE(first != nullptr);
    entry.store(FileInfo { 2, 5, "abcabcabca", "text/plain" });
    // Old snapshots stay intact
    TEST_CHECK(first->tag == "1231231234");
    TEST_CHECK(entry.load()->tag == "abcabcabca");

    // Creating more entries doesn't move existing ones
    for (int i = 0; i < 1000; ++i) {
        cache.getOrCreate("file" + std::to_string(i));
    }
    TEST_CHECK(cache.find("a.js") == &entry);
    TEST_CHECK(cache.size() == 1001);
}

TEST_CASE("AssetServer content always matches tag under concurrent replacement")
{
    TempDir dir;
    const auto content = [](int seq) { return "asset version " + std::to_string(seq) + "\n"; };
    dir.write("a.js", content(0));
    AssetServer server(std::make_unique<DirFileTree>(dir.path()));

    std::atomic<bool> done { false };
    std::atomic<size_t> mismatches { 0 };
    std::atomic<size_t> failures { 0 };
    std::atomic<size_t> reads { 0 };

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            int lastSeq = 0;
            while (!done.load()) {
                auto asset = server.resolve("a.js");
                if (!asset) {
                    failures++;
                    continue;
                }
                const auto body = readAll(*asset->content);
                if (hashTag(body) != asset->info.tag) {
                    mismatches++;
                }
                // Versions only go forward
                const auto seq = std::stoi(body.substr(std::string("asset version ").size()));
                if (seq < lastSeq) {
                    mismatches++;
                }
                lastSeq = seq;
                reads++;
            }
        });
    }

    for (int seq = 1; seq <= 200; ++seq) {
        // Many versions have the same size, so only the mtime tells them apart
        dir.replace("a.js", content(seq), 1'000'000 + seq);
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    TEST_CHECK(mismatches.load() == 0);
    TEST_CHECK(failures.load() == 0);
    TEST_CHECK(reads.load() > 0);

    const auto latest = server.lookup("a.js");
    TEST_REQUIRE(latest.hasValue());
    TEST_CHECK(latest->tag == hashTag(content(200)));
}
