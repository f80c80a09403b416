#include "test.hpp"

#include <array>

#include "tagcodec.hpp"

TEST_CASE("makeTag width and alphabet")
{
    const std::array<uint8_t, 8> zero {};
    TEST_CHECK(makeTag(zero.data(), zero.size()) == "0000000000");

    // Least significant digit first
    const std::array<uint8_t, 8> one { 0, 0, 0, 0, 0, 0, 0, 1 };
    TEST_CHECK(makeTag(one.data(), one.size()) == "1000000000");
    const std::array<uint8_t, 8> sixtyTwo { 0, 0, 0, 0, 0, 0, 0, 62 };
    TEST_CHECK(makeTag(sixtyTwo.data(), sixtyTwo.size()) == "0100000000");
    const std::array<uint8_t, 8> sixtyOne { 0, 0, 0, 0, 0, 0, 0, 61 };
    TEST_CHECK(makeTag(sixtyOne.data(), sixtyOne.size()) == "Z000000000");

    // Only the first 8 bytes matter
    const std::array<uint8_t, 32> digest { 0xde, 0xad, 0xbe, 0xef, 0x01, 0x02, 0x03, 0x04, 0xff };
    auto other = digest;
    other[20] = 0x42;
    const auto tag = makeTag(digest.data(), digest.size());
    TEST_CHECK(tag == makeTag(other.data(), other.size()));
    TEST_CHECK(isTag(tag));

    const std::array<uint8_t, 8> max { 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff };
    TEST_CHECK(isTag(makeTag(max.data(), max.size())));
}

TEST_CASE("isTag")
{
    TEST_CHECK(isTag("abcABC1234"));
    TEST_CHECK(isTag("0000000000"));
    TEST_CHECK(!isTag(""));
    TEST_CHECK(!isTag("abcABC123"));
    TEST_CHECK(!isTag("abcABC12345"));
    TEST_CHECK(!isTag("xyzXYZ_xyz"));
    TEST_CHECK(!isTag("abc-BC1234"));
    TEST_CHECK(!isTag("abcäBC123"));
}

TEST_CASE("extractTag")
{
    const auto check = [&testContext](std::string_view path, std::string_view tag,
                           std::string_view name) {
        const auto res = extractTag(path);
        TEST_CHECK(res.tag == tag);
        TEST_CHECK(res.name == name);
    };
    check("d/style.abcABC1234.css", "abcABC1234", "d/style.css");
    check("/d/style.abcABC1234.css", "abcABC1234", "/d/style.css");
    check("a.1231231234.js", "1231231234", "a.js");
    check("b.1231231234.min.js", "1231231234", "b.min.js");
    check("x.1231231234.tar.gz", "1231231234", "x.tar.gz");
    check("d/sub/noext.xyzXYZxyzX", "xyzXYZxyzX", "d/sub/noext");
    check(".1231231234.htaccess", "1231231234", ".htaccess");

    check("d/style.abcABC12345.css", "", "d/style.abcABC12345.css");
    check("a.12312312.js", "", "a.12312312.js");
    check("d/sub/noext.xyzXYZ_xyz", "", "d/sub/noext.xyzXYZ_xyz");
    check("noext", "", "noext");
    check("/", "", "/");
    // Only the last path element is looked at
    check("abcABC1234.d/style.css", "", "abcABC1234.d/style.css");
}

TEST_CASE("insertTag")
{
    const auto tag = "abcABC1234";
    TEST_CHECK(insertTag("d/style.css", tag) == "d/style.abcABC1234.css");
    TEST_CHECK(insertTag("/d/style.css", tag) == "/d/style.abcABC1234.css");
    TEST_CHECK(insertTag("b.min.js", tag) == "b.abcABC1234.min.js");
    TEST_CHECK(insertTag("x.tar.gz", tag) == "x.abcABC1234.tar.gz");
    TEST_CHECK(insertTag("d/sub/noext", tag) == "d/sub/noext.abcABC1234");
    TEST_CHECK(insertTag(".htaccess", tag) == ".abcABC1234.htaccess");
    TEST_CHECK(insertTag("v1.2/app.js", tag) == "v1.2/app.abcABC1234.js");
}

TEST_CASE("extractTag recovers insertTag")
{
    const auto tag = "Zz09aAbB12";
    for (const auto path : { "a.js", "/a.js", "d/style.css", "b.min.js", "x.tar.gz", "noext",
             "/d/sub/noext", ".htaccess", "v1.2/app.js", "a.b.c.d" }) {
        const auto res = extractTag(insertTag(path, tag));
        TEST_CHECK(res.tag == tag);
        TEST_CHECK(res.name == path);
    }
}
