#include "test.hpp"

#include "httpdate.hpp"

// 784111777 is the date from the examples in RFC7231, 7.1.1.1
TEST_CASE("formatHttpDate")
{
    TEST_CHECK(formatHttpDate(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");
    TEST_CHECK(formatHttpDate(0) == "Thu, 01 Jan 1970 00:00:00 GMT");
    TEST_CHECK(formatHttpDate(1650756168) == "Sat, 23 Apr 2022 23:22:48 GMT");
}

TEST_CASE("parseHttpDate formats")
{
    TEST_CHECK(parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT") == 784111777);
    TEST_CHECK(parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT") == 784111777);
    TEST_CHECK(parseHttpDate("Sun Nov  6 08:49:37 1994") == 784111777);
    TEST_CHECK(parseHttpDate("  Sat, 23 Apr 2022 23:22:48 GMT ") == 1650756168);
}

TEST_CASE("parseHttpDate formatHttpDate")
{
    for (const int64_t t : { 0L, 1L, 784111777L, 951782400L, 1650756168L, 4102444799L }) {
        const auto str = formatHttpDate(t);
        TEST_REQUIRE(str.has_value());
        TEST_CHECK(parseHttpDate(*str) == t);
    }
}

TEST_CASE("parseHttpDate invalid")
{
    TEST_CHECK(!parseHttpDate(""));
    TEST_CHECK(!parseHttpDate("yesterday"));
    TEST_CHECK(!parseHttpDate("Sun, 06 Nov 1994 08:49:37 UTC"));
    TEST_CHECK(!parseHttpDate("Sun, 06 Foo 1994 08:49:37 GMT"));
    TEST_CHECK(!parseHttpDate("Sun, 6 Nov 1994 08:49:37 GMT"));
    TEST_CHECK(!parseHttpDate("Sun, 06 Nov 1994 24:49:37 GMT"));
    TEST_CHECK(!parseHttpDate("Sun, 32 Nov 1994 08:49:37 GMT"));
    TEST_CHECK(!parseHttpDate("Sun, 06 Nov 1994 08:49 GMT"));
    TEST_CHECK(!parseHttpDate("Xyz, 06 Nov 1994 08:49:37 GMT"));
}
