#include <catch2/catch.hpp>
#include "strCat.hh"

#include <climits>
#include <cstdint>

TEST_CASE("strCat")
{
	SECTION("no arguments") {
		CHECK(strCat().empty());
	}
	SECTION("strings") {
		std::string s = "bar";
		std::string_view sv = "qux";
		const char* cs = "baz";
		CHECK(strCat("foo", s, sv, cs) == "foobarquxbaz");
		CHECK(strCat(std::string_view()) == "");
	}
	SECTION("characters") {
		CHECK(strCat('a', "bc", 'd') == "abcd");
	}
	SECTION("integers") {
		CHECK(strCat(0) == "0");
		CHECK(strCat(-17) == "-17");
		CHECK(strCat("line ", 42, ':') == "line 42:");
		CHECK(strCat(size_t(123456789)) == "123456789");
		CHECK(strCat(INT_MIN) == "-2147483648");
		CHECK(strCat(uint8_t(200)) == "200");
	}
	SECTION("booleans") {
		CHECK(strCat(true, '/', false) == "true/false");
	}
	SECTION("doubles") {
		CHECK(strCat(2.5) == "2.5");
		CHECK(strCat(1.0) == "1");
	}
}

TEST_CASE("strAppend")
{
	std::string s = "Malformed";
	strAppend(s, " XML at line ", 3);
	CHECK(s == "Malformed XML at line 3");
	strAppend(s);
	CHECK(s == "Malformed XML at line 3");
}
