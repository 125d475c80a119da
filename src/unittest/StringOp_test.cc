#include <catch2/catch.hpp>
#include "StringOp.hh"

using namespace StringOp;

static void checkTrimRight(const std::string& s, const char* chars, const std::string& expected)
{
	std::string test = s;
	trimRight(test, chars);
	CHECK(test == expected);

	std::string_view ref = s;
	trimRight(ref, chars);
	CHECK(ref == expected);
}

static void checkTrimLeft(const std::string& s, const char* chars, const std::string& expected)
{
	std::string test = s;
	trimLeft(test, chars);
	CHECK(test == expected);

	std::string_view ref = s;
	trimLeft(ref, chars);
	CHECK(ref == expected);
}

TEST_CASE("StringOp::trimRight")
{
	checkTrimRight("", " ", "");
	checkTrimRight("  ", " ", "");
	checkTrimRight("abc", " ", "abc");
	checkTrimRight("abc  ", " ", "abc");
	checkTrimRight("  abc  ", " ", "  abc");
	checkTrimRight("abc \t\n", " \t\n", "abc");
	checkTrimRight("abc \t\n", " ", "abc \t\n");
}

TEST_CASE("StringOp::trimLeft")
{
	checkTrimLeft("", " ", "");
	checkTrimLeft("   ", " ", "");
	checkTrimLeft("abc", " ", "abc");
	checkTrimLeft("  abc  ", " ", "abc  ");
	checkTrimLeft("\r\n abc", " \r\n", "abc");
}

TEST_CASE("StringOp::trimmedXmlSpace")
{
	CHECK(trimmedXmlSpace("") == "");
	CHECK(trimmedXmlSpace(" \t\r\n") == "");
	CHECK(trimmedXmlSpace("  Item 1\n") == "Item 1");
	CHECK(trimmedXmlSpace("a b") == "a b");
	// a non-breaking space is not XML whitespace
	CHECK(trimmedXmlSpace("\xC2\xA0x ") == "\xC2\xA0x");

	CHECK(isXmlSpace(' '));
	CHECK(isXmlSpace('\t'));
	CHECK(!isXmlSpace('\v'));
	CHECK(!isXmlSpace('x'));
}

TEST_CASE("StringOp::view")
{
	CHECK(view(nullptr).empty());
	CHECK(view("") == "");
	CHECK(view("abc") == "abc");
}
