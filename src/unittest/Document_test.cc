#include <catch2/catch.hpp>
#include "Document.hh"
#include "DocumentExpiredException.hh"
#include "ParseError.hh"
#include "XPathError.hh"

#include <climits>
#include <cmath>
#include <string_view>
#include <string>
#include <vector>

using namespace xmlscraper;

static ParseError::Kind parseErrorKind(std::string_view markup, bool xml = false)
{
	try {
		if (xml) {
			(void)Document::parseXml(markup);
		} else {
			(void)Document::parse(markup);
		}
	} catch (ParseError& e) {
		return e.getKind();
	}
	FAIL("expected a ParseError");
	return ParseError::Kind::MALFORMED;
}

TEST_CASE("Document, tolerant recovery")
{
	auto doc = Document::parse(
		"<div><p>Unclosed paragraph<p>Another one<ul><li>Item 1<li>Item 2</ul></div>");
	CHECK(doc.isHtml());
	CHECK(!doc.isEmpty());
	CHECK(doc.extractTexts("//li") == std::vector<std::string>{"Item 1", "Item 2"});
	CHECK(doc.extractNumber("count(//p)") == 2.0);
	CHECK(doc.extractNumber("count(//ul/li)") == 2.0);

	auto root = doc.getRoot();
	REQUIRE(root);
	CHECK(root->getTagName() == "html");
}

TEST_CASE("Document, plain text and fragments")
{
	auto doc = Document::parse("hello");
	CHECK(!doc.isEmpty());
	CHECK(doc.extractString("string(//body)") == "hello");

	auto frag = Document::parse("<li>one</li><li>two</li>");
	CHECK(frag.extractTexts("//li") == std::vector<std::string>{"one", "two"});
}

TEST_CASE("Document, input checks")
{
	CHECK(Document::MAX_INPUT_SIZE == size_t(INT_MAX) - 1024);

	CHECK_THROWS_AS(Document::parse(""), ParseError);
	CHECK(parseErrorKind("") == ParseError::Kind::MALFORMED);
	CHECK(parseErrorKind("", true) == ParseError::Kind::MALFORMED);

	std::string_view withNul("<p>a\0b</p>", 10);
	CHECK(parseErrorKind(withNul) == ParseError::Kind::MALFORMED);
	CHECK(parseErrorKind(withNul, true) == ParseError::Kind::MALFORMED);
}

TEST_CASE("Document, strict XML")
{
	SECTION("well-formed") {
		auto doc = Document::parseXml("<catalog><book id='1'>A</book><book id='2'>B</book></catalog>");
		CHECK(!doc.isHtml());
		CHECK(doc.getDiagnostics().empty());
		CHECK(doc.extractTexts("/catalog/book") == std::vector<std::string>{"A", "B"});
		CHECK(doc.extractString("string(//book[2]/@id)") == "2");
	}
	SECTION("mismatched tags") {
		CHECK(parseErrorKind("<a><b></a>", true) == ParseError::Kind::MALFORMED);
		try {
			(void)Document::parseXml("<a>\n<b></a>");
			FAIL("expected a ParseError");
		} catch (ParseError& e) {
			CHECK(e.getKind() == ParseError::Kind::MALFORMED);
			CHECK(e.getMessage().contains("line 2"));
		}
	}
	SECTION("not XML at all") {
		CHECK(parseErrorKind("just some text", true) == ParseError::Kind::MALFORMED);
	}
	SECTION("unsupported encoding") {
		CHECK(parseErrorKind("<?xml version='1.0' encoding='no-such-charset'?><a/>", true)
		      == ParseError::Kind::ENCODING);
	}
	SECTION("tolerant") {
		auto doc = Document::parseXmlWithOptions("<a><b>x</a>", XmlParseOptions::tolerant());
		CHECK(!doc.isEmpty());
		CHECK(!doc.getDiagnostics().empty());
		CHECK(doc.extractString("string(/a/b)") == "x");
	}
}

TEST_CASE("Document, XML entities")
{
	const char* markup =
		"<?xml version='1.0'?>"
		"<!DOCTYPE r [<!ENTITY who 'world'>]>"
		"<r>hello &who;</r>";
	SECTION("kept by default") {
		auto doc = Document::parseXml(markup);
		CHECK(doc.getRoot()->getOuterHtml() == "<r>hello &who;</r>");
	}
	SECTION("substituted on request") {
		XmlParseOptions options;
		options.substituteEntities = true;
		auto doc = Document::parseXmlWithOptions(markup, options);
		CHECK(doc.getRoot()->getText() == "hello world");
		CHECK(doc.getRoot()->getOuterHtml() == "<r>hello world</r>");
	}
}

TEST_CASE("Document, options")
{
	SECTION("presets") {
		auto strict = ParseOptions::strict();
		CHECK(!strict.recover);
		CHECK(!strict.noError);
		CHECK(!strict.noWarning);
		CHECK(!strict.noBlanks);

		auto scraper = ParseOptions::scraper();
		CHECK(scraper.recover);
		CHECK(scraper.noError);
		CHECK(scraper.noWarning);
		CHECK(!scraper.noBlanks);

		auto compact = ParseOptions::compact();
		CHECK(compact.noBlanks);
		CHECK(compact.recover);

		CHECK(ParseOptions() == ParseOptions{.recover = true});

		XmlParseOptions xml;
		CHECK(!xml.recover);
		CHECK(xml.noNetwork);
		CHECK(!xml.substituteEntities);
		CHECK(XmlParseOptions::strict() == xml);
		CHECK(XmlParseOptions::tolerant().recover);
	}
	SECTION("remembered by the document") {
		auto html = Document::parseWithOptions("<p>x</p>", ParseOptions::compact());
		CHECK(html.getParseOptions() == ParseOptions::compact());
		CHECK(!html.getXmlParseOptions());

		auto xml = Document::parseXmlWithOptions("<p>x</p>", XmlParseOptions::tolerant());
		CHECK(!xml.getParseOptions());
		CHECK(xml.getXmlParseOptions() == XmlParseOptions::tolerant());
	}
	SECTION("options don't change the tree") {
		const char* markup = "<div><p>a<p>b</div><span>c</q>";
		auto normal = Document::parse(markup);
		auto quiet = Document::parseWithOptions(markup, ParseOptions::scraper());
		CHECK(normal.getRoot()->getOuterHtml() == quiet.getRoot()->getOuterHtml());
	}
}

TEST_CASE("Document, diagnostics")
{
	const char* markup = "<p>a</q>";
	auto doc = Document::parse(markup);
	const auto& diags = doc.getDiagnostics();
	REQUIRE(!diags.empty());
	CHECK(diags.front().level == Diagnostics::LogLevel::LOGLEVEL_ERROR);
	CHECK(diags.front().line == 1);
	CHECK(diags.front().message.contains("Unexpected end tag"));

	ParseOptions noErrors;
	noErrors.noError = true;
	auto quiet = Document::parseWithOptions(markup, noErrors);
	for (const auto& d : quiet.getDiagnostics()) {
		CHECK(d.level != Diagnostics::LogLevel::LOGLEVEL_ERROR);
	}
	CHECK(Document::parseWithOptions(markup, ParseOptions::scraper()).getDiagnostics().empty());
}

TEST_CASE("Document, empty results")
{
	auto doc = Document::parse("<p>x</p>");
	CHECK(doc.select("//table").empty());
	CHECK(doc.extractTexts("//table").empty());
	CHECK(doc.extractString("//table") == "");
	CHECK(!doc.extractBoolean("//table"));
	CHECK(std::isnan(doc.extractNumber("//table")));
	CHECK(doc.extractNumber("count(//table)") == 0.0);
}

TEST_CASE("Document, move")
{
	auto doc = Document::parse("<p>x</p>");
	auto p = doc.select("//p").front();

	Document other = std::move(doc);
	CHECK(other.valid());
	CHECK(!doc.valid()); // NOLINT(bugprone-use-after-move)
	CHECK(p.valid());
	CHECK(p.getText() == "x");
	CHECK(other.select("//p").front() == p);

	CHECK_THROWS_AS(doc.select("//p"), DocumentExpiredException); // NOLINT(bugprone-use-after-move)
	CHECK_THROWS_AS(doc.isEmpty(), DocumentExpiredException);
	CHECK_THROWS_AS(doc.getRoot(), DocumentExpiredException);

	doc = std::move(other);
	CHECK(doc.valid());
	CHECK(p.getText() == "x");
}

TEST_CASE("Document, document node")
{
	auto doc = Document::parse("<html><body><p>one</p><p>two</p></body></html>");
	auto node = doc.getDocumentNode();
	CHECK(node.getType() == NodeType::DOCUMENT);
	CHECK(node.getTagName().empty());
	CHECK(node.getPath() == "/");
	CHECK(!node.getParent());
	CHECK(node.getText() == "onetwo");
	CHECK(doc.getRoot()->getParent() == node);
	CHECK(node.getOuterHtml() == node.getInnerHtml());
}

TEST_CASE("Errors, kind names")
{
	auto describe = [](auto&& f) -> std::string {
		try {
			f();
		} catch (ScraperException& e) {
			CHECK(std::string_view(e.what()) == e.getMessage());
			return e.toString();
		}
		FAIL("expected a ScraperException");
		return {};
	};

	auto parseFailure = describe([] { (void)Document::parse(""); });
	CHECK(parseFailure.starts_with("malformed: "));

	auto doc = Document::parse("<p>x</p>");
	auto xpathFailure = describe([&] { (void)doc.select("//p["); });
	CHECK(xpathFailure.starts_with("invalid-expression: Invalid XPath expression '//p['"));
	CHECK(describe([&] { (void)doc.select("count(//p)"); }).starts_with("type-mismatch: "));

	Document moved = std::move(doc);
	CHECK(describe([&] { (void)doc.isEmpty(); }) == "document-expired: Document was moved from"); // NOLINT(bugprone-use-after-move)

	ParseError tooLarge(ParseError::Kind::INPUT_TOO_LARGE, "size ", 42);
	CHECK(tooLarge.getKindName() == "input-too-large");
	CHECK(tooLarge.getMessage() == "size 42");
	CHECK(ScraperException("plain").toString() == "error: plain");
}
