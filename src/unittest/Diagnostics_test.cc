#include <catch2/catch.hpp>
#include "Diagnostics.hh"
#include "Document.hh"
#include "StdioDiagnostics.hh"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace xmlscraper;

namespace {

class CollectingDiagnostics final : public Diagnostics
{
public:
	CollectingDiagnostics() : prev(setGlobalDiagnostics(this)) {}
	~CollectingDiagnostics() override { setGlobalDiagnostics(prev); }

	void log(LogLevel level, std::string_view message) noexcept override {
		messages.emplace_back(level, std::string(message));
	}

	[[nodiscard]] size_t count(LogLevel level) const {
		return std::ranges::count(messages, level, &Message::first);
	}

	using Message = std::pair<LogLevel, std::string>;
	std::vector<Message> messages;

private:
	Diagnostics* prev;
};

} // namespace

TEST_CASE("Diagnostics, levels")
{
	CHECK(toString(Diagnostics::LogLevel::INFO) == "info");
	CHECK(toString(Diagnostics::LogLevel::WARNING) == "warning");
	CHECK(toString(Diagnostics::LogLevel::LOGLEVEL_ERROR) == "error");
}

TEST_CASE("Diagnostics, print methods")
{
	CollectingDiagnostics diag;
	REQUIRE(&getGlobalDiagnostics() == &diag);

	diag.printInfo("plain");
	diag.printWarning(std::string_view("view"));
	diag.printError("line ", 3, ": ", "oops");
	REQUIRE(diag.messages.size() == 3);
	CHECK(diag.messages[0] == CollectingDiagnostics::Message{Diagnostics::LogLevel::INFO, "plain"});
	CHECK(diag.messages[1] == CollectingDiagnostics::Message{Diagnostics::LogLevel::WARNING, "view"});
	CHECK(diag.messages[2] == CollectingDiagnostics::Message{Diagnostics::LogLevel::LOGLEVEL_ERROR, "line 3: oops"});
}

TEST_CASE("Diagnostics, global sink")
{
	auto* before = &getGlobalDiagnostics();
	{
		CollectingDiagnostics diag;
		CHECK(&getGlobalDiagnostics() == &diag);
	}
	CHECK(&getGlobalDiagnostics() == before);

	// without an installed sink messages are silently dropped
	auto* prev = setGlobalDiagnostics(nullptr);
	getGlobalDiagnostics().printError("nobody listens");
	setGlobalDiagnostics(prev);
}

TEST_CASE("Diagnostics, forwarded parse messages")
{
	const char* markup = "<p>a</q><div>b</span></div>";

	SECTION("default options") {
		CollectingDiagnostics diag;
		auto doc = Document::parse(markup);
		// the sink may also get an info message about the engine itself
		CHECK(diag.count(Diagnostics::LogLevel::LOGLEVEL_ERROR) +
		      diag.count(Diagnostics::LogLevel::WARNING) ==
		      doc.getDiagnostics().size());
		CHECK(diag.count(Diagnostics::LogLevel::LOGLEVEL_ERROR) >= 2);
		REQUIRE(!diag.messages.empty());
		CHECK(diag.messages.back().second.starts_with("line 1: "));
	}
	SECTION("silent options") {
		CollectingDiagnostics diag;
		auto doc = Document::parseWithOptions(markup, ParseOptions::scraper());
		CHECK(diag.count(Diagnostics::LogLevel::LOGLEVEL_ERROR) == 0);
		CHECK(diag.count(Diagnostics::LogLevel::WARNING) == 0);
		CHECK(doc.getDiagnostics().empty());
	}
}

TEST_CASE("StdioDiagnostics")
{
	StdioDiagnostics stdio;
	auto* prev = setGlobalDiagnostics(&stdio);
	auto doc = Document::parse("<p>a</q>");
	stdio.printInfo("parsed ", doc.getDiagnostics().size(), " diagnostic(s)");
	setGlobalDiagnostics(prev);
	CHECK(!doc.getDiagnostics().empty());
}
