#include <catch2/catch.hpp>
#include "EngineSession.hh"
#include "xmlscraper.hh"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace xmlscraper;
using engine::EngineSession;

TEST_CASE("EngineSession")
{
	xmlscraper::init();
	xmlscraper::init(); // more than once is fine
	CHECK(EngineSession::isInitialized());

	SECTION("cleanup without documents") {
		REQUIRE(EngineSession::getUseCount() == 0);
		xmlscraper::cleanup();
		CHECK(!EngineSession::isInitialized());
		CHECK(!EngineSession::isCleanupPending());

		// parsing initializes again
		auto doc = Document::parse("<p>x</p>");
		CHECK(EngineSession::isInitialized());
		CHECK(EngineSession::getUseCount() == 1);
	}
	SECTION("cleanup is delayed until the last document is gone") {
		{
			auto doc1 = Document::parse("<p>x</p>");
			auto doc2 = Document::parseXml("<r/>");
			CHECK(EngineSession::getUseCount() == 2);

			xmlscraper::cleanup();
			CHECK(EngineSession::isInitialized());
			CHECK(EngineSession::isCleanupPending());
			CHECK(doc1.extractString("string(//p)") == "x");

			{ auto tmp = std::move(doc2); }
			CHECK(EngineSession::getUseCount() == 1);
			CHECK(EngineSession::isInitialized());
		}
		CHECK(EngineSession::getUseCount() == 0);
		CHECK(!EngineSession::isInitialized());
		CHECK(!EngineSession::isCleanupPending());
	}
	SECTION("a failed parse releases its use") {
		CHECK_THROWS_AS(Document::parseXml("<a>"), ParseError);
		CHECK(EngineSession::getUseCount() == 0);
	}
	SECTION("init cancels a pending cleanup") {
		auto doc = Document::parse("<p>x</p>");
		xmlscraper::cleanup();
		CHECK(EngineSession::isCleanupPending());
		xmlscraper::init();
		CHECK(!EngineSession::isCleanupPending());
	}
}

// Catch2 assertions aren't thread-safe, the workers only count failures.
TEST_CASE("EngineSession, one document per thread")
{
	static constexpr int NUM_THREADS = 8;
	static constexpr int NUM_ROUNDS = 50;

	std::atomic<int> failures = 0;
	std::atomic<int> parsed = 0;
	std::vector<std::thread> workers;
	for (int t = 0; t < NUM_THREADS; ++t) {
		workers.emplace_back([t, &failures, &parsed] {
			for (int round = 0; round < NUM_ROUNDS; ++round) {
				xmlscraper::init();
				try {
					auto markup = strCat("<ul><li>", t, "</li><li>", round, "</li></ul>");
					auto doc = Document::parse(markup);
					auto texts = doc.extractTexts("//li");
					if ((texts != std::vector<std::string>{strCat(t), strCat(round)}) ||
					    (doc.extractNumber("count(//li)") != 2.0)) {
						++failures;
					}
					auto xml = Document::parseXml(strCat("<r n='", round, "'/>"));
					if (xml.extractNumber("number(/r/@n)") != round) ++failures;
					++parsed;
				} catch (ScraperException&) {
					++failures;
				}
				// only takes effect once no document is alive anymore
				xmlscraper::cleanup();
			}
		});
	}
	for (auto& w : workers) w.join();

	CHECK(failures == 0);
	CHECK(parsed == NUM_THREADS * NUM_ROUNDS);
	CHECK(EngineSession::getUseCount() == 0);
	CHECK(!EngineSession::isInitialized());
	CHECK(!EngineSession::isCleanupPending());
}
