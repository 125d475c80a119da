#include "DocumentState.hh"

#include "Diagnostics.hh"
#include "ParseError.hh"
#include "strCat.hh"

#include <algorithm>
#include <cassert>
#include <utility>

namespace xmlscraper {

DocumentState::DocumentState(Options options_)
	: options(options_)
	, ownerThread(std::this_thread::get_id())
{
}

static void checkInput(std::string_view markup)
{
	if (markup.size() > engine::MAX_INPUT_SIZE) {
		throw ParseError(ParseError::Kind::INPUT_TOO_LARGE,
		                 "Input of ", markup.size(), " bytes exceeds the maximum of ",
		                 engine::MAX_INPUT_SIZE, " bytes");
	}
	if (markup.empty()) {
		throw ParseError(ParseError::Kind::MALFORMED, "Empty input");
	}
	if (auto pos = markup.find('\0'); pos != std::string_view::npos) {
		throw ParseError(ParseError::Kind::MALFORMED,
		                 "Input contains a NUL character at offset ", pos);
	}
}

[[noreturn]] static void throwParseFailure(
	std::string_view flavour, const std::vector<engine::EngineMessage>& messages)
{
	if (auto it = std::ranges::find_if(messages, engine::isEncodingProblem);
	    it != messages.end()) {
		throw ParseError(ParseError::Kind::ENCODING,
		                 "Cannot decode ", flavour, " input (line ", it->line,
		                 "): ", it->message);
	}
	auto it = std::ranges::find(messages, Diagnostics::LogLevel::LOGLEVEL_ERROR,
	                            &engine::EngineMessage::level);
	if (it == messages.end() && !messages.empty()) it = messages.begin();
	if (it != messages.end()) {
		throw ParseError(ParseError::Kind::MALFORMED,
		                 "Malformed ", flavour, " at line ", it->line, ": ",
		                 it->message);
	}
	throw ParseError(ParseError::Kind::MALFORMED,
	                 "The ", flavour, " parser produced no document");
}

// Keep (and report) only the messages the options ask for.
static std::vector<ParseDiagnostic> filterMessages(
	std::vector<engine::EngineMessage> messages, bool noError, bool noWarning)
{
	auto& sink = getGlobalDiagnostics();
	std::vector<ParseDiagnostic> result;
	for (auto& msg : messages) {
		using enum Diagnostics::LogLevel;
		if ((msg.level == LOGLEVEL_ERROR) && noError) continue;
		if ((msg.level == WARNING) && noWarning) continue;
		sink.log(msg.level, strCat("line ", msg.line, ": ", msg.message));
		result.push_back({msg.level, msg.line, msg.column, std::move(msg.message)});
	}
	return result;
}

void DocumentState::load(std::string_view markup)
{
	assert(!doc);
	checkInput(markup);

	engine::ErrorCapture capture;
	bool noError = false;
	bool noWarning = false;
	std::string_view flavour;
	if (const auto* html = std::get_if<ParseOptions>(&options)) {
		flavour = "HTML";
		noError = html->noError;
		noWarning = html->noWarning;
		doc = engine::readHtml(markup, engine::translateOptions(*html));
	} else {
		const auto& xml = std::get<XmlParseOptions>(options);
		flavour = "XML";
		noError = xml.noError;
		noWarning = xml.noWarning;
		doc = engine::readXml(markup, engine::translateOptions(xml));
	}
	if (!doc) {
		throwParseFailure(flavour, capture.getMessages());
	}
	diagnostics = filterMessages(capture.releaseMessages(), noError, noWarning);
}

engine::NodeHandle DocumentState::getDocumentNode() const
{
	return engine::asNode(doc.get());
}

XPathResult DocumentState::evaluate(std::string_view expression,
                                    engine::NodeHandle contextNode)
{
	checkThread();
	return evaluator.evaluate(shared_from_this(), expression, contextNode);
}

void DocumentState::checkThread() const
{
	assert(std::this_thread::get_id() == ownerThread);
}

} // namespace xmlscraper
