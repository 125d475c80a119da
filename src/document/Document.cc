#include "Document.hh"

#include "DocumentExpiredException.hh"
#include "DocumentState.hh"
#include "StringOp.hh"

#include <utility>

namespace xmlscraper {

const size_t Document::MAX_INPUT_SIZE = engine::MAX_INPUT_SIZE;

static std::shared_ptr<DocumentState> load(DocumentState::Options options, std::string_view markup)
{
	auto state = std::make_shared<DocumentState>(options);
	state->load(markup);
	return state;
}

Document Document::parse(std::string_view markup)
{
	return parseWithOptions(markup, ParseOptions());
}

Document Document::parseWithOptions(std::string_view markup, ParseOptions options)
{
	return Document(load(options, markup));
}

Document Document::parseXml(std::string_view markup)
{
	return parseXmlWithOptions(markup, XmlParseOptions());
}

Document Document::parseXmlWithOptions(std::string_view markup, XmlParseOptions options)
{
	return Document(load(options, markup));
}

Document::Document(std::shared_ptr<DocumentState> state_)
	: state(std::move(state_))
{
}

Document::Document(Document&&) noexcept = default;
Document& Document::operator=(Document&&) noexcept = default;
Document::~Document() = default;

DocumentState& Document::getState() const
{
	if (!state) {
		throw DocumentExpiredException("Document was moved from");
	}
	state->checkThread();
	return *state;
}

XPathResult Document::evaluate(std::string_view xpath) const
{
	auto& s = getState();
	return s.evaluate(xpath, s.getDocumentNode());
}

std::vector<Node> Document::select(std::string_view xpath) const
{
	return evaluate(xpath).getNodeSet();
}

std::vector<std::string> Document::extractTexts(std::string_view xpath) const
{
	std::vector<std::string> result;
	for (const auto& node : select(xpath)) {
		result.push_back(StringOp::trimmedXmlSpace(node.getText()));
	}
	return result;
}

double Document::extractNumber(std::string_view xpath) const
{
	return evaluate(xpath).toNumber();
}

bool Document::extractBoolean(std::string_view xpath) const
{
	return evaluate(xpath).toBoolean();
}

std::string Document::extractString(std::string_view xpath) const
{
	return evaluate(xpath).toString();
}

std::optional<Node> Document::getRoot() const
{
	auto& s = getState();
	auto* root = engine::getRootElement(s.getDoc());
	if (!root) return std::nullopt;
	return Node(state, root);
}

Node Document::getDocumentNode() const
{
	return Node(state, getState().getDocumentNode());
}

bool Document::isEmpty() const
{
	return engine::getRootElement(getState().getDoc()) == nullptr;
}

bool Document::isHtml() const
{
	return getState().isHtml();
}

std::optional<ParseOptions> Document::getParseOptions() const
{
	const auto& options = getState().getOptions();
	if (const auto* html = std::get_if<ParseOptions>(&options)) return *html;
	return std::nullopt;
}

std::optional<XmlParseOptions> Document::getXmlParseOptions() const
{
	const auto& options = getState().getOptions();
	if (const auto* xml = std::get_if<XmlParseOptions>(&options)) return *xml;
	return std::nullopt;
}

const std::vector<ParseDiagnostic>& Document::getDiagnostics() const
{
	return getState().getDiagnostics();
}

} // namespace xmlscraper
