#ifndef DOCUMENT_HH
#define DOCUMENT_HH

#include "Node.hh"
#include "ParseDiagnostic.hh"
#include "ParseOptions.hh"
#include "XPathResult.hh"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlscraper {

class DocumentState;

/** A parsed HTML or XML document.
  *
  * A Document owns its tree: all Nodes obtained from it stay valid exactly
  * as long as the Document is alive. Documents can be moved but not
  * copied. A moved-from Document is empty, all queries on it throw
  * DocumentExpiredException.
  *
  * Documents are not thread-safe. Use one Document per thread.
  */
class Document
{
public:
	// Largest accepted input, in bytes.
	static const size_t MAX_INPUT_SIZE;

	/** Parse HTML with the default (tolerant) options.
	  * @throws ParseError when no tree could be produced at all.
	  */
	[[nodiscard]] static Document parse(std::string_view markup);
	[[nodiscard]] static Document parseWithOptions(std::string_view markup, ParseOptions options);

	/** Parse XML. With the default options any well-formedness error
	  * throws ParseError.
	  */
	[[nodiscard]] static Document parseXml(std::string_view markup);
	[[nodiscard]] static Document parseXmlWithOptions(std::string_view markup, XmlParseOptions options);

	Document(const Document&) = delete;
	Document& operator=(const Document&) = delete;
	Document(Document&&) noexcept;
	Document& operator=(Document&&) noexcept;
	~Document();

	// All queries throw XPathError for invalid expressions.
	[[nodiscard]] std::vector<Node> select(std::string_view xpath) const;
	// The string value of each selected node, trimmed of whitespace.
	[[nodiscard]] std::vector<std::string> extractTexts(std::string_view xpath) const;
	[[nodiscard]] double extractNumber(std::string_view xpath) const;
	[[nodiscard]] bool extractBoolean(std::string_view xpath) const;
	[[nodiscard]] std::string extractString(std::string_view xpath) const;
	[[nodiscard]] XPathResult evaluate(std::string_view xpath) const;

	/** The document element (e.g. <html>), if there is one. */
	[[nodiscard]] std::optional<Node> getRoot() const;
	/** The node above the document element. */
	[[nodiscard]] Node getDocumentNode() const;
	[[nodiscard]] bool isEmpty() const;

	[[nodiscard]] bool isHtml() const;
	// Only one of these has a value, depending on the parser that was used.
	[[nodiscard]] std::optional<ParseOptions> getParseOptions() const;
	[[nodiscard]] std::optional<XmlParseOptions> getXmlParseOptions() const;
	[[nodiscard]] const std::vector<ParseDiagnostic>& getDiagnostics() const;

	/** False for a moved-from Document. Never throws. */
	[[nodiscard]] bool valid() const { return state != nullptr; }

private:
	explicit Document(std::shared_ptr<DocumentState> state);
	[[nodiscard]] DocumentState& getState() const;

	std::shared_ptr<DocumentState> state;
};

} // namespace xmlscraper

#endif
