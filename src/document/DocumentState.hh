#ifndef DOCUMENTSTATE_HH
#define DOCUMENTSTATE_HH

#include "EngineSession.hh"
#include "LibXMLEngine.hh"
#include "ParseDiagnostic.hh"
#include "ParseOptions.hh"
#include "XPathEvaluator.hh"

#include <memory>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace xmlscraper {

/** Everything owned by one Document. Internal, not part of the public
  * interface.
  *
  * A Document holds the only strong reference to this object, Nodes only
  * have weak references. So destroying the Document (or the last Document
  * it was moved into) frees the tree exactly once and at the same time
  * invalidates all Nodes.
  */
class DocumentState : public std::enable_shared_from_this<DocumentState>
{
public:
	using Options = std::variant<ParseOptions, XmlParseOptions>;

	explicit DocumentState(Options options);

	DocumentState(const DocumentState&) = delete;
	DocumentState& operator=(const DocumentState&) = delete;

	/** Parse 'markup' with the parser selected by the options.
	  * @throws ParseError when no tree could be produced.
	  */
	void load(std::string_view markup);

	[[nodiscard]] engine::DocHandle getDoc() const { return doc.get(); }
	[[nodiscard]] engine::NodeHandle getDocumentNode() const;
	[[nodiscard]] bool isHtml() const { return std::holds_alternative<ParseOptions>(options); }
	[[nodiscard]] const Options& getOptions() const { return options; }
	[[nodiscard]] const std::vector<ParseDiagnostic>& getDiagnostics() const { return diagnostics; }

	/** @throws XPathError */
	[[nodiscard]] XPathResult evaluate(std::string_view expression,
	                                   engine::NodeHandle contextNode);

	/** Documents are not thread-safe, they may only be used from the
	  * thread that created them.
	  */
	void checkThread() const;

private:
	// Member order matters: the session must outlive the tree, the tree
	// must outlive the XPath context.
	engine::EngineSession::Use sessionUse;
	engine::DocPtr doc;
	XPathEvaluator evaluator;
	Options options;
	std::vector<ParseDiagnostic> diagnostics;
	std::thread::id ownerThread;
};

} // namespace xmlscraper

#endif
