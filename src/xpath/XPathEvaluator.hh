#ifndef XPATHEVALUATOR_HH
#define XPATHEVALUATOR_HH

#include "EngineHandles.hh"
#include "LibXMLEngine.hh"
#include "XPathResult.hh"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xmlscraper {

class DocumentState;

/** Compiles and evaluates XPath expressions on the tree of one Document
  * (the Document of the 'owner' passed to evaluate()).
  *
  * The engine XPath context is only created on the first evaluation.
  * Compiled expressions are cached, when the cache is full it's cleared.
  */
class XPathEvaluator
{
public:
	static constexpr size_t MAX_CACHED_EXPRESSIONS = 64;

	XPathEvaluator() = default;

	XPathEvaluator(const XPathEvaluator&) = delete;
	XPathEvaluator& operator=(const XPathEvaluator&) = delete;

	/** Evaluate 'expression' with 'contextNode' as context node. Nodes in
	  * the result refer to 'owner'.
	  * @throws XPathError
	  */
	[[nodiscard]] XPathResult evaluate(const std::shared_ptr<DocumentState>& owner,
	                                   std::string_view expression,
	                                   engine::NodeHandle contextNode);

	[[nodiscard]] size_t getCacheSize() const { return cache.size(); }
	[[nodiscard]] bool hasContext() const { return context != nullptr; }

private:
	xmlXPathCompExpr& getCompiled(const std::string& expression,
	                              const engine::ErrorCapture& capture);

	engine::XPathContextPtr context;
	// declared after 'context', so destroyed before it
	std::unordered_map<std::string, engine::CompExprPtr> cache;
};

} // namespace xmlscraper

#endif
