#ifndef LIBXMLENGINE_HH
#define LIBXMLENGINE_HH

#include "Diagnostics.hh"
#include "NodeType.hh"
#include "ParseOptions.hh"
#include "strCat.hh"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

#include <climits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Thin layer over libxml2. Only the internal parts of the library include
// this header, the public headers only see the opaque handles. Everything here works on raw engine pointers,
// liveness of those pointers is the responsibility of the caller.
namespace xmlscraper::engine {

// libxml2 takes the input size as an 'int'.
inline constexpr size_t MAX_INPUT_SIZE = size_t(INT_MAX) - 1024;

struct FreeDoc {
	void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using DocPtr = std::unique_ptr<xmlDoc, FreeDoc>;

struct FreeXPathContext {
	void operator()(xmlXPathContext* ctx) const { xmlXPathFreeContext(ctx); }
};
using XPathContextPtr = std::unique_ptr<xmlXPathContext, FreeXPathContext>;

struct FreeCompExpr {
	void operator()(xmlXPathCompExpr* comp) const { xmlXPathFreeCompExpr(comp); }
};
using CompExprPtr = std::unique_ptr<xmlXPathCompExpr, FreeCompExpr>;

struct FreeXPathObject {
	void operator()(xmlXPathObject* obj) const { xmlXPathFreeObject(obj); }
};
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, FreeXPathObject>;

struct FreeXmlString {
	void operator()(xmlChar* str) const { xmlFree(str); }
};
using XmlString = std::unique_ptr<xmlChar, FreeXmlString>;

/** One diagnostic message as reported by the engine. */
struct EngineMessage
{
	int domain; // xmlErrorDomain
	int code;   // xmlParserErrors
	Diagnostics::LogLevel level;
	int line;
	int column;
	std::string message; // without the trailing newline
};

/** True for messages caused by (unsupported or broken) character encodings. */
[[nodiscard]] bool isEncodingProblem(const EngineMessage& msg);

/** Collects all engine messages while this object is alive.
  *
  * Installs a structured error handler (per thread, when libxml2 is built
  * with thread support) and restores the previous one on destruction.
  * Optionally also captures the errors of an XPath context (libxml2 reports
  * those through the context, not through the global handler).
  */
class ErrorCapture
{
public:
	explicit ErrorCapture(xmlXPathContext* xpathContext = nullptr);
	~ErrorCapture();

	ErrorCapture(const ErrorCapture&) = delete;
	ErrorCapture(ErrorCapture&&) = delete;
	ErrorCapture& operator=(const ErrorCapture&) = delete;
	ErrorCapture& operator=(ErrorCapture&&) = delete;

	[[nodiscard]] const std::vector<EngineMessage>& getMessages() const { return messages; }
	[[nodiscard]] std::vector<EngineMessage> releaseMessages() { return std::move(messages); }
	[[nodiscard]] bool empty() const { return messages.empty(); }

	void add(const xmlError& error);

private:
	std::vector<EngineMessage> messages;
	xmlXPathContext* context;
	xmlStructuredErrorFunc prevHandler;
	void* prevHandlerData;
};

// Parsing. Both return nullptr when the engine didn't produce a tree.
[[nodiscard]] int translateOptions(const ParseOptions& options);
[[nodiscard]] int translateOptions(const XmlParseOptions& options);
[[nodiscard]] DocPtr readHtml(std::string_view markup, int flags);
[[nodiscard]] DocPtr readXml(std::string_view markup, int flags);

// Tree access
[[nodiscard]] inline xmlNode* asNode(xmlDoc* doc) { return reinterpret_cast<xmlNode*>(doc); }
[[nodiscard]] NodeType getNodeType(const xmlNode* node);
[[nodiscard]] bool isNamespaced(const xmlNode* node);
[[nodiscard]] std::string_view getLocalName(const xmlNode* node);
// Empty for nodes without a namespace.
[[nodiscard]] std::string_view getNamespaceUri(const xmlNode* node);
[[nodiscard]] std::string getQualifiedName(const xmlNode* node);
[[nodiscard]] std::string getContent(const xmlNode* node);
[[nodiscard]] xmlNode* getRootElement(xmlDoc* doc);
[[nodiscard]] xmlNode* getFirstChild(const xmlNode* node);
[[nodiscard]] xmlNode* getLastChild(const xmlNode* node);
[[nodiscard]] inline xmlNode* getParent(const xmlNode* node) { return node->parent; }
[[nodiscard]] inline xmlNode* getNext(const xmlNode* node) { return node->next; }
[[nodiscard]] inline xmlNode* getPrev(const xmlNode* node) { return node->prev; }

// Attributes, only meaningful for element nodes.
[[nodiscard]] xmlAttr* findProperty(const xmlNode* element, std::string_view name);
[[nodiscard]] std::optional<std::string> getProperty(const xmlNode* element, std::string_view name);
[[nodiscard]] std::vector<std::pair<std::string, std::string>> getProperties(const xmlNode* element);

// Serialization of a single node (including its subtree).
[[nodiscard]] std::string dump(xmlDoc* doc, xmlNode* node, bool html);

// XPath
[[nodiscard]] XPathContextPtr createXPathContext(xmlDoc* doc);
[[nodiscard]] CompExprPtr compile(xmlXPathContext& context, const std::string& expression);
[[nodiscard]] XPathObjectPtr evaluate(xmlXPathContext& context, xmlXPathCompExpr& comp, xmlNode* contextNode);
// The nodes of a node-set result, in document order. Namespace nodes are
// left out, those are owned by the result object.
[[nodiscard]] std::vector<xmlNode*> getNodes(const xmlXPathObject& obj);
[[nodiscard]] std::string numberToString(double d);
[[nodiscard]] double stringToNumber(const std::string& str);

} // namespace xmlscraper::engine

#endif
