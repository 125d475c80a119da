#include "LibXMLEngine.hh"

#include "StringOp.hh"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/globals.h>
#include <libxml/xmlIO.h>
#include <libxml/xmlversion.h>

#include <cassert>
#include <new>

namespace xmlscraper::engine {

// The error callback got a const parameter in libxml2 2.12.
#if LIBXML_VERSION >= 21200
using ErrorArg = const xmlError*;
#else
using ErrorArg = xmlError*;
#endif

static void captureError(void* userData, ErrorArg error)
{
	if (!userData || !error) return;
	static_cast<ErrorCapture*>(userData)->add(*error);
}

static Diagnostics::LogLevel toLogLevel(xmlErrorLevel level)
{
	switch (level) {
		case XML_ERR_WARNING: return Diagnostics::LogLevel::WARNING;
		case XML_ERR_ERROR:
		case XML_ERR_FATAL:   return Diagnostics::LogLevel::LOGLEVEL_ERROR;
		case XML_ERR_NONE:    break;
	}
	return Diagnostics::LogLevel::INFO;
}

bool isEncodingProblem(const EngineMessage& msg)
{
	if (msg.domain == XML_FROM_I18N) return true;
	switch (msg.code) {
		case XML_ERR_UNKNOWN_ENCODING:
		case XML_ERR_UNSUPPORTED_ENCODING:
		case XML_ERR_INVALID_ENCODING:
		case XML_ERR_ENCODING_NAME:
			return true;
		default:
			return false;
	}
}


// class ErrorCapture

ErrorCapture::ErrorCapture(xmlXPathContext* xpathContext)
	: context(xpathContext)
	, prevHandler(xmlStructuredError)
	, prevHandlerData(xmlStructuredErrorContext)
{
	xmlSetStructuredErrorFunc(this, captureError);
	if (context) {
		context->error = captureError;
		context->userData = this;
	}
}

ErrorCapture::~ErrorCapture()
{
	if (context) {
		context->error = nullptr;
		context->userData = nullptr;
	}
	xmlSetStructuredErrorFunc(prevHandlerData, prevHandler);
}

void ErrorCapture::add(const xmlError& error)
{
	std::string text(StringOp::view(error.message));
	StringOp::trimRight(text, StringOp::XML_SPACE);
	// for XPath errors 'int1' is the offset in the expression
	int column = (error.domain == XML_FROM_XPATH) ? error.int1 : error.int2;
	messages.push_back({error.domain, error.code, toLogLevel(error.level),
	                    error.line, column, std::move(text)});
}


// Parsing

int translateOptions(const ParseOptions& options)
{
	int flags = HTML_PARSE_NONET;
	if (options.recover)   flags |= HTML_PARSE_RECOVER;
	if (options.noError)   flags |= HTML_PARSE_NOERROR;
	if (options.noWarning) flags |= HTML_PARSE_NOWARNING;
	if (options.noBlanks)  flags |= HTML_PARSE_NOBLANKS;
	return flags;
}

int translateOptions(const XmlParseOptions& options)
{
	int flags = 0;
	if (options.recover)            flags |= XML_PARSE_RECOVER;
	if (options.noError)            flags |= XML_PARSE_NOERROR;
	if (options.noWarning)          flags |= XML_PARSE_NOWARNING;
	if (options.noBlanks)           flags |= XML_PARSE_NOBLANKS;
	if (options.noNetwork)          flags |= XML_PARSE_NONET;
	if (options.substituteEntities) flags |= XML_PARSE_NOENT;
	return flags;
}

DocPtr readHtml(std::string_view markup, int flags)
{
	assert(markup.size() <= MAX_INPUT_SIZE);
	return DocPtr(htmlReadMemory(markup.data(), int(markup.size()),
	                             nullptr, nullptr, flags));
}

DocPtr readXml(std::string_view markup, int flags)
{
	assert(markup.size() <= MAX_INPUT_SIZE);
	return DocPtr(xmlReadMemory(markup.data(), int(markup.size()),
	                            nullptr, nullptr, flags));
}


// Tree access

NodeType getNodeType(const xmlNode* node)
{
	switch (node->type) {
		case XML_ELEMENT_NODE:       return NodeType::ELEMENT;
		case XML_ATTRIBUTE_NODE:     return NodeType::ATTRIBUTE;
		case XML_TEXT_NODE:          return NodeType::TEXT;
		case XML_CDATA_SECTION_NODE: return NodeType::CDATA_SECTION;
		case XML_ENTITY_REF_NODE:    return NodeType::ENTITY_REFERENCE;
		case XML_ENTITY_NODE:
		case XML_ENTITY_DECL:        return NodeType::ENTITY;
		case XML_PI_NODE:            return NodeType::PROCESSING_INSTRUCTION;
		case XML_COMMENT_NODE:       return NodeType::COMMENT;
		case XML_DOCUMENT_NODE:
		case XML_HTML_DOCUMENT_NODE: return NodeType::DOCUMENT;
		case XML_DOCUMENT_TYPE_NODE:
		case XML_DTD_NODE:           return NodeType::DOCUMENT_TYPE;
		case XML_DOCUMENT_FRAG_NODE: return NodeType::DOCUMENT_FRAGMENT;
		case XML_NOTATION_NODE:      return NodeType::NOTATION;
		default:                     return NodeType::UNKNOWN;
	}
}

bool isNamespaced(const xmlNode* node)
{
	// 'ns' is at the same offset in xmlNode and xmlAttr
	return ((node->type == XML_ELEMENT_NODE) || (node->type == XML_ATTRIBUTE_NODE))
	    && (node->ns != nullptr);
}

std::string_view getLocalName(const xmlNode* node)
{
	return StringOp::view(reinterpret_cast<const char*>(node->name));
}

std::string_view getNamespaceUri(const xmlNode* node)
{
	if (!isNamespaced(node)) return {};
	return StringOp::view(reinterpret_cast<const char*>(node->ns->href));
}

std::string getQualifiedName(const xmlNode* node)
{
	auto local = getLocalName(node);
	if (isNamespaced(node) && node->ns->prefix) {
		return strCat(reinterpret_cast<const char*>(node->ns->prefix), ':', local);
	}
	return std::string(local);
}

std::string getContent(const xmlNode* node)
{
	XmlString content(xmlNodeGetContent(node));
	return std::string(StringOp::view(reinterpret_cast<const char*>(content.get())));
}

xmlNode* getRootElement(xmlDoc* doc)
{
	return xmlDocGetRootElement(doc);
}

// Only these kinds have children in the XPath data model. Entity
// references and DTDs link to declarations, attributes to their value.
static bool hasChildList(const xmlNode* node)
{
	switch (node->type) {
		case XML_ELEMENT_NODE:
		case XML_DOCUMENT_NODE:
		case XML_HTML_DOCUMENT_NODE:
		case XML_DOCUMENT_FRAG_NODE:
			return true;
		default:
			return false;
	}
}

xmlNode* getFirstChild(const xmlNode* node)
{
	return hasChildList(node) ? node->children : nullptr;
}

xmlNode* getLastChild(const xmlNode* node)
{
	return hasChildList(node) ? node->last : nullptr;
}

xmlAttr* findProperty(const xmlNode* element, std::string_view name)
{
	assert(element->type == XML_ELEMENT_NODE);
	for (auto* attr = element->properties; attr; attr = attr->next) {
		if (getQualifiedName(reinterpret_cast<const xmlNode*>(attr)) == name) {
			return attr;
		}
	}
	return nullptr;
}

std::optional<std::string> getProperty(const xmlNode* element, std::string_view name)
{
	const auto* attr = findProperty(element, name);
	if (!attr) return std::nullopt;
	return getContent(reinterpret_cast<const xmlNode*>(attr));
}

std::vector<std::pair<std::string, std::string>> getProperties(const xmlNode* element)
{
	assert(element->type == XML_ELEMENT_NODE);
	std::vector<std::pair<std::string, std::string>> result;
	for (auto* attr = element->properties; attr; attr = attr->next) {
		const auto* node = reinterpret_cast<const xmlNode*>(attr);
		result.emplace_back(getQualifiedName(node), getContent(node));
	}
	return result;
}


// Serialization

struct CloseOutputBuffer {
	void operator()(xmlOutputBuffer* out) const { xmlOutputBufferClose(out); }
};
using OutputBufferPtr = std::unique_ptr<xmlOutputBuffer, CloseOutputBuffer>;

std::string dump(xmlDoc* doc, xmlNode* node, bool html)
{
	OutputBufferPtr out(xmlAllocOutputBuffer(nullptr));
	if (!out) throw std::bad_alloc();

	// no formatting: the output must re-parse to the same tree
	if (html) {
		htmlNodeDumpFormatOutput(out.get(), doc, node, nullptr, 0);
	} else {
		xmlNodeDumpOutput(out.get(), doc, node, 0, 0, nullptr);
	}
	xmlOutputBufferFlush(out.get());

	const auto* content = xmlOutputBufferGetContent(out.get());
	if (!content) return {};
	return std::string(reinterpret_cast<const char*>(content),
	                   xmlOutputBufferGetSize(out.get()));
}


// XPath

XPathContextPtr createXPathContext(xmlDoc* doc)
{
	XPathContextPtr context(xmlXPathNewContext(doc));
	if (!context) throw std::bad_alloc();
	return context;
}

CompExprPtr compile(xmlXPathContext& context, const std::string& expression)
{
	return CompExprPtr(xmlXPathCtxtCompile(
		&context, reinterpret_cast<const xmlChar*>(expression.c_str())));
}

XPathObjectPtr evaluate(xmlXPathContext& context, xmlXPathCompExpr& comp, xmlNode* contextNode)
{
	context.node = contextNode;
	context.contextSize = 1;
	context.proximityPosition = 1;
	return XPathObjectPtr(xmlXPathCompiledEval(&comp, &context));
}

std::vector<xmlNode*> getNodes(const xmlXPathObject& obj)
{
	std::vector<xmlNode*> result;
	const auto* set = obj.nodesetval;
	if (!set) return result;
	result.reserve(set->nodeNr);
	for (int i = 0; i < set->nodeNr; ++i) {
		auto* node = set->nodeTab[i];
		if (node->type == XML_NAMESPACE_DECL) continue;
		result.push_back(node);
	}
	return result;
}

std::string numberToString(double d)
{
	XmlString str(xmlXPathCastNumberToString(d));
	return std::string(StringOp::view(reinterpret_cast<const char*>(str.get())));
}

double stringToNumber(const std::string& str)
{
	return xmlXPathCastStringToNumber(reinterpret_cast<const xmlChar*>(str.c_str()));
}

} // namespace xmlscraper::engine
