#include "Node.hh"

#include "DocumentExpiredException.hh"
#include "DocumentState.hh"
#include "LibXMLEngine.hh"
#include "XPathResult.hh"
#include "strCat.hh"

#include <algorithm>
#include <utility>

namespace xmlscraper {

Node::Node(std::weak_ptr<DocumentState> owner_, engine::NodeHandle handle_)
	: owner(std::move(owner_)), handle(handle_)
{
}

bool Node::valid() const
{
	return !owner.expired();
}

std::shared_ptr<DocumentState> Node::lock() const
{
	auto state = owner.lock();
	if (!state) {
		throw DocumentExpiredException(
			"Node used after its Document was destroyed");
	}
	state->checkThread();
	return state;
}

Node Node::make(engine::NodeHandle other) const
{
	return Node(owner, other);
}

std::optional<Node> Node::makeOptional(engine::NodeHandle other) const
{
	if (!other) return std::nullopt;
	return make(other);
}

bool Node::operator==(const Node& other) const
{
	return (handle == other.handle) &&
	       !owner.owner_before(other.owner) &&
	       !other.owner.owner_before(owner);
}

NodeType Node::getType() const
{
	auto state = lock();
	return engine::getNodeType(handle);
}

std::string Node::getTagName() const
{
	auto state = lock();
	if (engine::getNodeType(handle) != NodeType::ELEMENT) return {};
	return engine::getQualifiedName(handle);
}

std::string Node::getText() const
{
	auto state = lock();
	return engine::getContent(handle);
}


// Location path

// Appends "[n]" when more than one sibling matches the same node test.
template<typename Matches>
static void appendIndex(std::string& step, const xmlNode* node, Matches matches)
{
	size_t before = 0;
	for (auto* n = engine::getPrev(node); n; n = engine::getPrev(n)) {
		if (matches(n)) ++before;
	}
	size_t after = 0;
	for (auto* n = engine::getNext(node); n; n = engine::getNext(n)) {
		if (matches(n)) ++after;
	}
	if ((before + after) != 0) {
		strAppend(step, '[', before + 1, ']');
	}
}

// XPath 1.0 has no escapes inside string literals.
static std::string literal(std::string_view str)
{
	if (!str.contains('\'')) return strCat('\'', str, '\'');
	if (!str.contains('"')) return strCat('"', str, '"');
	std::string result = "concat(";
	while (true) {
		auto pos = str.find('\'');
		strAppend(result, '\'', str.substr(0, pos), '\'');
		if (pos == std::string_view::npos) break;
		strAppend(result, ", \"'\", ");
		str.remove_prefix(pos + 1);
	}
	result += ')';
	return result;
}

// Can be written as an unprefixed XPath name test. The HTML parser keeps
// names like "svg:rect" as they are.
static bool isPlainName(std::string_view name)
{
	if (name.empty()) return false;
	auto isNameStart = [](char c) {
		return ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')) ||
		       (c == '_') || (static_cast<unsigned char>(c) >= 0x80);
	};
	if (!isNameStart(name.front())) return false;
	return std::ranges::all_of(name, [&](char c) {
		return isNameStart(c) || ((c >= '0') && (c <= '9')) ||
		       (c == '-') || (c == '.');
	});
}

// Name test for an element or attribute. A plain name only matches nodes
// without a namespace, others need an expanded-name predicate.
static std::string nameTest(const xmlNode* node)
{
	auto local = engine::getLocalName(node);
	if (!engine::isNamespaced(node) && isPlainName(local)) {
		return std::string(local);
	}
	return strCat("*[local-name()=", literal(local),
	              " and namespace-uri()=", literal(engine::getNamespaceUri(node)), ']');
}

static bool sameExpandedName(const xmlNode* a, const xmlNode* b)
{
	return (engine::getLocalName(a) == engine::getLocalName(b)) &&
	       (engine::isNamespaced(a) == engine::isNamespaced(b)) &&
	       (engine::getNamespaceUri(a) == engine::getNamespaceUri(b));
}

// Steps of nodes outside the XPath data model (document type, entity
// reference, ...) select nothing, no other node should be found instead.
static constexpr std::string_view UNADDRESSABLE_STEP = "node()[false()]";

static std::string pathStep(const xmlNode* node)
{
	switch (engine::getNodeType(node)) {
		case NodeType::ELEMENT: {
			auto step = nameTest(node);
			appendIndex(step, node, [&](const xmlNode* n) {
				return (engine::getNodeType(n) == NodeType::ELEMENT) &&
				       sameExpandedName(n, node);
			});
			return step;
		}
		case NodeType::TEXT:
		case NodeType::CDATA_SECTION: {
			std::string step = "text()";
			appendIndex(step, node, [](const xmlNode* n) {
				return isText(engine::getNodeType(n));
			});
			return step;
		}
		case NodeType::COMMENT: {
			std::string step = "comment()";
			appendIndex(step, node, [](const xmlNode* n) {
				return engine::getNodeType(n) == NodeType::COMMENT;
			});
			return step;
		}
		case NodeType::PROCESSING_INSTRUCTION: {
			auto target = engine::getLocalName(node);
			auto step = strCat("processing-instruction(", literal(target), ')');
			appendIndex(step, node, [&](const xmlNode* n) {
				return (engine::getNodeType(n) == NodeType::PROCESSING_INSTRUCTION) &&
				       (engine::getLocalName(n) == target);
			});
			return step;
		}
		case NodeType::ATTRIBUTE:
			// unique, an element can't repeat an expanded attribute name
			return strCat('@', nameTest(node));
		default:
			return std::string(UNADDRESSABLE_STEP);
	}
}

std::string Node::getPath() const
{
	auto state = lock();
	std::vector<std::string> steps;
	for (const xmlNode* n = handle;
	     n && (engine::getNodeType(n) != NodeType::DOCUMENT);
	     n = engine::getParent(n)) {
		steps.push_back(pathStep(n));
	}
	if (steps.empty()) return "/";

	std::ranges::reverse(steps);
	std::string result;
	for (const auto& step : steps) {
		strAppend(result, '/', step);
	}
	return result;
}


// Navigation

std::vector<Node> Node::getChildren() const
{
	auto state = lock();
	std::vector<Node> result;
	for (auto* n = engine::getFirstChild(handle); n; n = engine::getNext(n)) {
		result.push_back(make(n));
	}
	return result;
}

std::vector<Node> Node::getElementChildren() const
{
	auto state = lock();
	std::vector<Node> result;
	for (auto* n = engine::getFirstChild(handle); n; n = engine::getNext(n)) {
		if (isElement(engine::getNodeType(n))) {
			result.push_back(make(n));
		}
	}
	return result;
}

std::vector<std::string> Node::getTextChildren() const
{
	auto state = lock();
	std::vector<std::string> result;
	for (auto* n = engine::getFirstChild(handle); n; n = engine::getNext(n)) {
		if (isText(engine::getNodeType(n))) {
			result.push_back(engine::getContent(n));
		}
	}
	return result;
}

std::optional<Node> Node::getFirstChild() const
{
	auto state = lock();
	return makeOptional(engine::getFirstChild(handle));
}

std::optional<Node> Node::getLastChild() const
{
	auto state = lock();
	return makeOptional(engine::getLastChild(handle));
}

bool Node::hasChildren() const
{
	auto state = lock();
	return engine::getFirstChild(handle) != nullptr;
}

size_t Node::getChildCount() const
{
	auto state = lock();
	size_t count = 0;
	for (auto* n = engine::getFirstChild(handle); n; n = engine::getNext(n)) {
		++count;
	}
	return count;
}

std::optional<Node> Node::getParent() const
{
	auto state = lock();
	return makeOptional(engine::getParent(handle));
}

bool Node::hasParent() const
{
	auto state = lock();
	return engine::getParent(handle) != nullptr;
}

// Attributes are linked to each other, but in XPath they have no siblings.
static bool hasSiblings(const xmlNode* node)
{
	return !isAttribute(engine::getNodeType(node));
}

std::optional<Node> Node::getNextSibling() const
{
	auto state = lock();
	if (!hasSiblings(handle)) return std::nullopt;
	return makeOptional(engine::getNext(handle));
}

std::optional<Node> Node::getPrevSibling() const
{
	auto state = lock();
	if (!hasSiblings(handle)) return std::nullopt;
	return makeOptional(engine::getPrev(handle));
}

std::vector<Node> Node::getSiblings() const
{
	auto state = lock();
	if (!hasSiblings(handle)) return {};
	auto* first = handle;
	while (auto* prev = engine::getPrev(first)) first = prev;

	std::vector<Node> result;
	for (auto* n = first; n; n = engine::getNext(n)) {
		if (n != handle) result.push_back(make(n));
	}
	return result;
}


// Attributes

std::optional<std::string> Node::getAttribute(std::string_view name) const
{
	auto state = lock();
	if (!isElement(engine::getNodeType(handle))) return std::nullopt;
	return engine::getProperty(handle, name);
}

bool Node::hasAttribute(std::string_view name) const
{
	auto state = lock();
	if (!isElement(engine::getNodeType(handle))) return false;
	return engine::findProperty(handle, name) != nullptr;
}

std::vector<std::pair<std::string, std::string>> Node::getAttributes() const
{
	auto state = lock();
	if (!isElement(engine::getNodeType(handle))) return {};
	return engine::getProperties(handle);
}


// Serialization

std::string Node::getInnerHtml() const
{
	auto state = lock();
	std::string result;
	for (auto* n = engine::getFirstChild(handle); n; n = engine::getNext(n)) {
		result += engine::dump(state->getDoc(), n, state->isHtml());
	}
	return result;
}

std::string Node::getOuterHtml() const
{
	auto state = lock();
	if (engine::getNodeType(handle) == NodeType::DOCUMENT) {
		return getInnerHtml();
	}
	return engine::dump(state->getDoc(), handle, state->isHtml());
}


// XPath

XPathResult Node::evaluate(std::string_view xpath) const
{
	auto state = lock();
	return state->evaluate(xpath, handle);
}

std::vector<Node> Node::select(std::string_view xpath) const
{
	return evaluate(xpath).getNodeSet();
}

std::string Node::toString() const
{
	auto type = getType();
	auto name = isElement(type) ? getTagName() : std::string(xmlscraper::toString(type));
	return strCat("Node(", name, " at ", getPath(), ')');
}

} // namespace xmlscraper
