#ifndef NODE_HH
#define NODE_HH

#include "EngineHandles.hh"
#include "NodeType.hh"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xmlscraper {

class DocumentState;
class XPathResult;

/** A reference to one node in the tree of a Document.
  *
  * Node objects are cheap to copy, a copy refers to the same tree node.
  * A Node does not keep its Document alive: once the Document is destroyed
  * all its Nodes become invalid and every method except valid() (and the
  * comparison operator) throws DocumentExpiredException.
  *
  * Nodes can only be obtained from a Document (or from another Node).
  */
class Node
{
public:
	/** Is the owning Document still alive? Never throws. */
	[[nodiscard]] bool valid() const;

	[[nodiscard]] NodeType getType() const;

	/** Element name, including the namespace prefix (if any). Empty for
	  * all non-element nodes.
	  */
	[[nodiscard]] std::string getTagName() const;

	/** The XPath string value of this node. For elements and the document
	  * node that's all descendant text in document order.
	  */
	[[nodiscard]] std::string getText() const;

	/** An XPath location path that selects exactly this node, for example
	  * "/html/body/ul/li[2]".
	  */
	[[nodiscard]] std::string getPath() const;

	// Tree navigation. Absence is an empty result, never an error.
	[[nodiscard]] std::vector<Node> getChildren() const;
	[[nodiscard]] std::vector<Node> getElementChildren() const;
	[[nodiscard]] std::vector<std::string> getTextChildren() const;
	[[nodiscard]] std::optional<Node> getFirstChild() const;
	[[nodiscard]] std::optional<Node> getLastChild() const;
	[[nodiscard]] bool hasChildren() const;
	[[nodiscard]] size_t getChildCount() const;

	[[nodiscard]] std::optional<Node> getParent() const;
	[[nodiscard]] bool hasParent() const;
	[[nodiscard]] std::optional<Node> getNextSibling() const;
	[[nodiscard]] std::optional<Node> getPrevSibling() const;
	// All siblings except this node, in document order.
	[[nodiscard]] std::vector<Node> getSiblings() const;

	// Attributes, only elements have them.
	[[nodiscard]] std::optional<std::string> getAttribute(std::string_view name) const;
	[[nodiscard]] bool hasAttribute(std::string_view name) const;
	[[nodiscard]] std::vector<std::pair<std::string, std::string>> getAttributes() const;

	// Serialization with the serializer matching the Document flavour.
	[[nodiscard]] std::string getInnerHtml() const;
	[[nodiscard]] std::string getOuterHtml() const;

	// XPath with this node as context node.
	[[nodiscard]] std::vector<Node> select(std::string_view xpath) const;
	[[nodiscard]] XPathResult evaluate(std::string_view xpath) const;

	/** Something like "Node(li at /html/body/ul/li[2])". */
	[[nodiscard]] std::string toString() const;

	/** Same tree node of the same Document. */
	[[nodiscard]] bool operator==(const Node& other) const;

private:
	Node(std::weak_ptr<DocumentState> owner, engine::NodeHandle handle);

	[[nodiscard]] std::shared_ptr<DocumentState> lock() const;
	[[nodiscard]] Node make(engine::NodeHandle other) const;
	[[nodiscard]] std::optional<Node> makeOptional(engine::NodeHandle other) const;

	std::weak_ptr<DocumentState> owner;
	engine::NodeHandle handle;

	friend class Document;
	friend class XPathEvaluator;
};

} // namespace xmlscraper

#endif
