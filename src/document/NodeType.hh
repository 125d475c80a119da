#ifndef NODETYPE_HH
#define NODETYPE_HH

#include <cstdint>
#include <string_view>

namespace xmlscraper {

// The values match the DOM nodeType constants.
enum class NodeType : uint8_t {
	UNKNOWN = 0,
	ELEMENT = 1,
	ATTRIBUTE = 2,
	TEXT = 3,
	CDATA_SECTION = 4,
	ENTITY_REFERENCE = 5,
	ENTITY = 6,
	PROCESSING_INSTRUCTION = 7,
	COMMENT = 8,
	DOCUMENT = 9,
	DOCUMENT_TYPE = 10,
	DOCUMENT_FRAGMENT = 11,
	NOTATION = 12,
};

[[nodiscard]] constexpr bool isElement(NodeType type) { return type == NodeType::ELEMENT; }
[[nodiscard]] constexpr bool isAttribute(NodeType type) { return type == NodeType::ATTRIBUTE; }
[[nodiscard]] constexpr bool isComment(NodeType type) { return type == NodeType::COMMENT; }
// CDATA sections count as text.
[[nodiscard]] constexpr bool isText(NodeType type)
{
	return (type == NodeType::TEXT) || (type == NodeType::CDATA_SECTION);
}

[[nodiscard]] std::string_view toString(NodeType type);

} // namespace xmlscraper

#endif
