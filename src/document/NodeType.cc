#include "NodeType.hh"

namespace xmlscraper {

std::string_view toString(NodeType type)
{
	switch (type) {
		case NodeType::ELEMENT:                return "element";
		case NodeType::ATTRIBUTE:              return "attribute";
		case NodeType::TEXT:                   return "text";
		case NodeType::CDATA_SECTION:          return "cdata";
		case NodeType::ENTITY_REFERENCE:       return "entity-reference";
		case NodeType::ENTITY:                 return "entity";
		case NodeType::PROCESSING_INSTRUCTION: return "processing-instruction";
		case NodeType::COMMENT:                return "comment";
		case NodeType::DOCUMENT:               return "document";
		case NodeType::DOCUMENT_TYPE:          return "document-type";
		case NodeType::DOCUMENT_FRAGMENT:      return "document-fragment";
		case NodeType::NOTATION:               return "notation";
		case NodeType::UNKNOWN:                break;
	}
	return "unknown";
}

} // namespace xmlscraper
