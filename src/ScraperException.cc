#include "ScraperException.hh"
#include "ParseError.hh"
#include "XPathError.hh"

namespace xmlscraper {

std::string_view ScraperException::getKindName() const
{
	return "error";
}

std::string ScraperException::toString() const
{
	return strCat(getKindName(), ": ", message);
}

std::string_view ParseError::getKindName() const
{
	return xmlscraper::toString(kind);
}

std::string_view XPathError::getKindName() const
{
	return xmlscraper::toString(kind);
}

std::string_view toString(ParseError::Kind kind)
{
	switch (kind) {
		case ParseError::Kind::MALFORMED:       return "malformed";
		case ParseError::Kind::ENCODING:        return "encoding";
		case ParseError::Kind::INPUT_TOO_LARGE: return "input-too-large";
	}
	return "unknown";
}

std::string_view toString(XPathError::Kind kind)
{
	switch (kind) {
		case XPathError::Kind::INVALID_EXPRESSION: return "invalid-expression";
		case XPathError::Kind::TYPE_MISMATCH:      return "type-mismatch";
		case XPathError::Kind::EVALUATION_FAILURE: return "evaluation-failure";
	}
	return "unknown";
}

} // namespace xmlscraper
