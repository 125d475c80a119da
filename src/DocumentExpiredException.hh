#ifndef DOCUMENTEXPIREDEXCEPTION_HH
#define DOCUMENTEXPIREDEXCEPTION_HH

#include "ScraperException.hh"

namespace xmlscraper {

/** Thrown when a Node is used after its Document was destroyed, or when a
  * moved-from Document is queried.
  */
class DocumentExpiredException final : public ScraperException
{
public:
	using ScraperException::ScraperException;

	[[nodiscard]] std::string_view getKindName() const override { return "document-expired"; }
};

} // namespace xmlscraper

#endif
