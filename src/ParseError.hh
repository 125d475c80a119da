#ifndef PARSEERROR_HH
#define PARSEERROR_HH

#include "ScraperException.hh"

#include <cstdint>
#include <string_view>

namespace xmlscraper {

/** Thrown when markup cannot be turned into a tree at all.
  * Recoverable markup defects never end up here, the tolerant parser
  * repairs those.
  */
class ParseError final : public ScraperException
{
public:
	enum class Kind : uint8_t {
		MALFORMED,       // not recoverable as markup
		ENCODING,        // declared or detected encoding can't be decoded
		INPUT_TOO_LARGE, // larger than the engine can address
	};

	template<typename... Args>
	explicit ParseError(Kind kind_, Args&&... args)
		: ScraperException(std::forward<Args>(args)...), kind(kind_) {}

	[[nodiscard]] Kind getKind() const { return kind; }
	[[nodiscard]] std::string_view getKindName() const override;

private:
	Kind kind;
};

[[nodiscard]] std::string_view toString(ParseError::Kind kind);

} // namespace xmlscraper

#endif
