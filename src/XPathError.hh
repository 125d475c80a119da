#ifndef XPATHERROR_HH
#define XPATHERROR_HH

#include "ScraperException.hh"

#include <cstdint>
#include <string>
#include <string_view>

namespace xmlscraper {

class XPathError final : public ScraperException
{
public:
	enum class Kind : uint8_t {
		INVALID_EXPRESSION, // expression doesn't compile
		TYPE_MISMATCH,      // result variant can't satisfy the request
		EVALUATION_FAILURE, // engine failure while evaluating
	};

	template<typename... Args>
	XPathError(Kind kind_, std::string_view expression_, Args&&... args)
		: ScraperException(std::forward<Args>(args)...)
		, expression(expression_), kind(kind_) {}

	[[nodiscard]] Kind getKind() const { return kind; }
	[[nodiscard]] const std::string& getExpression() const { return expression; }
	[[nodiscard]] std::string_view getKindName() const override;

private:
	std::string expression;
	Kind kind;
};

[[nodiscard]] std::string_view toString(XPathError::Kind kind);

} // namespace xmlscraper

#endif
