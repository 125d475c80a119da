#ifndef XPATHRESULT_HH
#define XPATHRESULT_HH

#include "Node.hh"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmlscraper {

/** The value of an XPath 1.0 expression.
  *
  * Holds exactly one of the four XPath types. The get*() methods return
  * the held value and throw XPathError (TYPE_MISMATCH) when another type
  * is held. The to*() methods convert with the XPath 1.0 conversion rules
  * (the number(), boolean() and string() functions) and never throw
  * XPathError.
  */
class XPathResult
{
public:
	// Order matches the alternatives of 'Value'.
	enum class Type : uint8_t {
		NODE_SET,
		NUMBER,
		BOOLEAN,
		STRING,
	};
	using Value = std::variant<std::vector<Node>, double, bool, std::string>;

	XPathResult(std::string expression, Value value);

	[[nodiscard]] Type getType() const { return Type(value.index()); }
	[[nodiscard]] bool isNodeSet() const { return getType() == Type::NODE_SET; }
	[[nodiscard]] bool isNumber()  const { return getType() == Type::NUMBER; }
	[[nodiscard]] bool isBoolean() const { return getType() == Type::BOOLEAN; }
	[[nodiscard]] bool isString()  const { return getType() == Type::STRING; }

	[[nodiscard]] const std::vector<Node>& getNodeSet() const &;
	[[nodiscard]]       std::vector<Node>  getNodeSet() &&;
	[[nodiscard]] double getNumber() const;
	[[nodiscard]] bool getBoolean() const;
	[[nodiscard]] const std::string& getString() const;

	// A node-set converts via the string value of its first node.
	[[nodiscard]] double toNumber() const;
	[[nodiscard]] bool toBoolean() const;
	[[nodiscard]] std::string toString() const;

	[[nodiscard]] const Value& getValue() const { return value; }
	[[nodiscard]] const std::string& getExpression() const { return expression; }

private:
	void checkType(Type expected) const;

	std::string expression;
	Value value;
};

[[nodiscard]] std::string_view toString(XPathResult::Type type);

} // namespace xmlscraper

#endif
