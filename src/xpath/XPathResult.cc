#include "XPathResult.hh"

#include "LibXMLEngine.hh"
#include "XPathError.hh"

#include <cmath>
#include <limits>
#include <utility>

namespace xmlscraper {

XPathResult::XPathResult(std::string expression_, Value value_)
	: expression(std::move(expression_)), value(std::move(value_))
{
}

void XPathResult::checkType(Type expected) const
{
	if (getType() != expected) {
		throw XPathError(XPathError::Kind::TYPE_MISMATCH, expression,
		                 "XPath expression '", expression, "' returned a ",
		                 xmlscraper::toString(getType()), " instead of a ",
		                 xmlscraper::toString(expected));
	}
}

const std::vector<Node>& XPathResult::getNodeSet() const &
{
	checkType(Type::NODE_SET);
	return std::get<std::vector<Node>>(value);
}

std::vector<Node> XPathResult::getNodeSet() &&
{
	checkType(Type::NODE_SET);
	return std::move(std::get<std::vector<Node>>(value));
}

double XPathResult::getNumber() const
{
	checkType(Type::NUMBER);
	return std::get<double>(value);
}

bool XPathResult::getBoolean() const
{
	checkType(Type::BOOLEAN);
	return std::get<bool>(value);
}

const std::string& XPathResult::getString() const
{
	checkType(Type::STRING);
	return std::get<std::string>(value);
}

double XPathResult::toNumber() const
{
	switch (getType()) {
		case Type::NODE_SET: {
			const auto& nodes = std::get<std::vector<Node>>(value);
			if (nodes.empty()) return std::numeric_limits<double>::quiet_NaN();
			return engine::stringToNumber(nodes.front().getText());
		}
		case Type::NUMBER:
			return std::get<double>(value);
		case Type::BOOLEAN:
			return std::get<bool>(value) ? 1.0 : 0.0;
		case Type::STRING:
			return engine::stringToNumber(std::get<std::string>(value));
	}
	return std::numeric_limits<double>::quiet_NaN();
}

bool XPathResult::toBoolean() const
{
	switch (getType()) {
		case Type::NODE_SET:
			return !std::get<std::vector<Node>>(value).empty();
		case Type::NUMBER: {
			double d = std::get<double>(value);
			return (d != 0.0) && !std::isnan(d);
		}
		case Type::BOOLEAN:
			return std::get<bool>(value);
		case Type::STRING:
			return !std::get<std::string>(value).empty();
	}
	return false;
}

std::string XPathResult::toString() const
{
	switch (getType()) {
		case Type::NODE_SET: {
			const auto& nodes = std::get<std::vector<Node>>(value);
			return nodes.empty() ? std::string() : nodes.front().getText();
		}
		case Type::NUMBER:
			return engine::numberToString(std::get<double>(value));
		case Type::BOOLEAN:
			return std::get<bool>(value) ? "true" : "false";
		case Type::STRING:
			return std::get<std::string>(value);
	}
	return {};
}

std::string_view toString(XPathResult::Type type)
{
	switch (type) {
		case XPathResult::Type::NODE_SET: return "node-set";
		case XPathResult::Type::NUMBER:   return "number";
		case XPathResult::Type::BOOLEAN:  return "boolean";
		case XPathResult::Type::STRING:   return "string";
	}
	return "unknown";
}

} // namespace xmlscraper
