#include "XPathEvaluator.hh"

#include "DocumentState.hh"
#include "StringOp.hh"
#include "XPathError.hh"

#include <algorithm>
#include <cassert>
#include <utility>
#include <vector>

namespace xmlscraper {

// These are detected while evaluating, but they're really mistakes in the
// expression itself.
static bool isExpressionProblem(int code)
{
	switch (code) {
		case XML_XPATH_UNKNOWN_FUNC_ERROR:
		case XML_XPATH_UNDEF_VARIABLE_ERROR:
		case XML_XPATH_VARIABLE_REF_ERROR:
		case XML_XPATH_INVALID_ARITY:
		case XML_XPATH_UNDEF_PREFIX_ERROR:
			return true;
		default:
			return false;
	}
}

static const engine::EngineMessage* firstError(const engine::ErrorCapture& capture)
{
	const auto& messages = capture.getMessages();
	auto it = std::ranges::find(messages, Diagnostics::LogLevel::LOGLEVEL_ERROR,
	                            &engine::EngineMessage::level);
	if (it != messages.end()) return &*it;
	return messages.empty() ? nullptr : &messages.front();
}

static std::string describe(const engine::EngineMessage* msg)
{
	if (!msg) return "unknown error";
	if (msg->domain == XML_FROM_XPATH) {
		return strCat(msg->message, " at offset ", msg->column);
	}
	return msg->message;
}

xmlXPathCompExpr& XPathEvaluator::getCompiled(
	const std::string& expression, const engine::ErrorCapture& capture)
{
	if (auto it = cache.find(expression); it != cache.end()) {
		return *it->second;
	}
	auto comp = engine::compile(*context, expression);
	if (!comp) {
		throw XPathError(XPathError::Kind::INVALID_EXPRESSION, expression,
		                 "Invalid XPath expression '", expression, "': ",
		                 describe(firstError(capture)));
	}
	if (cache.size() >= MAX_CACHED_EXPRESSIONS) {
		cache.clear();
	}
	auto [it, inserted] = cache.emplace(expression, std::move(comp));
	assert(inserted);
	return *it->second;
}

XPathResult XPathEvaluator::evaluate(const std::shared_ptr<DocumentState>& owner,
                                     std::string_view expression,
                                     engine::NodeHandle contextNode)
{
	assert(owner && owner->getDoc());
	assert(contextNode);
	std::string expr(expression);
	if (expression.contains('\0')) {
		throw XPathError(XPathError::Kind::INVALID_EXPRESSION, expr,
		                 "XPath expression contains a NUL character");
	}
	if (contextNode->doc != owner->getDoc()) {
		throw XPathError(XPathError::Kind::EVALUATION_FAILURE, expr,
		                 "Context node belongs to another document");
	}
	if (!context) {
		context = engine::createXPathContext(owner->getDoc());
	}

	engine::ErrorCapture capture(context.get());
	auto& comp = getCompiled(expr, capture);
	auto obj = engine::evaluate(*context, comp, contextNode);
	if (!obj) {
		const auto* msg = firstError(capture);
		auto kind = (msg && isExpressionProblem(msg->code))
		          ? XPathError::Kind::INVALID_EXPRESSION
		          : XPathError::Kind::EVALUATION_FAILURE;
		throw XPathError(kind, expr, "Evaluation of XPath expression '",
		                 expr, "' failed: ", describe(msg));
	}

	switch (obj->type) {
		case XPATH_NODESET: {
			std::vector<Node> nodes;
			std::weak_ptr<DocumentState> weak = owner;
			for (auto* node : engine::getNodes(*obj)) {
				nodes.push_back(Node(weak, node));
			}
			return {std::move(expr), std::move(nodes)};
		}
		case XPATH_BOOLEAN:
			return {std::move(expr), obj->boolval != 0};
		case XPATH_NUMBER:
			return {std::move(expr), obj->floatval};
		case XPATH_STRING:
			return {std::move(expr), std::string(StringOp::view(
				reinterpret_cast<const char*>(obj->stringval)))};
		default:
			throw XPathError(XPathError::Kind::TYPE_MISMATCH, expr,
			                 "XPath expression '", expr,
			                 "' has a result type outside XPath 1.0");
	}
}

} // namespace xmlscraper
