#include "StringOp.hh"

namespace StringOp {

void trimRight(std::string& str, std::string_view chars)
{
	if (auto pos = str.find_last_not_of(chars); pos != std::string::npos) {
		str.erase(pos + 1);
	} else {
		str.clear();
	}
}
void trimRight(std::string_view& str, std::string_view chars)
{
	while (!str.empty() && chars.contains(str.back())) {
		str.remove_suffix(1);
	}
}

void trimLeft(std::string& str, std::string_view chars)
{
	str.erase(0, str.find_first_not_of(chars));
}
void trimLeft(std::string_view& str, std::string_view chars)
{
	while (!str.empty() && chars.contains(str.front())) {
		str.remove_prefix(1);
	}
}

void trim(std::string& str, std::string_view chars)
{
	trimRight(str, chars);
	trimLeft (str, chars);
}
void trim(std::string_view& str, std::string_view chars)
{
	trimRight(str, chars);
	trimLeft (str, chars);
}

std::string trimmedXmlSpace(std::string_view str)
{
	trim(str, XML_SPACE);
	return std::string(str);
}

} // namespace StringOp
