#ifndef STRINGOP_HH
#define STRINGOP_HH

#include <string>
#include <string_view>

namespace StringOp
{
	// The four whitespace characters of the XML 'S' production.
	inline constexpr std::string_view XML_SPACE = " \t\r\n";

	[[nodiscard]] constexpr bool isXmlSpace(char c)
	{
		return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n');
	}

	void trimRight(std::string& str, std::string_view chars);
	void trimRight(std::string_view& str, std::string_view chars);
	void trimLeft (std::string& str, std::string_view chars);
	void trimLeft (std::string_view& str, std::string_view chars);
	void trim     (std::string& str, std::string_view chars);
	void trim     (std::string_view& str, std::string_view chars);

	/** Returns a copy of 'str' without leading and trailing XML whitespace.
	  */
	[[nodiscard]] std::string trimmedXmlSpace(std::string_view str);

	// View on a C-string, a 'nullptr' becomes the empty string.
	[[nodiscard]] inline std::string_view view(const char* s)
	{
		return s ? std::string_view(s) : std::string_view();
	}
}

#endif
