#ifndef SCRAPEREXCEPTION_HH
#define SCRAPEREXCEPTION_HH

#include "strCat.hh"

#include <concepts>
#include <string>
#include <string_view>

namespace xmlscraper {

/** Base of all errors reported by this library. Every subclass names its
  * error category, see getKindName().
  */
class ScraperException
{
public:
	explicit ScraperException() = default;

	explicit ScraperException(std::string message_)
		: message(std::move(message_)) {}

	template<typename T, typename... Args>
		requires(!std::same_as<ScraperException, std::remove_cvref_t<T>>) // don't block copy-constructor
	explicit ScraperException(T&& t, Args&&... args)
		: message(strCat(std::forward<T>(t), std::forward<Args>(args)...))
	{
	}

	ScraperException(const ScraperException&) = default;
	ScraperException(ScraperException&&) = default;
	ScraperException& operator=(const ScraperException&) = default;
	ScraperException& operator=(ScraperException&&) = default;
	virtual ~ScraperException() = default;

	[[nodiscard]] const std::string& getMessage() const &  { return message; }
	[[nodiscard]]       std::string  getMessage()       && { return std::move(message); }

	/** For APIs that expect a C string, valid as long as this object. */
	[[nodiscard]] const char* what() const noexcept { return message.c_str(); }

	/** Category of the error, e.g. "malformed" or "type-mismatch". */
	[[nodiscard]] virtual std::string_view getKindName() const;

	/** "<kind>: <message>" */
	[[nodiscard]] std::string toString() const;

private:
	std::string message;
};

} // namespace xmlscraper

#endif
