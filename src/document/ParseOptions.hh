#ifndef PARSEOPTIONS_HH
#define PARSEOPTIONS_HH

namespace xmlscraper {

/** Options for the (tolerant) HTML parser.
  *
  * 'noError' and 'noWarning' only control whether the engine's diagnostic
  * messages are captured (Document::getDiagnostics()) and forwarded to the
  * global Diagnostics sink. They never change the shape of the tree.
  */
struct ParseOptions
{
	bool recover = true;    // continue past structural errors
	bool noError = false;   // drop error diagnostics
	bool noWarning = false; // drop warning diagnostics
	bool noBlanks = false;  // remove whitespace-only text nodes

	// No recovery, all diagnostics.
	[[nodiscard]] static constexpr ParseOptions strict() {
		return {.recover = false, .noError = false, .noWarning = false, .noBlanks = false};
	}
	// Maximal tolerance, silent. Suited for scraping real-world pages.
	[[nodiscard]] static constexpr ParseOptions scraper() {
		return {.recover = true, .noError = true, .noWarning = true, .noBlanks = false};
	}
	// Like scraper(), but without whitespace-only text nodes.
	[[nodiscard]] static constexpr ParseOptions compact() {
		return {.recover = true, .noError = true, .noWarning = true, .noBlanks = true};
	}

	[[nodiscard]] constexpr bool operator==(const ParseOptions&) const = default;
};

/** Options for the XML parser. The defaults are strict: any
  * well-formedness error makes the parse fail.
  */
struct XmlParseOptions
{
	bool recover = false;
	bool noError = false;
	bool noWarning = false;
	bool noBlanks = false;
	bool noNetwork = true;           // never fetch external resources
	bool substituteEntities = false; // keep entity references unexpanded

	[[nodiscard]] static constexpr XmlParseOptions strict() {
		return {};
	}
	[[nodiscard]] static constexpr XmlParseOptions tolerant() {
		XmlParseOptions result;
		result.recover = true;
		return result;
	}

	[[nodiscard]] constexpr bool operator==(const XmlParseOptions&) const = default;
};

} // namespace xmlscraper

#endif
