#ifndef PARSEDIAGNOSTIC_HH
#define PARSEDIAGNOSTIC_HH

#include "Diagnostics.hh"

#include <string>

namespace xmlscraper {

/** A message the engine reported while parsing a Document.
  * Line and column are 1-based, 0 when unknown.
  */
struct ParseDiagnostic
{
	Diagnostics::LogLevel level;
	int line;
	int column;
	std::string message;
};

} // namespace xmlscraper

#endif
