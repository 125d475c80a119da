#ifndef STDIODIAGNOSTICS_HH
#define STDIODIAGNOSTICS_HH

#include "Diagnostics.hh"

namespace xmlscraper {

/** Prints info messages on stdout, warnings and errors on stderr.
  */
class StdioDiagnostics final : public Diagnostics
{
public:
	void log(LogLevel level, std::string_view message) noexcept override;
};

} // namespace xmlscraper

#endif
