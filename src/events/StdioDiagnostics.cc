#include "StdioDiagnostics.hh"
#include <iostream>

namespace xmlscraper {

void StdioDiagnostics::log(LogLevel level, std::string_view message) noexcept
{
	auto& out = (level == LogLevel::INFO) ? std::cout : std::cerr;
	out << toString(level) << ": " << message << '\n' << std::flush;
}

} // namespace xmlscraper
