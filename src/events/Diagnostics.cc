#include "Diagnostics.hh"

#include <atomic>

namespace xmlscraper {

static NullDiagnostics nullDiagnostics;
static std::atomic<Diagnostics*> globalDiagnostics = nullptr;

Diagnostics& getGlobalDiagnostics()
{
	auto* result = globalDiagnostics.load();
	return result ? *result : nullDiagnostics;
}

Diagnostics* setGlobalDiagnostics(Diagnostics* diagnostics)
{
	return globalDiagnostics.exchange(diagnostics);
}

} // namespace xmlscraper
