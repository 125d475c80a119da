#include "EngineSession.hh"

#include "Diagnostics.hh"

#include <libxml/parser.h>
#include <libxml/xmlversion.h>

#include <cassert>
#include <mutex>

namespace xmlscraper::engine {

static std::mutex sessionMutex;
static bool initialized = false;
static bool cleanupPending = false;
static unsigned useCount = 0;

// Both require 'sessionMutex' to be locked.
static void initLocked()
{
	if (initialized) return;
	xmlInitParser();
	initialized = true;
	getGlobalDiagnostics().printInfo("XML engine initialized (libxml2 ", LIBXML_DOTTED_VERSION, ')');
}

static void cleanupLocked()
{
	assert(useCount == 0);
	cleanupPending = false;
	if (!initialized) return;
	xmlCleanupParser();
	initialized = false;
	getGlobalDiagnostics().printInfo("XML engine released");
}

EngineSession::Use::Use()
{
	std::scoped_lock lock(sessionMutex);
	initLocked();
	cleanupPending = false;
	++useCount;
}

EngineSession::Use::~Use()
{
	std::scoped_lock lock(sessionMutex);
	assert(useCount > 0);
	--useCount;
	if ((useCount == 0) && cleanupPending) {
		cleanupLocked();
	}
}

void EngineSession::init()
{
	std::scoped_lock lock(sessionMutex);
	initLocked();
	cleanupPending = false;
}

void EngineSession::cleanup()
{
	std::scoped_lock lock(sessionMutex);
	if (useCount == 0) {
		cleanupLocked();
	} else {
		cleanupPending = true;
	}
}

bool EngineSession::isInitialized()
{
	std::scoped_lock lock(sessionMutex);
	return initialized;
}

unsigned EngineSession::getUseCount()
{
	std::scoped_lock lock(sessionMutex);
	return useCount;
}

bool EngineSession::isCleanupPending()
{
	std::scoped_lock lock(sessionMutex);
	return cleanupPending;
}

} // namespace xmlscraper::engine
