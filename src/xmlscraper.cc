#include "xmlscraper.hh"

#include "EngineSession.hh"

namespace xmlscraper {

void init()
{
	engine::EngineSession::init();
}

void cleanup()
{
	engine::EngineSession::cleanup();
}

} // namespace xmlscraper
